#ifndef SLOTWATCH_CORE_ISERVICE_HPP
#define SLOTWATCH_CORE_ISERVICE_HPP

#include "common/Types.hpp"

namespace slotwatch
{
/**
 * @brief Service lifecycle states
 */
enum class ServiceState : uint8_t
{
    Uninitialized = 0, ///< Service created but begin() not called
    Initializing, ///< begin() executing, setting up
    Ready, ///< Initialized successfully, waiting for dependencies (e.g., WiFi, locations)
    Running, ///< Fully operational
    Stopping, ///< end() executing, cleaning up
    Stopped, ///< Cleanly shut down
    Error, ///< Cannot operate (config error, fatal API failure)

    _Count, // NOLINT
};

inline const char *toString(const ServiceState serviceState)
{
    switch (serviceState)
    {
        case ServiceState::Uninitialized: return "uninitialized";
        case ServiceState::Initializing: return "initializing";
        case ServiceState::Ready: return "ready";
        case ServiceState::Running: return "running";
        case ServiceState::Stopping: return "stopping";
        case ServiceState::Stopped: return "stopped";
        case ServiceState::Error: return "error";
        default: return "unknown";
    }
}

/**
 * @brief Base interface for all services
 */
class IService
{
public:
    virtual ~IService() = default;

    /**
     * @brief Get the service name
     */
    [[nodiscard]] virtual const char *getName() const = 0;

    /**
     * @brief Initialize the service
     * @return Status indicating success or failure
     */
    [[nodiscard]] virtual Status begin() = 0;

    /**
     * @brief Process service tasks (called from scheduler)
     *
     * @note This method should be non-blocking because it is called from the main loop
     */
    virtual void loop() = 0;

    /**
     * @brief Stop the service
     */
    virtual void end() = 0;

    /**
     * @brief Get current service state
     */
    [[nodiscard]] virtual ServiceState getState() const = 0;

    /**
     * @brief Check if service is running
     */
    [[nodiscard]] virtual bool isRunning() const
    {
        return getState() == ServiceState::Running;
    }
};

/**
 * @brief Base class holding name, lifecycle state and error count
 *
 * @note Inherit from this class to create a service with basic functionality
 */
class ServiceBase : public IService
{
public:
    [[nodiscard]] const char *getName() const override
    {
        return m_name;
    }

    [[nodiscard]] ServiceState getState() const override
    {
        return m_state;
    }

    [[nodiscard]] std::uint32_t getErrorCount() const
    {
        return m_errorCount;
    }

protected:
    explicit ServiceBase(const char *name)
        : m_name(name)
    {
    }

    void setState(const ServiceState serviceState)
    {
        m_state = serviceState;
    }

    void incrementErrors()
    {
        ++m_errorCount;
    }

    const char *m_name{nullptr};
    ServiceState m_state{ServiceState::Uninitialized};
    std::uint32_t m_errorCount{0};
};
} // namespace slotwatch

#endif // SLOTWATCH_CORE_ISERVICE_HPP
