#ifndef SLOTWATCH_SERVICES_CONFIGSERVICE_HPP
#define SLOTWATCH_SERVICES_CONFIGSERVICE_HPP

/**
 * @file ConfigService.hpp
 * @brief Loads and validates the operator configuration.
 *
 * Responsibilities:
 * - Read `/config.json` from the file store at boot
 * - Parse it with ArduinoJson over the built-in defaults
 * - Validate ranges and formats before any request is made
 */

#include "common/Config.hpp"
#include "core/IService.hpp"
#include "core/Result.hpp"

#include <string>

namespace slotwatch
{
class IFileStore;

class ConfigService : public ServiceBase
{
public:
    static constexpr auto *CONFIG_PATH{"/config.json"};

    explicit ConfigService(IFileStore &store);
    ~ConfigService() override = default;

    ConfigService(const ConfigService &) = delete;
    ConfigService &operator=(const ConfigService &) = delete;
    ConfigService(ConfigService &&) = delete;
    ConfigService &operator=(ConfigService &&) = delete;

    // IService implementation
    Status begin() override;
    void loop() override;
    void end() override;

    /**
     * @brief Get the current configuration (read-only).
     */
    [[nodiscard]] const Config &get() const
    {
        return m_config;
    }

    [[nodiscard]] bool isConfigured() const
    {
        return m_config.isConfigured();
    }

    /**
     * @brief Parse a configuration document over the defaults and validate it
     * @param json Configuration document
     * @return Parsed configuration, ParseError, or InvalidArg naming the bad field
     */
    [[nodiscard]] static Result<Config> parse(const std::string &json);

private:
    IFileStore &m_store;
    Config m_config{};
};
} // namespace slotwatch

#endif // SLOTWATCH_SERVICES_CONFIGSERVICE_HPP
