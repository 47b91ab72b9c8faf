#ifndef SLOTWATCH_SERVICES_LIVENESSSERVICE_HPP
#define SLOTWATCH_SERVICES_LIVENESSSERVICE_HPP

/**
 * @file LivenessService.hpp
 * @brief Keep-alive HTTP endpoint for external uptime pingers.
 *
 * Answers every request with 200 "Bot is alive!". Runs on the async TCP task
 * and reads no engine state.
 */

#include "core/IService.hpp"

#include <ESPAsyncWebServer.h>

#include <cstdint>

namespace slotwatch
{
class LivenessService : public ServiceBase
{
public:
    static constexpr auto *kAliveMessage{"Bot is alive!"};

    explicit LivenessService(std::uint16_t port);
    ~LivenessService() override = default;

    LivenessService(const LivenessService &) = delete;
    LivenessService &operator=(const LivenessService &) = delete;
    LivenessService(LivenessService &&) = delete;
    LivenessService &operator=(LivenessService &&) = delete;

    // IService implementation
    Status begin() override;
    void loop() override;
    void end() override;

private:
    std::uint16_t m_port{0};
    AsyncWebServer m_webServer;
};
} // namespace slotwatch

#endif // SLOTWATCH_SERVICES_LIVENESSSERVICE_HPP
