#ifndef SLOTWATCH_SERVICES_WIFISERVICE_HPP
#define SLOTWATCH_SERVICES_WIFISERVICE_HPP

/**
 * @file WiFiService.hpp
 * @brief Station-mode WiFi connection and wall-clock sync.
 *
 * Reconnects quickly a few times, then falls back to a slow retry interval.
 * SNTP is started with the configured POSIX timezone on the first connection.
 */

#include "common/Config.hpp"
#include "core/IService.hpp"

#include <string>

namespace slotwatch
{
class WiFiService : public ServiceBase
{
public:
    static constexpr auto *kNtpServer1{"pool.ntp.org"};
    static constexpr auto *kNtpServer2{"time.google.com"};
    static constexpr auto *kNtpServer3{"time.nist.gov"};

    WiFiService(const WiFiConfig &config, const std::string &timezone);
    ~WiFiService() override = default;

    WiFiService(const WiFiService &) = delete;
    WiFiService &operator=(const WiFiService &) = delete;
    WiFiService(WiFiService &&) = delete;
    WiFiService &operator=(WiFiService &&) = delete;

    // IService implementation
    Status begin() override;
    void loop() override;
    void end() override;

    [[nodiscard]] WiFiState getWiFiState() const
    {
        return m_wifiState;
    }
    [[nodiscard]] WiFiMetrics getWiFiMetrics() const
    {
        return m_metrics;
    }
    [[nodiscard]] bool isConnected() const
    {
        return m_wifiState == WiFiState::Connected;
    }

private:
    void connectToStation();

    void handleConnecting();
    void handleConnected();
    void handleDisconnected();

    void onConnected();
    void onDisconnected();

    const WiFiConfig &m_config;
    const std::string &m_timezone; ///< POSIX TZ, owned by the config

    WiFiState m_wifiState{WiFiState::Disconnected};
    std::uint32_t m_connectStartMs{0};
    std::uint32_t m_lastReconnectAttemptMs{0};
    std::uint32_t m_connectAttempts{0};
    bool m_inSlowRetryMode{false};
    bool m_timeSyncStarted{false};

    WiFiMetrics m_metrics{};
};
} // namespace slotwatch

#endif // SLOTWATCH_SERVICES_WIFISERVICE_HPP
