#include "services/WiFiService.hpp"

#include "common/Logger.hpp"

#include <Arduino.h>
#include <WiFi.h>


namespace slotwatch
{
WiFiService::WiFiService(const WiFiConfig &config, const std::string &timezone)
    : ServiceBase("WiFiService")
    , m_config(config)
    , m_timezone(timezone)
{
}

Status WiFiService::begin()
{
    setState(ServiceState::Initializing);
    LOG_INFO(m_name, "Initializing WiFiService...");

    if (!m_config.isConfigured())
    {
        LOG_ERROR(m_name, "wifi.ssid is not set in the configuration");
        setState(ServiceState::Error);
        return Status::InvalidArg("wifi.ssid is required");
    }

    WiFi.persistent(false);
    WiFi.mode(WIFI_OFF);
    delay(100); // radio reset before switching to station mode

    connectToStation();

    setState(ServiceState::Ready);
    LOG_INFO(m_name, "Ready (waiting for WiFi connection)");
    return Status::Ok();
}

void WiFiService::loop()
{
    if (m_state != ServiceState::Ready && m_state != ServiceState::Running)
    {
        return;
    }

    switch (m_wifiState)
    {
        case WiFiState::Connecting: {
            handleConnecting();
            break;
        }
        case WiFiState::Connected: {
            handleConnected();
            break;
        }
        case WiFiState::Disconnected: {
            handleDisconnected();
            break;
        }
        default: {
            break;
        }
    }
}

void WiFiService::end()
{
    setState(ServiceState::Stopping);
    LOG_INFO(m_name, "Shutting down...");

    if (WiFi.status() == WL_CONNECTED)
    {
        WiFi.disconnect();
    }
    WiFi.mode(WIFI_OFF);
    m_wifiState = WiFiState::Disconnected;

    setState(ServiceState::Stopped);
}

void WiFiService::connectToStation()
{
    WiFi.mode(WIFI_STA);
    WiFi.begin(m_config.stationSsid.c_str(), m_config.stationPassword.c_str());

    m_wifiState = WiFiState::Connecting;
    m_connectStartMs = millis();
    ++m_connectAttempts;

    if (m_inSlowRetryMode)
    {
        LOG_INFO(m_name, "Slow retry attempt #%u to %s...", m_connectAttempts, m_config.stationSsid.c_str());
    }
    else
    {
        LOG_INFO(m_name, "Connecting to %s (attempt %u/%u)...", m_config.stationSsid.c_str(), m_connectAttempts,
                 m_config.stationMaxFastConnectionAttempts);
    }
}

void WiFiService::handleConnecting()
{
    if (WiFi.status() == WL_CONNECTED)
    {
        onConnected();
        return;
    }

    if (millis() - m_connectStartMs < m_config.stationConnectionTimeoutMs)
    {
        return;
    }

    if (!m_inSlowRetryMode && m_connectAttempts >= m_config.stationMaxFastConnectionAttempts)
    {
        m_inSlowRetryMode = true;
        LOG_WARN(m_name, "Max fast retries (%u) reached, switching to slow retry mode", m_config.stationMaxFastConnectionAttempts);
    }

    WiFi.disconnect();
    m_wifiState = WiFiState::Disconnected;
    m_lastReconnectAttemptMs = millis();

    if (m_inSlowRetryMode)
    {
        LOG_DEBUG(m_name, "Will retry in %u s", m_config.stationSlowReconnectIntervalMs / 1000);
    }
    else
    {
        LOG_WARN(m_name, "Connect timeout (attempt %u/%u), will retry in %u s", m_connectAttempts,
                 m_config.stationMaxFastConnectionAttempts, m_config.stationFastReconnectIntervalMs / 1000);
    }
}

void WiFiService::handleConnected()
{
    if (WiFi.status() != WL_CONNECTED)
    {
        onDisconnected();
        return;
    }

    m_metrics.rssi = static_cast<std::int8_t>(WiFi.RSSI());
    if (m_state != ServiceState::Running)
    {
        setState(ServiceState::Running);
    }
}

void WiFiService::handleDisconnected()
{
    const auto currentMs{millis()};
    const auto retryInterval{m_inSlowRetryMode ? m_config.stationSlowReconnectIntervalMs : m_config.stationFastReconnectIntervalMs};

    if (currentMs - m_lastReconnectAttemptMs >= retryInterval)
    {
        m_lastReconnectAttemptMs = currentMs;
        connectToStation();
    }
}

void WiFiService::onConnected()
{
    m_wifiState = WiFiState::Connected;
    m_metrics.connected = true;
    m_metrics.rssi = static_cast<std::int8_t>(WiFi.RSSI());
    ++m_metrics.operationCount;

    m_connectAttempts = 0;
    m_inSlowRetryMode = false;

    if (!m_timeSyncStarted)
    {
        configTzTime(m_timezone.c_str(), kNtpServer1, kNtpServer2, kNtpServer3);
        m_timeSyncStarted = true;
        LOG_INFO(m_name, "NTP sync requested (TZ %s)", m_timezone.c_str());
    }

    setState(ServiceState::Running);
    LOG_INFO(m_name, "WiFi connected, IP: %s, RSSI: %d", WiFi.localIP().toString().c_str(), m_metrics.rssi);
}

void WiFiService::onDisconnected()
{
    m_wifiState = WiFiState::Disconnected;
    m_metrics.connected = false;
    ++m_metrics.disconnectCount;
    m_lastReconnectAttemptMs = millis();

    setState(ServiceState::Ready);
    LOG_WARN(m_name, "WiFi disconnected (will reconnect)");
}
} // namespace slotwatch
