#ifndef SLOTWATCH_TRANSPORT_ARDUINOHTTPCLIENT_HPP
#define SLOTWATCH_TRANSPORT_ARDUINOHTTPCLIENT_HPP

/**
 * @file ArduinoHttpClient.hpp
 * @brief IHttpClient over the ESP32 HTTPClient and a TLS WiFi client
 */

#include "transport/IHttpClient.hpp"

#include <HTTPClient.h>
#include <WiFiClientSecure.h>

#include <string>

namespace slotwatch
{
class ArduinoHttpClient : public IHttpClient
{
public:
    static constexpr auto kDefaultBaseUrl{"https://publicapi.txdpsscheduler.com"};

    explicit ArduinoHttpClient(std::string baseUrl = kDefaultBaseUrl);
    ~ArduinoHttpClient() override = default;

    ArduinoHttpClient(const ArduinoHttpClient &) = delete;
    ArduinoHttpClient &operator=(const ArduinoHttpClient &) = delete;

    [[nodiscard]] Result<HttpResponse> send(const HttpRequest &request) override;

private:
    std::string m_baseUrl{};
    WiFiClientSecure m_tls{};
};
} // namespace slotwatch

#endif // SLOTWATCH_TRANSPORT_ARDUINOHTTPCLIENT_HPP
