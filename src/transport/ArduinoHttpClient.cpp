#include "transport/ArduinoHttpClient.hpp"

#include "common/Logger.hpp"

#include <utility>

namespace slotwatch
{
namespace
{
constexpr auto *TAG{"HttpClient"};
} // namespace

ArduinoHttpClient::ArduinoHttpClient(std::string baseUrl)
    : m_baseUrl(std::move(baseUrl))
{
    // TODO: pin the publicapi.txdpsscheduler.com root CA instead of skipping verification
    m_tls.setInsecure();
}

Result<HttpResponse> ArduinoHttpClient::send(const HttpRequest &request)
{
    HTTPClient http{};
    http.setReuse(true);

    const auto url{m_baseUrl + request.path};
    if (!http.begin(m_tls, url.c_str()))
    {
        LOG_ERROR(TAG, "Cannot open %s", url.c_str());
        return Result<HttpResponse>::Error(Status{StatusCode::NetworkError, "Connection setup failed"});
    }

    if (request.headersTimeoutMs > 0)
    {
        http.setTimeout(static_cast<std::uint16_t>(request.headersTimeoutMs));
        http.setConnectTimeout(static_cast<std::int32_t>(request.headersTimeoutMs));
    }
    for (const auto &[name, value]: request.headers)
    {
        http.addHeader(name.c_str(), value.c_str());
    }

    int httpCode{0};
    switch (request.method)
    {
        case HttpMethod::Get: httpCode = http.GET(); break;
        case HttpMethod::Post:
            httpCode = http.POST(reinterpret_cast<std::uint8_t *>(const_cast<char *>(request.body.data())), request.body.size());
            break;
    }

    if (httpCode < 0)
    {
        LOG_DEBUG(TAG, "%s %s: %s", toString(request.method), request.path.c_str(), HTTPClient::errorToString(httpCode).c_str());
        http.end();
        return Result<HttpResponse>::Error(Status{StatusCode::NetworkError, "No response"});
    }

    HttpResponse response{.statusCode = httpCode, .body = http.getString().c_str()};
    http.end();

    LOG_DEBUG(TAG, "%s %s -> %d (%u bytes)", toString(request.method), request.path.c_str(), response.statusCode,
              static_cast<unsigned>(response.body.size()));
    return Result<HttpResponse>::Ok(std::move(response));
}
} // namespace slotwatch
