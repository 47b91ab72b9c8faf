#include "transport/Transport.hpp"

#include "common/Logger.hpp"

#include <utility>

namespace slotwatch
{
namespace
{
constexpr auto *TAG{"Transport"};
constexpr auto kHttpOk{200};
} // namespace

Transport::Transport(IHttpClient &client, TransportConfig config)
    : m_client(client)
    , m_config(std::move(config))
{
}

Result<HttpResponse> Transport::request(const char *path, const HttpMethod method, const std::string &body)
{
    const HttpRequest req{
            .method = method,
            .path = path,
            .body = body,
            .headers =
                    {
                            {"Content-Type", TransportConfig::kContentType},
                            {"Origin", m_config.origin},
                            {"Referer", m_config.referer},
                    },
            .headersTimeoutMs = m_config.headersTimeoutMs,
    };

    ++m_metrics.requests;
    for (std::uint32_t attempt{0};; ++attempt)
    {
        ++m_metrics.attempts;
        if (attempt > 0)
        {
            ++m_metrics.retries;
        }

        auto result{m_client.send(req)};
        const auto statusCode{result.ok() ? result.value.statusCode : 0};
        if (result.ok() && statusCode == kHttpOk)
        {
            return result;
        }

        if (attempt >= m_config.maxRetry)
        {
            if (result.ok())
            {
                LOG_ERROR(TAG, "Received status code %d. Retry failed.", statusCode);
            }
            else
            {
                LOG_ERROR(TAG, "%s %s failed: %s. Retry failed.", toString(method), path, toString(result.status.code));
            }
            ++m_metrics.fatalFailures;
            return Result<HttpResponse>::Error(Status::Fatal("Retry ceiling reached"));
        }

        if (result.ok())
        {
            LOG_WARN(TAG, "Received status code %d. Retrying...", statusCode);
            log::logRaw(result.value.body.c_str(), LogLevel::Error);
        }
        else
        {
            LOG_WARN(TAG, "%s %s failed: %s. Retrying...", toString(method), path, toString(result.status.code));
            LOG_ERROR(TAG, "%s", result.status.message ? result.status.message : "no response");
        }
    }
}
} // namespace slotwatch
