#ifndef SLOTWATCH_TRANSPORT_TRANSPORT_HPP
#define SLOTWATCH_TRANSPORT_TRANSPORT_HPP

/**
 * @file Transport.hpp
 * @brief Scheduler API request layer with a fixed retry ceiling.
 *
 * Every request carries the browser Origin/Referer the API expects and the
 * configured header timeout. A non-200 status or a network failure is
 * retried immediately until maxRetry retries have been spent; the next
 * failure is reported as StatusCode::Fatal.
 */

#include "common/Types.hpp"
#include "core/Result.hpp"
#include "transport/IHttpClient.hpp"

#include <cstdint>
#include <string>

namespace slotwatch
{
struct TransportConfig
{
    static constexpr auto kDefaultOrigin{"https://public.txdpsscheduler.com"};
    static constexpr auto kDefaultReferer{"https://public.txdpsscheduler.com/"};
    static constexpr auto kContentType{"application/json;charset=UTF-8"};

    std::string origin{kDefaultOrigin};
    std::string referer{kDefaultReferer};
    std::uint32_t headersTimeoutMs{20'000};
    std::uint8_t maxRetry{3};
};

class Transport
{
public:
    Transport(IHttpClient &client, TransportConfig config);

    Transport(const Transport &) = delete;
    Transport &operator=(const Transport &) = delete;

    /**
     * @brief Issue a request, retrying until it answers 200
     * @return 200 response, or Fatal once maxRetry + 1 attempts have failed
     */
    [[nodiscard]] Result<HttpResponse> request(const char *path, HttpMethod method, const std::string &body);

    [[nodiscard]] const TransportMetrics &getMetrics() const
    {
        return m_metrics;
    }

private:
    IHttpClient &m_client;
    TransportConfig m_config{};
    TransportMetrics m_metrics{};
};
} // namespace slotwatch

#endif // SLOTWATCH_TRANSPORT_TRANSPORT_HPP
