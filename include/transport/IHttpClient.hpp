#ifndef SLOTWATCH_TRANSPORT_IHTTPCLIENT_HPP
#define SLOTWATCH_TRANSPORT_IHTTPCLIENT_HPP

#include "core/Result.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace slotwatch
{
enum class HttpMethod : std::uint8_t
{
    Get = 0,
    Post,
};

inline const char *toString(const HttpMethod method)
{
    switch (method)
    {
        case HttpMethod::Get: return "GET";
        case HttpMethod::Post: return "POST";
        default: return "?";
    }
}

struct HttpRequest
{
    HttpMethod method{HttpMethod::Post};
    std::string path{}; ///< Relative to the client's base URL
    std::string body{};
    std::vector<std::pair<std::string, std::string>> headers{};
    std::uint32_t headersTimeoutMs{0}; ///< 0 = client default
};

struct HttpResponse
{
    int statusCode{0};
    std::string body{};
};

/**
 * @brief One HTTP exchange, no retries
 *
 * A response with any status code is a success at this level; only a
 * transport failure (connect, TLS, timeout) is reported as NetworkError.
 */
class IHttpClient
{
public:
    virtual ~IHttpClient() = default;

    [[nodiscard]] virtual Result<HttpResponse> send(const HttpRequest &request) = 0;
};
} // namespace slotwatch

#endif // SLOTWATCH_TRANSPORT_IHTTPCLIENT_HPP
