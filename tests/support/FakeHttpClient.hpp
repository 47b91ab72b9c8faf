#ifndef SLOTWATCH_TESTS_FAKEHTTPCLIENT_HPP
#define SLOTWATCH_TESTS_FAKEHTTPCLIENT_HPP

#include "transport/IHttpClient.hpp"

#include <algorithm>
#include <deque>
#include <functional>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace slotwatch::test
{
/**
 * @brief Scripted IHttpClient keyed by request path
 *
 * Queued replies are consumed first, then the path's handler runs; unknown
 * paths answer 404. Every request is recorded.
 */
class FakeHttpClient : public IHttpClient
{
public:
    using Handler = std::function<Result<HttpResponse>(const HttpRequest &)>;

    Result<HttpResponse> send(const HttpRequest &request) override
    {
        m_requests.push_back(request);

        if (auto queued = m_queued.find(request.path); queued != m_queued.end() && !queued->second.empty())
        {
            auto reply{queued->second.front()};
            queued->second.pop_front();
            return reply;
        }
        if (const auto handler = m_handlers.find(request.path); handler != m_handlers.end())
        {
            return handler->second(request);
        }
        return Result<HttpResponse>::Ok(HttpResponse{.statusCode = 404, .body = "Not Found"});
    }

    /// Answer every request to @p path with the same reply
    void reply(const std::string &path, const int statusCode, std::string body)
    {
        m_handlers[path] = [statusCode, body = std::move(body)](const HttpRequest &) {
            return Result<HttpResponse>::Ok(HttpResponse{.statusCode = statusCode, .body = body});
        };
    }

    void on(const std::string &path, Handler handler)
    {
        m_handlers[path] = std::move(handler);
    }

    /// One-shot reply, consumed before the handler
    void enqueue(const std::string &path, const int statusCode, std::string body)
    {
        m_queued[path].push_back(Result<HttpResponse>::Ok(HttpResponse{.statusCode = statusCode, .body = std::move(body)}));
    }

    /// One-shot network failure
    void enqueueFailure(const std::string &path)
    {
        m_queued[path].push_back(Result<HttpResponse>::Error(Status{StatusCode::NetworkError, "connection refused"}));
    }

    [[nodiscard]] const std::vector<HttpRequest> &requests() const
    {
        return m_requests;
    }

    [[nodiscard]] std::size_t count(const std::string &path) const
    {
        return static_cast<std::size_t>(std::count_if(m_requests.begin(), m_requests.end(),
                                                      [&path](const HttpRequest &r) { return r.path == path; }));
    }

    [[nodiscard]] const HttpRequest *last(const std::string &path) const
    {
        for (auto it = m_requests.rbegin(); it != m_requests.rend(); ++it)
        {
            if (it->path == path)
            {
                return &*it;
            }
        }
        return nullptr;
    }

    [[nodiscard]] std::vector<std::string> paths() const
    {
        std::vector<std::string> result{};
        for (const auto &r: m_requests)
        {
            result.push_back(r.path);
        }
        return result;
    }

private:
    std::vector<HttpRequest> m_requests{};
    std::map<std::string, Handler> m_handlers{};
    std::map<std::string, std::deque<Result<HttpResponse>>> m_queued{};
};
} // namespace slotwatch::test

#endif // SLOTWATCH_TESTS_FAKEHTTPCLIENT_HPP
