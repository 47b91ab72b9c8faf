#include "services/LivenessService.hpp"

#include "common/Logger.hpp"

namespace slotwatch
{
LivenessService::LivenessService(const std::uint16_t port)
    : ServiceBase("LivenessService")
    , m_port(port)
    , m_webServer(port)
{
}

Status LivenessService::begin()
{
    setState(ServiceState::Initializing);

    m_webServer.onNotFound([](AsyncWebServerRequest *request) {
        request->send(200, "text/plain", kAliveMessage);
    });
    m_webServer.begin();

    setState(ServiceState::Running);
    LOG_INFO(m_name, "Web server started on port %u", m_port);
    return Status::Ok();
}

void LivenessService::loop()
{
    // Requests are served on the async TCP task
}

void LivenessService::end()
{
    setState(ServiceState::Stopping);
    m_webServer.end();
    setState(ServiceState::Stopped);
}
} // namespace slotwatch
