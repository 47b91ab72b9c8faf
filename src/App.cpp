#include "App.hpp"

#include <TaskScheduler.h>

#include "common/Logger.hpp"
#include "platform/PlatformTime.hpp"

namespace slotwatch
{
namespace
{
constexpr auto *TAG{"App"};

TransportConfig makeTransportConfig(const AppSettingsConfig &settings)
{
    TransportConfig config{};
    config.headersTimeoutMs = settings.headersTimeoutMs;
    config.maxRetry = settings.maxRetry;
    return config;
}
} // namespace

App::Engine::Engine(IHttpClient &client, IFileStore &store, ILocationPrompt &prompt, const Config &config)
    : transport(client, makeTransportConfig(config.appSettings))
    , api(transport, config.personalInfo)
    , guard(api, api.typeId(), config.appSettings.cancelIfExist)
    , poll(api, config.location, config.appSettings.intervalMs)
    , booking(api, guard, poll)
    , locations(api, store, config.location, &prompt)
{
    poll.attachBooking(booking);
}

App::App()
    : m_configService(m_fileStore)
    , m_wifiService(m_configService.get().wifi, m_configService.get().appSettings.timezone)
{
}

Status App::begin()
{
    m_appState = AppState::Initializing;
    LOG_INFO(TAG, "%s is starting...", kAppName);

    auto status{m_fileStore.begin()};
    if (status.failed())
    {
        fail("Filesystem mount failed");
        return status;
    }

    status = m_configService.begin();
    if (status.failed())
    {
        fail("ConfigService init failed");
        return status;
    }

    status = m_wifiService.begin();
    if (status.failed())
    {
        fail("WiFiService init failed");
        return status;
    }

    const auto &settings{m_configService.get().appSettings};
    if (settings.webServer)
    {
        m_livenessService = std::make_unique<LivenessService>(settings.webServerPort);
        if (status = m_livenessService->begin(); status.failed())
        {
            LOG_WARN(TAG, "LivenessService init failed - continuing without keep-alive endpoint");
        }
    }

    setupScheduler();

    m_appState = AppState::WaitingForNetwork;
    LOG_INFO(TAG, "Waiting for WiFi...");
    return Status::Ok();
}

void App::loop()
{
    if (m_appState == AppState::Uninitialized || m_appState == AppState::Initializing)
    {
        return;
    }

    m_scheduler.execute();
    yield();
}

void App::setupScheduler()
{
    m_wifiTask.set(WIFI_INTERVAL_MS, TASK_FOREVER, [this]() {
        m_wifiService.loop();
    });
    m_scheduler.addTask(m_wifiTask);
    m_wifiTask.enable();

    // Waits for network and clock, then runs the startup sequence once
    m_startupTask.set(STARTUP_INTERVAL_MS, TASK_FOREVER, [this]() {
        if (!m_wifiService.isConnected())
        {
            return;
        }
        if (!platform::getLocalTime())
        {
            if (!m_clockWaitLogged)
            {
                LOG_INFO(TAG, "Waiting for time sync...");
                m_clockWaitLogged = true;
            }
            return;
        }
        m_startupTask.disable();
        startEngine();
    });
    m_scheduler.addTask(m_startupTask);
    m_startupTask.enable();

    m_pollTask.set(POLL_INTERVAL_MS, TASK_FOREVER, [this]() {
        if (!m_wifiService.isConnected())
        {
            return;
        }
        m_engine->poll.loop();
        checkTerminal();
    });
    m_scheduler.addTask(m_pollTask);

    m_statusTask.set(STATUS_INTERVAL_MS, TASK_FOREVER, [this]() {
        logStatus();
    });
    m_scheduler.addTask(m_statusTask);
    m_statusTask.enable();

    LOG_DEBUG(TAG, "Scheduler configured with %d tasks", 4);
}

void App::startEngine()
{
    LOG_INFO(TAG, "Requesting list of locations...");
    m_engine = std::make_unique<Engine>(m_httpClient, m_fileStore, m_locationPrompt, m_configService.get());

    if (const auto status = m_engine->guard.refresh(); status.failed())
    {
        fail("Existing booking check failed");
        return;
    }
    m_engine->guard.logStartupWarning();

    if (const auto status = m_engine->locations.begin(); status.failed())
    {
        if (status.code == StatusCode::NotFound)
        {
            m_appState = AppState::Finished;
            LOG_INFO(TAG, "Nothing to watch, stopping");
            return;
        }
        fail("Location selection failed");
        return;
    }

    m_engine->poll.setLocations(m_engine->locations.getSelected());
    if (const auto status = m_engine->poll.begin(); status.failed())
    {
        fail("PollService init failed");
        return;
    }

    m_pollTask.enable();
    m_appState = AppState::Running;
    LOG_INFO(TAG, "=== Application Started ===");
}

void App::checkTerminal()
{
    const auto outcome{m_engine->poll.getTerminalOutcome()};
    if (!outcome)
    {
        return;
    }

    m_pollTask.disable();
    switch (*outcome)
    {
        case BookingOutcome::Booked:
            m_appState = AppState::Finished;
            LOG_INFO(TAG, "Booked, polling stopped. Confirmation: %s",
                     SchedulerApi::confirmationUrl(m_engine->booking.getConfirmationNumber()).c_str());
            break;
        case BookingOutcome::PolicyAbort:
            m_appState = AppState::Finished;
            LOG_INFO(TAG, "Stopped: an existing booking must be cancelled first");
            break;
        default:
            fail("Scheduler API unreachable, restart the device to retry");
            break;
    }
}

void App::logStatus() const
{
    if (!m_engine)
    {
        LOG_DEBUG(TAG, "Status: %s, WiFi %s", m_appState == AppState::Error ? "error" : "starting",
                  toString(m_wifiService.getWiFiState()));
        return;
    }

    const auto &poll{m_engine->poll.getMetrics()};
    const auto &transport{m_engine->transport.getMetrics()};
    const auto &booking{m_engine->booking.getMetrics()};
    LOG_INFO(TAG, "Status: %u rounds, %u checks, %u requests (%u retries), %u hold / %u book failures, booking %s",
             poll.roundsCompleted, poll.locationsChecked, transport.requests, transport.retries, booking.holdFailures,
             booking.bookFailures, toString(m_engine->booking.getState()));

    if (m_engine->booking.getState() == BookingState::Booked)
    {
        LOG_INFO(TAG, "Confirmation Number: %s (%s)", m_engine->booking.getConfirmationNumber().c_str(),
                 SchedulerApi::confirmationUrl(m_engine->booking.getConfirmationNumber()).c_str());
    }
}

void App::fail(const char *reason)
{
    LOG_ERROR(TAG, "%s", reason);
    m_appState = AppState::Error;
}
} // namespace slotwatch
