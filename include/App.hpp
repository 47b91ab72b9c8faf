#ifndef SLOTWATCH_APP_HPP
#define SLOTWATCH_APP_HPP

#include "common/Types.hpp"

#include "api/SchedulerApi.hpp"
#include "booking/BookingStateMachine.hpp"
#include "booking/ExistingBookingGuard.hpp"
#include "services/ConfigService.hpp"
#include "services/LivenessService.hpp"
#include "services/LocationService.hpp"
#include "services/PollService.hpp"
#include "services/SerialLocationPrompt.hpp"
#include "services/WiFiService.hpp"
#include "storage/LittleFsFileStore.hpp"
#include "transport/ArduinoHttpClient.hpp"
#include "transport/Transport.hpp"

#include <TaskSchedulerDeclarations.h>

#include <memory>

namespace slotwatch
{
/**
 * @brief Top-level driver: boot, startup sequence, scheduling and terminal handling
 */
class App
{
public:
    static constexpr auto *kAppName{"SlotWatch appointment bot"};

    App();
    ~App() = default;

    App(const App &) = delete;
    App &operator=(const App &) = delete;

    // Lifecycle
    [[nodiscard]] Status begin();
    void loop();

    enum class AppState
    {
        Uninitialized,
        Initializing,
        WaitingForNetwork, ///< WiFi or wall clock not ready yet
        Running, ///< Polling
        Finished, ///< Booked, or nothing left to do
        Error
    };

    [[nodiscard]] AppState getState() const
    {
        return m_appState;
    }

private:
    /// Components that need the loaded configuration
    struct Engine
    {
        Engine(IHttpClient &client, IFileStore &store, ILocationPrompt &prompt, const Config &config);

        Transport transport;
        SchedulerApi api;
        ExistingBookingGuard guard;
        PollService poll;
        BookingStateMachine booking;
        LocationService locations;
    };

    void setupScheduler();

    /// Runs once the network and clock are up
    void startEngine();
    void checkTerminal();
    void logStatus() const;
    void fail(const char *reason);

    static constexpr uint32_t WIFI_INTERVAL_MS = 1000;
    static constexpr uint32_t STARTUP_INTERVAL_MS = 500;
    static constexpr uint32_t POLL_INTERVAL_MS = 50; // one location check per run
    static constexpr uint32_t STATUS_INTERVAL_MS = 60'000;

    Scheduler m_scheduler;

    LittleFsFileStore m_fileStore;
    ConfigService m_configService;
    WiFiService m_wifiService;
    ArduinoHttpClient m_httpClient;
    SerialLocationPrompt m_locationPrompt;

    std::unique_ptr<LivenessService> m_livenessService;
    std::unique_ptr<Engine> m_engine;

    Task m_wifiTask;
    Task m_startupTask;
    Task m_pollTask;
    Task m_statusTask;

    // State
    AppState m_appState{AppState::Uninitialized};
    bool m_clockWaitLogged{false};
};
} // namespace slotwatch

#endif // SLOTWATCH_APP_HPP
