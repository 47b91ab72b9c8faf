#ifndef SLOTWATCH_SERVICES_POLLSERVICE_HPP
#define SLOTWATCH_SERVICES_POLLSERVICE_HPP

/**
 * @file PollService.hpp
 * @brief Repeating availability scan over the selected locations.
 *
 * Responsibilities:
 * - Check one location per loop() call, in list order
 * - Wait the configured interval after a full round before starting the next
 * - Hand a matched slot to the booking state machine
 * - Stop on a terminal booking outcome and keep it for the driver
 *
 * The scan is paused by the state machine while a hold or booking is in
 * flight; after a rejected attempt it continues with the next location of the
 * same round.
 */

#include "booking/AvailabilityFilter.hpp"
#include "booking/IPollControl.hpp"
#include "common/Config.hpp"
#include "core/IService.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

namespace slotwatch
{
class BookingStateMachine;
class SchedulerApi;

class PollService : public ServiceBase, public IPollControl
{
public:
    using Clock = std::function<std::uint32_t()>;

    static constexpr auto kSeparatorWidth{120};

    PollService(SchedulerApi &api, const LocationConfig &config, std::uint32_t intervalMs, Clock clock = {});
    ~PollService() override = default;

    PollService(const PollService &) = delete;
    PollService &operator=(const PollService &) = delete;
    PollService(PollService &&) = delete;
    PollService &operator=(PollService &&) = delete;

    // IService implementation
    Status begin() override;
    void loop() override;
    void end() override;

    // IPollControl implementation
    void pause() override;
    void resume() override;

    [[nodiscard]] bool isPaused() const override
    {
        return m_paused;
    }

    void attachBooking(BookingStateMachine &booking)
    {
        m_booking = &booking;
    }

    void setLocations(std::vector<Location> locations);

    [[nodiscard]] const std::vector<Location> &getLocations() const
    {
        return m_locations;
    }

    /// Outcome that stopped the scan, if any
    [[nodiscard]] std::optional<BookingOutcome> getTerminalOutcome() const
    {
        return m_terminalOutcome;
    }

    [[nodiscard]] const PollMetrics &getMetrics() const
    {
        return m_metrics;
    }

private:
    [[nodiscard]] bool startRound();
    void checkLocation(const Location &location);
    void finishRound();
    void stop(BookingOutcome outcome);

    /// startDate from config, else today's local date once the clock is set
    [[nodiscard]] std::optional<CivilDate> referenceDate() const;

    SchedulerApi &m_api;
    BookingStateMachine *m_booking{nullptr};
    const LocationConfig &m_config;
    std::uint32_t m_intervalMs{0};
    Clock m_clock;

    std::vector<Location> m_locations{};
    FilterWindow m_window{};
    std::size_t m_nextIndex{0};
    bool m_roundActive{false};
    bool m_waiting{false}; ///< Between rounds
    std::uint32_t m_roundFinishedAt{0};
    bool m_paused{false};
    std::optional<BookingOutcome> m_terminalOutcome{};

    PollMetrics m_metrics{};
};
} // namespace slotwatch

#endif // SLOTWATCH_SERVICES_POLLSERVICE_HPP
