#include "services/PollService.hpp"

#include "api/SchedulerApi.hpp"
#include "booking/BookingStateMachine.hpp"
#include "common/Logger.hpp"
#include "platform/PlatformTime.hpp"

#include <string>
#include <utility>

namespace slotwatch
{
PollService::PollService(SchedulerApi &api, const LocationConfig &config, const std::uint32_t intervalMs, Clock clock)
    : ServiceBase("PollService")
    , m_api(api)
    , m_config(config)
    , m_intervalMs(intervalMs)
    , m_clock(clock ? std::move(clock) : Clock{platform::uptimeMs})
{
}

Status PollService::begin()
{
    setState(ServiceState::Initializing);

    if (m_booking == nullptr)
    {
        LOG_ERROR(m_name, "No booking state machine attached");
        setState(ServiceState::Error);
        return Status::NotReady("Booking state machine not attached");
    }
    if (m_locations.empty())
    {
        LOG_ERROR(m_name, "No locations to check");
        setState(ServiceState::Error);
        return Status::NotReady("No locations selected");
    }

    m_nextIndex = 0;
    m_roundActive = false;
    m_waiting = false;
    m_paused = false;
    m_terminalOutcome.reset();

    LOG_INFO(m_name, "Checking locations for available appointments...");
    setState(ServiceState::Running);
    return Status::Ok();
}

void PollService::loop()
{
    if (m_state != ServiceState::Running || m_paused)
    {
        return;
    }

    const auto now{m_clock()};
    if (m_waiting)
    {
        if (now - m_roundFinishedAt < m_intervalMs)
        {
            return;
        }
        m_waiting = false;
    }

    if (!m_roundActive && !startRound())
    {
        return;
    }

    const auto location{m_locations[m_nextIndex++]};
    checkLocation(location);

    if (m_terminalOutcome)
    {
        return;
    }
    if (m_nextIndex >= m_locations.size())
    {
        finishRound();
    }
}

void PollService::end()
{
    setState(ServiceState::Stopping);
    m_roundActive = false;
    setState(ServiceState::Stopped);
}

void PollService::pause()
{
    if (!m_paused)
    {
        LOG_DEBUG(m_name, "Paused at location %u of %u", static_cast<unsigned>(m_nextIndex),
                  static_cast<unsigned>(m_locations.size()));
    }
    m_paused = true;
}

void PollService::resume()
{
    if (m_paused)
    {
        LOG_DEBUG(m_name, "Resumed");
    }
    m_paused = false;
}

void PollService::setLocations(std::vector<Location> locations)
{
    m_locations = std::move(locations);
    m_nextIndex = 0;
    m_roundActive = false;
}

bool PollService::startRound()
{
    const auto reference{referenceDate()};
    if (!reference)
    {
        LOG_WARN(m_name, "Local time not synchronised yet, skipping round");
        ++m_metrics.roundsSkipped;
        m_roundFinishedAt = m_clock();
        m_waiting = true;
        return false;
    }

    m_window = FilterWindow::fromConfig(m_config, *reference);
    m_nextIndex = 0;
    m_roundActive = true;
    log::logRaw(std::string(kSeparatorWidth, '-').c_str());
    return true;
}

void PollService::checkLocation(const Location &location)
{
    ++m_metrics.locationsChecked;
    ++m_metrics.operationCount;
    m_metrics.lastOperationMs = m_clock();

    const auto dates{m_api.fetchLocationDates(location.id, m_config.sameDay)};
    if (dates.failed())
    {
        if (dates.status.isFatal())
        {
            stop(BookingOutcome::Fatal);
            return;
        }
        ++m_metrics.errorCount;
        incrementErrors();
        LOG_WARN(m_name, "%s: availability reply unusable (%s)", location.name.c_str(), toString(dates.status.code));
        return;
    }

    const auto candidate{selectCandidate(filterAvailability(dates.value, m_window))};
    if (!candidate)
    {
        if (m_config.sameDay)
        {
            LOG_INFO(m_name, "%s is not available today.", location.name.c_str());
        }
        else
        {
            LOG_INFO(m_name, "%s is not available in the next %d days.", location.name.c_str(), m_config.daysAround.end);
        }
        return;
    }

    ++m_metrics.candidatesFound;
    LOG_INFO(m_name, "%s is available on %s! Booking appointment...", location.name.c_str(),
             candidate->slot.formattedStartDateTime.c_str());

    const auto outcome{m_booking->attempt(location, candidate->slot)};
    LOG_DEBUG(m_name, "Booking attempt at %s: %s", location.name.c_str(), toString(outcome));
    if (isTerminal(outcome))
    {
        stop(outcome);
    }
}

void PollService::finishRound()
{
    ++m_metrics.roundsCompleted;
    m_roundActive = false;
    m_nextIndex = 0;
    m_roundFinishedAt = m_clock();
    m_waiting = true;
}

void PollService::stop(const BookingOutcome outcome)
{
    m_terminalOutcome = outcome;
    m_roundActive = false;
    LOG_INFO(m_name, "Polling stopped: %s", toString(outcome));
    setState(outcome == BookingOutcome::Fatal ? ServiceState::Error : ServiceState::Stopped);
}

std::optional<CivilDate> PollService::referenceDate() const
{
    if (!m_config.daysAround.startDate.empty())
    {
        return parseIsoDate(m_config.daysAround.startDate);
    }

    const auto local{platform::getLocalTime()};
    if (!local)
    {
        return std::nullopt;
    }
    return fromTm(*local);
}
} // namespace slotwatch
