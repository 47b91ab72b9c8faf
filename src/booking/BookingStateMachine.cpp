#include "booking/BookingStateMachine.hpp"

#include "api/SchedulerApi.hpp"
#include "booking/ExistingBookingGuard.hpp"
#include "booking/IPollControl.hpp"
#include "common/Logger.hpp"

namespace slotwatch
{
namespace
{
constexpr auto *TAG{"Booking"};
} // namespace

BookingStateMachine::BookingStateMachine(SchedulerApi &api, ExistingBookingGuard &guard, IPollControl &poll)
    : m_api(api)
    , m_guard(guard)
    , m_poll(poll)
{
}

BookingOutcome BookingStateMachine::attempt(const Location &location, const TimeSlot &slot)
{
    if (isInFlight() || m_state == BookingState::Booked)
    {
        ++m_metrics.skipped;
        LOG_DEBUG(TAG, "Attempt at %s skipped (%s)", location.name.c_str(), toString(m_state));
        return BookingOutcome::Skipped;
    }

    if (m_guard.blocksNewBooking())
    {
        LOG_WARN(TAG, "Cancel existing appointment is disabled. Please cancel your existing appointment manually.");
        return BookingOutcome::PolicyAbort;
    }

    m_state = BookingState::Holding;
    ++m_metrics.attempts;
    if (!m_poll.isPaused())
    {
        m_poll.pause();
    }

    const auto hold{m_api.holdSlot(slot.slotId)};
    if (hold.failed())
    {
        if (hold.status.isFatal())
        {
            m_state = BookingState::Failed;
            return BookingOutcome::Fatal;
        }
        ++m_metrics.holdFailures;
        LOG_ERROR(TAG, "Failed to hold appointment slot.");
        return reject(BookingOutcome::HoldRejected);
    }
    if (!hold.value.held)
    {
        ++m_metrics.holdFailures;
        LOG_ERROR(TAG, "Failed to hold appointment slot.");
        LOG_ERROR(TAG, "Error Message: %s", hold.value.errorMessage.c_str());
        return reject(BookingOutcome::HoldRejected);
    }

    LOG_INFO(TAG, "Appointment slot held successfully.");
    m_state = BookingState::Booking;
    return book(location, slot);
}

BookingOutcome BookingStateMachine::book(const Location &location, const TimeSlot &slot)
{
    LOG_INFO(TAG, "Booking appointment...");

    if (m_guard.exists())
    {
        LOG_WARN(TAG, "The cancel reply is not verified; booking proceeds regardless.");
        if (const auto status = m_guard.cancelFirst(); status.isFatal())
        {
            m_state = BookingState::Failed;
            return BookingOutcome::Fatal;
        }
        ++m_metrics.cancellations;
    }

    const auto responseId{m_api.fetchResponseId()};
    if (responseId.failed())
    {
        if (responseId.status.isFatal())
        {
            m_state = BookingState::Failed;
            return BookingOutcome::Fatal;
        }
        ++m_metrics.bookFailures;
        LOG_ERROR(TAG, "Failed to book appointment.");
        return reject(BookingOutcome::BookRejected);
    }

    const auto result{m_api.book(slot, location.id, responseId.value)};
    if (result.failed())
    {
        if (result.status.isFatal())
        {
            m_state = BookingState::Failed;
            return BookingOutcome::Fatal;
        }
        ++m_metrics.bookFailures;
        LOG_ERROR(TAG, "Failed to book appointment.");
        return reject(BookingOutcome::BookRejected);
    }
    if (!result.value.booked)
    {
        ++m_metrics.bookFailures;
        LOG_ERROR(TAG, "Failed to book appointment.");
        log::logRaw(result.value.rawBody.c_str(), LogLevel::Error);
        return reject(BookingOutcome::BookRejected);
    }

    m_state = BookingState::Booked;
    m_confirmationNumber = result.value.confirmationNumber;
    LOG_INFO(TAG, "Appointment booked successfully. Confirmation Number: %s.", m_confirmationNumber.c_str());
    LOG_INFO(TAG, "Please visit the following URL to print your confirmation: %s.",
             SchedulerApi::confirmationUrl(m_confirmationNumber).c_str());
    return BookingOutcome::Booked;
}

BookingOutcome BookingStateMachine::reject(const BookingOutcome outcome)
{
    m_state = BookingState::Failed;
    if (m_poll.isPaused())
    {
        m_poll.resume();
    }
    return outcome;
}
} // namespace slotwatch
