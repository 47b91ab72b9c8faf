#ifndef SLOTWATCH_BOOKING_BOOKINGSTATEMACHINE_HPP
#define SLOTWATCH_BOOKING_BOOKINGSTATEMACHINE_HPP

/**
 * @file BookingStateMachine.hpp
 * @brief Hold-then-book sequence for a matched slot.
 *
 * Owns the single engine-wide booking state. An attempt is refused while
 * another one is holding or booking, and after an appointment has been
 * booked, so at most one hold and one booking are ever in flight. The poll
 * scheduler is paused before the hold request and resumed only when an
 * attempt is rejected.
 *
 * State transitions:
 * @code
 *   Idle/Failed --attempt--> Holding --held--> Booking --booked--> Booked
 *                               |                 |
 *                               +---rejected------+----> Failed (polling resumed)
 * @endcode
 */

#include "common/Types.hpp"

#include <string>

namespace slotwatch
{
class ExistingBookingGuard;
class IPollControl;
class SchedulerApi;

class BookingStateMachine
{
public:
    BookingStateMachine(SchedulerApi &api, ExistingBookingGuard &guard, IPollControl &poll);

    BookingStateMachine(const BookingStateMachine &) = delete;
    BookingStateMachine &operator=(const BookingStateMachine &) = delete;
    BookingStateMachine(BookingStateMachine &&) = delete;
    BookingStateMachine &operator=(BookingStateMachine &&) = delete;

    /**
     * @brief Try to hold and book a slot at a location
     *
     * @return Skipped if an attempt is in flight or already succeeded,
     *         PolicyAbort if an existing booking may not be replaced,
     *         HoldRejected / BookRejected after the API refused (polling resumed),
     *         Booked on success, Fatal if a request exhausted its retries
     */
    [[nodiscard]] BookingOutcome attempt(const Location &location, const TimeSlot &slot);

    [[nodiscard]] BookingState getState() const
    {
        return m_state;
    }

    [[nodiscard]] bool isInFlight() const
    {
        return m_state == BookingState::Holding || m_state == BookingState::Booking;
    }

    /// Set once the state is Booked
    [[nodiscard]] const std::string &getConfirmationNumber() const
    {
        return m_confirmationNumber;
    }

    [[nodiscard]] const BookingMetrics &getMetrics() const
    {
        return m_metrics;
    }

private:
    BookingOutcome book(const Location &location, const TimeSlot &slot);

    /// Rejected attempt: clear the in-flight state and let polling continue
    BookingOutcome reject(BookingOutcome outcome);

    SchedulerApi &m_api;
    ExistingBookingGuard &m_guard;
    IPollControl &m_poll;

    BookingState m_state{BookingState::Idle};
    std::string m_confirmationNumber{};
    BookingMetrics m_metrics{};
};
} // namespace slotwatch

#endif // SLOTWATCH_BOOKING_BOOKINGSTATEMACHINE_HPP
