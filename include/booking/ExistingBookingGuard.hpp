#ifndef SLOTWATCH_BOOKING_EXISTINGBOOKINGGUARD_HPP
#define SLOTWATCH_BOOKING_EXISTINGBOOKINGGUARD_HPP

/**
 * @file ExistingBookingGuard.hpp
 * @brief Tracks whether the operator already holds an appointment.
 *
 * The snapshot is taken once at startup and consulted again only when a new
 * hold succeeds. With cancelIfExist set, the held booking is cancelled just
 * before the new one is placed.
 */

#include "common/Types.hpp"

#include <vector>

namespace slotwatch
{
class SchedulerApi;

class ExistingBookingGuard
{
public:
    ExistingBookingGuard(SchedulerApi &api, int typeId, bool cancelIfExist);

    ExistingBookingGuard(const ExistingBookingGuard &) = delete;
    ExistingBookingGuard &operator=(const ExistingBookingGuard &) = delete;

    /**
     * @brief Query bookings on file, keeping only the configured service type
     */
    [[nodiscard]] Status refresh();

    /// Warn about an existing booking at startup; no-op when there is none
    void logStartupWarning() const;

    [[nodiscard]] bool exists() const
    {
        return !m_bookings.empty();
    }

    [[nodiscard]] const std::vector<ExistingBooking> &bookings() const
    {
        return m_bookings;
    }

    /// A new hold must not be placed: a booking exists and auto-cancel is off
    [[nodiscard]] bool blocksNewBooking() const
    {
        return exists() && !m_cancelIfExist;
    }

    /**
     * @brief Cancel the first booking in the snapshot
     *
     * The reply body is not checked. The snapshot is cleared once the request
     * completes, so the same booking is never cancelled twice.
     */
    [[nodiscard]] Status cancelFirst();

private:
    SchedulerApi &m_api;
    int m_typeId{DEFAULT_SERVICE_TYPE_ID};
    bool m_cancelIfExist{false};
    std::vector<ExistingBooking> m_bookings{};
};
} // namespace slotwatch

#endif // SLOTWATCH_BOOKING_EXISTINGBOOKINGGUARD_HPP
