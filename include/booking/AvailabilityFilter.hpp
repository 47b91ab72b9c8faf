#ifndef SLOTWATCH_BOOKING_AVAILABILITYFILTER_HPP
#define SLOTWATCH_BOOKING_AVAILABILITYFILTER_HPP

/**
 * @file AvailabilityFilter.hpp
 * @brief Narrows a location's dates and slots to the operator's window.
 *
 * Pure functions; no I/O and no clock access. The caller supplies the
 * reference date.
 */

#include "common/DateTime.hpp"
#include "common/Types.hpp"

#include <optional>
#include <vector>

namespace slotwatch
{
struct LocationConfig;

struct FilterWindow
{
    bool sameDay{false}; ///< Skip the day-offset and weekday checks
    CivilDate referenceDate{};
    int startOffsetDays{0}; ///< Inclusive
    int endOffsetDays{30}; ///< Inclusive
    std::vector<int> preferredWeekdays{}; ///< 0 = Sunday; empty = any
    int startHour{0}; ///< Inclusive
    int endHour{24}; ///< Exclusive

    static FilterWindow fromConfig(const LocationConfig &config, const CivilDate &referenceDate);
};

struct Candidate
{
    AvailabilityDate date{};
    TimeSlot slot{};
};

/// True if the slot's start hour lies in [startHour, endHour)
[[nodiscard]] bool slotInHourWindow(const TimeSlot &slot, const FilterWindow &window);

/// Day-offset and weekday checks only; always true in same-day mode
[[nodiscard]] bool dateInWindow(const AvailabilityDate &date, const FilterWindow &window);

/**
 * @brief Keep the dates that pass the window, each with only its surviving slots
 *
 * Input order is preserved. Dates left with no slots are dropped, so the
 * function is idempotent.
 */
[[nodiscard]] std::vector<AvailabilityDate> filterAvailability(const std::vector<AvailabilityDate> &dates,
                                                               const FilterWindow &window);

/**
 * @brief First surviving slot of the first surviving date, in input order
 */
[[nodiscard]] std::optional<Candidate> selectCandidate(const std::vector<AvailabilityDate> &filtered);
} // namespace slotwatch

#endif // SLOTWATCH_BOOKING_AVAILABILITYFILTER_HPP
