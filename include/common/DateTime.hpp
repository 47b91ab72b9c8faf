#ifndef SLOTWATCH_COMMON_DATETIME_HPP
#define SLOTWATCH_COMMON_DATETIME_HPP

/**
 * @file DateTime.hpp
 * @brief Calendar-day arithmetic and parsing of the API's ISO timestamps
 *
 * The scheduling API returns local wall-clock timestamps without an offset
 * ("2024-05-10T14:30:00"), so dates and hours are read as written; no
 * timezone conversion happens here.
 */

#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <string_view>

namespace slotwatch
{
/**
 * @brief Proleptic Gregorian calendar date
 */
struct CivilDate
{
    int year{1970};
    int month{1}; ///< 1..12
    int day{1}; ///< 1..31

    [[nodiscard]] bool operator==(const CivilDate &other) const
    {
        return year == other.year && month == other.month && day == other.day;
    }

    [[nodiscard]] bool operator!=(const CivilDate &other) const
    {
        return !(*this == other);
    }
};

/// Days since 1970-01-01 (negative before)
[[nodiscard]] std::int32_t toDayNumber(const CivilDate &date);

[[nodiscard]] CivilDate fromDayNumber(std::int32_t dayNumber);

[[nodiscard]] CivilDate addDays(const CivilDate &date, int days);

/// Day of week, 0 = Sunday ... 6 = Saturday
[[nodiscard]] int weekday(const CivilDate &date);

[[nodiscard]] bool isValidDate(int year, int month, int day);

/// Date part of the broken-down local time
[[nodiscard]] CivilDate fromTm(const std::tm &local);

/**
 * @brief Parse the leading "YYYY-MM-DD" of an ISO date or date-time
 * @return Date, or nullopt if malformed or out of range
 */
[[nodiscard]] std::optional<CivilDate> parseIsoDate(std::string_view text);

/**
 * @brief Parse the hour of "YYYY-MM-DDTHH:MM[:SS]" (a space separator is accepted)
 * @return Hour 0..23, or nullopt if malformed
 */
[[nodiscard]] std::optional<int> parseIsoHour(std::string_view text);

/**
 * @brief Parse "MM/DD/YYYY"
 */
[[nodiscard]] std::optional<CivilDate> parseUsDate(std::string_view text);

/// "YYYY-MM-DD"
[[nodiscard]] std::string formatIsoDate(const CivilDate &date);

/**
 * @brief Render an ISO date-time as "MM/DD/YYYY hh:mm AM"
 * @return Formatted text, or the input unchanged if it cannot be parsed
 */
[[nodiscard]] std::string formatDisplayDateTime(std::string_view isoDateTime);
} // namespace slotwatch

#endif // SLOTWATCH_COMMON_DATETIME_HPP
