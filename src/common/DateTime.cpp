#include "common/DateTime.hpp"

#include <cstdio>

namespace slotwatch
{
namespace
{
bool parseDigits(const std::string_view text, const std::size_t pos, const std::size_t count, int &out)
{
    if (pos + count > text.size())
    {
        return false;
    }

    auto value{0};
    for (std::size_t i = pos; i < pos + count; ++i)
    {
        const auto c{text[i]};
        if (c < '0' || c > '9')
        {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    out = value;
    return true;
}

int daysInMonth(const int year, const int month)
{
    constexpr int kDays[]{31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    const bool leap{(year % 4 == 0 && year % 100 != 0) || year % 400 == 0};
    return (month == 2 && leap) ? 29 : kDays[month - 1];
}
} // namespace

std::int32_t toDayNumber(const CivilDate &date)
{
    // Howard Hinnant's days_from_civil
    const auto y{date.year - (date.month <= 2 ? 1 : 0)};
    const auto era{(y >= 0 ? y : y - 399) / 400};
    const auto yoe{static_cast<unsigned>(y - era * 400)};
    const auto mp{static_cast<unsigned>(date.month > 2 ? date.month - 3 : date.month + 9)};
    const auto doy{(153 * mp + 2) / 5 + static_cast<unsigned>(date.day) - 1};
    const auto doe{yoe * 365 + yoe / 4 - yoe / 100 + doy};
    return era * 146097 + static_cast<std::int32_t>(doe) - 719468;
}

CivilDate fromDayNumber(const std::int32_t dayNumber)
{
    const auto z{dayNumber + 719468};
    const auto era{(z >= 0 ? z : z - 146096) / 146097};
    const auto doe{static_cast<unsigned>(z - era * 146097)};
    const auto yoe{(doe - doe / 1460 + doe / 36524 - doe / 146096) / 365};
    const auto doy{doe - (365 * yoe + yoe / 4 - yoe / 100)};
    const auto mp{(5 * doy + 2) / 153};
    const auto day{static_cast<int>(doy - (153 * mp + 2) / 5 + 1)};
    const auto month{static_cast<int>(mp < 10 ? mp + 3 : mp - 9)};
    const auto year{static_cast<int>(yoe) + era * 400 + (month <= 2 ? 1 : 0)};
    return {year, month, day};
}

CivilDate addDays(const CivilDate &date, const int days)
{
    return fromDayNumber(toDayNumber(date) + days);
}

int weekday(const CivilDate &date)
{
    // 1970-01-01 was a Thursday
    const auto z{toDayNumber(date)};
    return z >= -4 ? (z + 4) % 7 : (z + 5) % 7 + 6;
}

bool isValidDate(const int year, const int month, const int day)
{
    return month >= 1 && month <= 12 && day >= 1 && day <= daysInMonth(year, month);
}

CivilDate fromTm(const std::tm &local)
{
    return {local.tm_year + 1900, local.tm_mon + 1, local.tm_mday};
}

std::optional<CivilDate> parseIsoDate(const std::string_view text)
{
    CivilDate date{};
    if (!parseDigits(text, 0, 4, date.year) || text.size() < 10 || text[4] != '-' || text[7] != '-' ||
        !parseDigits(text, 5, 2, date.month) || !parseDigits(text, 8, 2, date.day))
    {
        return std::nullopt;
    }

    if (!isValidDate(date.year, date.month, date.day))
    {
        return std::nullopt;
    }
    return date;
}

std::optional<int> parseIsoHour(const std::string_view text)
{
    if (!parseIsoDate(text) || text.size() < 16 || (text[10] != 'T' && text[10] != ' ') || text[13] != ':')
    {
        return std::nullopt;
    }

    auto hour{0};
    auto minute{0};
    if (!parseDigits(text, 11, 2, hour) || !parseDigits(text, 14, 2, minute) || hour > 23 || minute > 59)
    {
        return std::nullopt;
    }
    return hour;
}

std::optional<CivilDate> parseUsDate(const std::string_view text)
{
    CivilDate date{};
    if (text.size() != 10 || text[2] != '/' || text[5] != '/' || !parseDigits(text, 0, 2, date.month) ||
        !parseDigits(text, 3, 2, date.day) || !parseDigits(text, 6, 4, date.year))
    {
        return std::nullopt;
    }

    if (!isValidDate(date.year, date.month, date.day))
    {
        return std::nullopt;
    }
    return date;
}

std::string formatIsoDate(const CivilDate &date)
{
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", date.year, date.month, date.day);
    return buf;
}

std::string formatDisplayDateTime(const std::string_view isoDateTime)
{
    const auto date{parseIsoDate(isoDateTime)};
    const auto hour{parseIsoHour(isoDateTime)};
    auto minute{0};
    if (!date || !hour || !parseDigits(isoDateTime, 14, 2, minute))
    {
        return std::string{isoDateTime};
    }

    auto displayHour{*hour % 12};
    if (displayHour == 0)
    {
        displayHour = 12;
    }

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%02d/%02d/%04d %02d:%02d %s",
                  date->month, date->day, date->year, displayHour, minute, *hour < 12 ? "AM" : "PM");
    return buf;
}
} // namespace slotwatch
