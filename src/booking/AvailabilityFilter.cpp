#include "booking/AvailabilityFilter.hpp"

#include "common/Config.hpp"

#include <algorithm>
#include <iterator>

namespace slotwatch
{
FilterWindow FilterWindow::fromConfig(const LocationConfig &config, const CivilDate &referenceDate)
{
    return FilterWindow{
            .sameDay = config.sameDay,
            .referenceDate = referenceDate,
            .startOffsetDays = config.daysAround.start,
            .endOffsetDays = config.daysAround.end,
            .preferredWeekdays = config.preferredDays,
            .startHour = config.timesAround.start,
            .endHour = config.timesAround.end,
    };
}

bool slotInHourWindow(const TimeSlot &slot, const FilterWindow &window)
{
    const auto hour{parseIsoHour(slot.startDateTime)};
    return hour && *hour >= window.startHour && *hour < window.endHour;
}

bool dateInWindow(const AvailabilityDate &date, const FilterWindow &window)
{
    const auto day{parseIsoDate(date.availabilityDate)};
    if (!day)
    {
        return false;
    }
    if (window.sameDay)
    {
        return true;
    }

    const auto dayNumber{toDayNumber(*day)};
    const auto reference{toDayNumber(window.referenceDate)};
    if (dayNumber < reference + window.startOffsetDays || dayNumber > reference + window.endOffsetDays)
    {
        return false;
    }

    if (!window.preferredWeekdays.empty())
    {
        const auto &days{window.preferredWeekdays};
        return std::find(days.begin(), days.end(), weekday(*day)) != days.end();
    }
    return true;
}

std::vector<AvailabilityDate> filterAvailability(const std::vector<AvailabilityDate> &dates, const FilterWindow &window)
{
    std::vector<AvailabilityDate> filtered{};
    for (const auto &date: dates)
    {
        if (!dateInWindow(date, window))
        {
            continue;
        }

        AvailabilityDate kept{.availabilityDate = date.availabilityDate};
        std::copy_if(date.timeSlots.begin(), date.timeSlots.end(), std::back_inserter(kept.timeSlots),
                     [&window](const TimeSlot &slot) { return slotInHourWindow(slot, window); });

        if (!kept.timeSlots.empty())
        {
            filtered.push_back(std::move(kept));
        }
    }
    return filtered;
}

std::optional<Candidate> selectCandidate(const std::vector<AvailabilityDate> &filtered)
{
    for (const auto &date: filtered)
    {
        if (!date.timeSlots.empty())
        {
            return Candidate{.date = date, .slot = date.timeSlots.front()};
        }
    }
    return std::nullopt;
}
} // namespace slotwatch
