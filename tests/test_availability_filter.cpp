#include <catch2/catch_test_macros.hpp>

#include "booking/AvailabilityFilter.hpp"
#include "common/Config.hpp"

#include <string>

using namespace slotwatch;

namespace
{
TimeSlot slotAt(const int id, const std::string &dateTime)
{
    return TimeSlot{.slotId = id, .duration = 20, .startDateTime = dateTime, .formattedStartDateTime = dateTime};
}

AvailabilityDate dateWith(const std::string &day, std::vector<TimeSlot> slots)
{
    return AvailabilityDate{.availabilityDate = day + "T00:00:00", .timeSlots = std::move(slots)};
}

// 2024-05-01 is a Wednesday
FilterWindow window(const int startOffset, const int endOffset, const int startHour = 0, const int endHour = 24)
{
    return FilterWindow{
            .sameDay = false,
            .referenceDate = CivilDate{2024, 5, 1},
            .startOffsetDays = startOffset,
            .endOffsetDays = endOffset,
            .preferredWeekdays = {},
            .startHour = startHour,
            .endHour = endHour,
    };
}
} // namespace

TEST_CASE("Slots are kept only inside the half-open hour window", "[filter]")
{
    const auto w{window(0, 30, 8, 12)};

    REQUIRE_FALSE(slotInHourWindow(slotAt(1, "2024-05-02T07:59:00"), w));
    REQUIRE(slotInHourWindow(slotAt(2, "2024-05-02T08:00:00"), w));
    REQUIRE(slotInHourWindow(slotAt(3, "2024-05-02T11:59:00"), w));
    REQUIRE_FALSE(slotInHourWindow(slotAt(4, "2024-05-02T12:00:00"), w));
    REQUIRE_FALSE(slotInHourWindow(slotAt(5, "not a time"), w));
}

TEST_CASE("Windowed mode keeps dates inside the inclusive day-offset range", "[filter]")
{
    const auto w{window(2, 10)};

    REQUIRE_FALSE(dateInWindow(dateWith("2024-05-02", {}), w)); // offset 1
    REQUIRE(dateInWindow(dateWith("2024-05-03", {}), w));       // offset 2
    REQUIRE(dateInWindow(dateWith("2024-05-11", {}), w));       // offset 10
    REQUIRE_FALSE(dateInWindow(dateWith("2024-05-12", {}), w)); // offset 11
    REQUIRE_FALSE(dateInWindow(AvailabilityDate{.availabilityDate = "05/03/2024"}, w));
}

TEST_CASE("Preferred weekdays restrict windowed dates", "[filter]")
{
    auto w{window(0, 30)};
    w.preferredWeekdays = {1, 5}; // Monday, Friday

    REQUIRE(dateInWindow(dateWith("2024-05-03", {}), w));       // Friday
    REQUIRE(dateInWindow(dateWith("2024-05-06", {}), w));       // Monday
    REQUIRE_FALSE(dateInWindow(dateWith("2024-05-04", {}), w)); // Saturday
}

TEST_CASE("Same-day mode skips offset and weekday checks but keeps the hour filter", "[filter]")
{
    auto w{window(5, 6, 9, 17)};
    w.sameDay = true;
    w.preferredWeekdays = {0};

    const std::vector<AvailabilityDate> dates{
            dateWith("2024-05-01", {slotAt(1, "2024-05-01T08:00:00"), slotAt(2, "2024-05-01T09:30:00")}),
            dateWith("2024-05-02", {slotAt(3, "2024-05-02T18:00:00")}),
    };

    const auto filtered{filterAvailability(dates, w)};
    REQUIRE(filtered.size() == 1);
    REQUIRE(filtered[0].timeSlots.size() == 1);
    REQUIRE(filtered[0].timeSlots[0].slotId == 2);
}

TEST_CASE("Filtering drops empty dates and is idempotent", "[filter]")
{
    const auto w{window(0, 10, 8, 12)};
    const std::vector<AvailabilityDate> dates{
            dateWith("2024-05-02", {slotAt(1, "2024-05-02T07:00:00")}),
            dateWith("2024-05-03", {slotAt(2, "2024-05-03T09:00:00"), slotAt(3, "2024-05-03T13:00:00"),
                                    slotAt(4, "2024-05-03T08:15:00")}),
            dateWith("2024-05-20", {slotAt(5, "2024-05-20T09:00:00")}),
            dateWith("2024-05-04", {}),
    };

    const auto once{filterAvailability(dates, w)};
    REQUIRE(once.size() == 1);
    REQUIRE(once[0].timeSlots.size() == 2);
    REQUIRE(once[0].timeSlots[0].slotId == 2);
    REQUIRE(once[0].timeSlots[1].slotId == 4);

    const auto twice{filterAvailability(once, w)};
    REQUIRE(twice.size() == once.size());
    REQUIRE(twice[0].availabilityDate == once[0].availabilityDate);
    REQUIRE(twice[0].timeSlots.size() == once[0].timeSlots.size());
}

TEST_CASE("Slots at 7, 10 and 14 in an 8-12 window select the 10:00 slot", "[filter]")
{
    const std::vector<AvailabilityDate> dates{
            dateWith("2024-05-03", {slotAt(7, "2024-05-03T07:00:00"), slotAt(10, "2024-05-03T10:00:00"),
                                    slotAt(14, "2024-05-03T14:00:00")}),
    };

    const auto filtered{filterAvailability(dates, window(0, 30, 8, 12))};
    REQUIRE(filtered.size() == 1);
    REQUIRE(filtered[0].timeSlots.size() == 1);

    const auto candidate{selectCandidate(filtered)};
    REQUIRE(candidate);
    REQUIRE(candidate->slot.slotId == 10);
    REQUIRE(candidate->slot.startDateTime == "2024-05-03T10:00:00");
}

TEST_CASE("Candidate is the first surviving slot in input order, not the earliest", "[filter]")
{
    const std::vector<AvailabilityDate> dates{
            dateWith("2024-05-09", {slotAt(1, "2024-05-09T11:00:00"), slotAt(2, "2024-05-09T09:00:00")}),
            dateWith("2024-05-03", {slotAt(3, "2024-05-03T09:00:00")}),
    };

    const auto candidate{selectCandidate(filterAvailability(dates, window(0, 30)))};
    REQUIRE(candidate);
    REQUIRE(candidate->slot.slotId == 1);

    REQUIRE_FALSE(selectCandidate({}));
}

TEST_CASE("Window is built from the location settings", "[filter]")
{
    LocationConfig config{};
    config.daysAround.start = 3;
    config.daysAround.end = 9;
    config.timesAround.start = 8;
    config.timesAround.end = 17;
    config.preferredDays = {2};

    const auto w{FilterWindow::fromConfig(config, CivilDate{2024, 5, 1})};
    REQUIRE_FALSE(w.sameDay);
    REQUIRE(w.startOffsetDays == 3);
    REQUIRE(w.endOffsetDays == 9);
    REQUIRE(w.startHour == 8);
    REQUIRE(w.endHour == 17);
    REQUIRE(w.preferredWeekdays == std::vector<int>{2});
    REQUIRE(w.referenceDate == CivilDate{2024, 5, 1});
}
