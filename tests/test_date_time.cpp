#include <catch2/catch_test_macros.hpp>

#include "common/DateTime.hpp"

using namespace slotwatch;

TEST_CASE("ISO dates parse from date and date-time text", "[datetime]")
{
    SECTION("date only")
    {
        const auto date{parseIsoDate("2024-05-10")};
        REQUIRE(date);
        REQUIRE(*date == CivilDate{2024, 5, 10});
    }

    SECTION("leading date of a date-time")
    {
        const auto date{parseIsoDate("2024-12-31T23:15:00")};
        REQUIRE(date);
        REQUIRE(*date == CivilDate{2024, 12, 31});
    }

    SECTION("malformed or impossible dates are rejected")
    {
        REQUIRE_FALSE(parseIsoDate(""));
        REQUIRE_FALSE(parseIsoDate("2024/05/10"));
        REQUIRE_FALSE(parseIsoDate("2023-02-29"));
        REQUIRE_FALSE(parseIsoDate("2024-13-01"));
        REQUIRE_FALSE(parseIsoDate("20a4-01-01"));
    }
}

TEST_CASE("Hour is read from the wall-clock time as written", "[datetime]")
{
    REQUIRE(parseIsoHour("2024-05-10T07:59:00") == 7);
    REQUIRE(parseIsoHour("2024-05-10 14:30") == 14);
    REQUIRE(parseIsoHour("2024-05-10T00:00:00") == 0);

    REQUIRE_FALSE(parseIsoHour("2024-05-10"));
    REQUIRE_FALSE(parseIsoHour("2024-05-10T24:00:00"));
    REQUIRE_FALSE(parseIsoHour("2024-05-10T10:61:00"));
    REQUIRE_FALSE(parseIsoHour("2024-05-10X10:00:00"));
}

TEST_CASE("Day arithmetic crosses month and leap-year boundaries", "[datetime]")
{
    REQUIRE(addDays(CivilDate{2024, 2, 28}, 1) == CivilDate{2024, 2, 29});
    REQUIRE(addDays(CivilDate{2023, 2, 28}, 1) == CivilDate{2023, 3, 1});
    REQUIRE(addDays(CivilDate{2024, 12, 31}, 1) == CivilDate{2025, 1, 1});
    REQUIRE(addDays(CivilDate{2024, 3, 1}, -1) == CivilDate{2024, 2, 29});
    REQUIRE(toDayNumber(CivilDate{1970, 1, 1}) == 0);
    REQUIRE(fromDayNumber(toDayNumber(CivilDate{1969, 7, 20})) == CivilDate{1969, 7, 20});
}

TEST_CASE("Weekday numbering starts at Sunday", "[datetime]")
{
    REQUIRE(weekday(CivilDate{1970, 1, 1}) == 4);  // Thursday
    REQUIRE(weekday(CivilDate{2024, 5, 12}) == 0); // Sunday
    REQUIRE(weekday(CivilDate{2024, 5, 18}) == 6); // Saturday
    REQUIRE(weekday(CivilDate{1969, 12, 28}) == 0);
}

TEST_CASE("Date of birth uses MM/DD/YYYY", "[datetime]")
{
    REQUIRE(parseUsDate("01/02/1990") == CivilDate{1990, 1, 2});
    REQUIRE_FALSE(parseUsDate("1990-01-02"));
    REQUIRE_FALSE(parseUsDate("02/30/1990"));
    REQUIRE_FALSE(parseUsDate("1/2/1990"));
}

TEST_CASE("Display formatting uses a 12-hour clock", "[datetime]")
{
    REQUIRE(formatDisplayDateTime("2024-05-10T14:05:00") == "05/10/2024 02:05 PM");
    REQUIRE(formatDisplayDateTime("2024-05-10T00:30:00") == "05/10/2024 12:30 AM");
    REQUIRE(formatDisplayDateTime("2024-05-10T12:00:00") == "05/10/2024 12:00 PM");
    REQUIRE(formatDisplayDateTime("soon") == "soon");
    REQUIRE(formatIsoDate(CivilDate{2024, 5, 1}) == "2024-05-01");
}
