#include <catch2/catch_test_macros.hpp>

#include "api/SchedulerApi.hpp"
#include "booking/ExistingBookingGuard.hpp"
#include "support/FakeHttpClient.hpp"
#include "support/Fixtures.hpp"
#include "transport/Transport.hpp"

using namespace slotwatch;
using namespace slotwatch::test;

namespace
{
constexpr auto *kTwoBookings{R"([
    {"ConfirmationNumber":"OTHER9","SiteName":"Round Rock","BookingDateTime":"2024-06-02T10:00:00","ServiceTypeId":81},
    {"ConfirmationNumber":"OLD1","SiteName":"Austin North","BookingDateTime":"2024-06-01T09:00:00","ServiceTypeId":71}])"};

struct GuardFixture
{
    explicit GuardFixture(const bool cancelIfExist)
        : guard(api, 71, cancelIfExist)
    {
    }

    FakeHttpClient client{};
    PersonalInfoConfig info{makePersonalInfo()};
    Transport transport{client, TransportConfig{}};
    SchedulerApi api{transport, info};
    ExistingBookingGuard guard;
};
} // namespace

TEST_CASE("Existing bookings are filtered to the configured service type", "[guard]")
{
    GuardFixture f{false};
    f.client.reply(kBookingPath, 200, kTwoBookings);

    REQUIRE(f.guard.refresh().ok());
    REQUIRE(f.guard.exists());
    REQUIRE(f.guard.bookings().size() == 1);
    REQUIRE(f.guard.bookings().front().confirmationNumber == "OLD1");
    REQUIRE(f.guard.blocksNewBooking());
    f.guard.logStartupWarning();
}

TEST_CASE("No booking of the configured type means nothing blocks", "[guard]")
{
    GuardFixture f{false};
    f.client.reply(kBookingPath, 200,
                   R"([{"ConfirmationNumber":"X","SiteName":"Elsewhere","BookingDateTime":"2024-06-02T10:00:00","ServiceTypeId":81}])");

    REQUIRE(f.guard.refresh().ok());
    REQUIRE_FALSE(f.guard.exists());
    REQUIRE_FALSE(f.guard.blocksNewBooking());
}

TEST_CASE("Auto-cancel lets a new booking proceed and cancels only once", "[guard]")
{
    GuardFixture f{true};
    f.client.reply(kBookingPath, 200, kTwoBookings);
    f.client.reply(kCancelPath, 200, "");

    REQUIRE(f.guard.refresh().ok());
    REQUIRE_FALSE(f.guard.blocksNewBooking());

    REQUIRE(f.guard.cancelFirst().ok());
    REQUIRE_FALSE(f.guard.exists());
    REQUIRE(f.client.count(kCancelPath) == 1);

    REQUIRE(f.guard.cancelFirst().ok());
    REQUIRE(f.client.count(kCancelPath) == 1);
}

TEST_CASE("A failed booking query is reported to the caller", "[guard]")
{
    GuardFixture f{false};
    f.client.reply(kBookingPath, 500, "down");

    const auto status{f.guard.refresh()};
    REQUIRE(status.isFatal());
    REQUIRE_FALSE(f.guard.exists());
}
