#include <catch2/catch_test_macros.hpp>

#include "api/SchedulerApi.hpp"
#include "support/FakeHttpClient.hpp"
#include "support/Fixtures.hpp"
#include "transport/Transport.hpp"

#include <ArduinoJson.h>

#include <string>

using namespace slotwatch;
using namespace slotwatch::test;

namespace
{
JsonDocument sentBody(const FakeHttpClient &client, const char *path)
{
    JsonDocument doc{};
    const auto *request{client.last(path)};
    REQUIRE(request != nullptr);
    REQUIRE(std::string{deserializeJson(doc, request->body).c_str()} == "Ok");
    return doc;
}

struct ApiFixture
{
    FakeHttpClient client{};
    PersonalInfoConfig info{makePersonalInfo()};
    Transport transport{client, TransportConfig{}};
    SchedulerApi api{transport, info};
};
} // namespace

TEST_CASE("Location search sends the zip code and tags the results", "[api]")
{
    ApiFixture f{};
    f.client.reply(kLocationPath, 200,
                   R"([{"Id":12,"Name":"Austin North","Address":"1 Main St","Distance":4.5},
                       {"Id":7,"Name":"Pflugerville","Address":"2 Oak Rd","Distance":11}])");

    const auto result{f.api.searchLocations("78701")};
    REQUIRE(result.ok());
    REQUIRE(result.value.size() == 2);
    REQUIRE(result.value[0].id == 12);
    REQUIRE(result.value[0].name == "Austin North");
    REQUIRE(result.value[1].distance == 11.0);
    REQUIRE(result.value[1].zipCode == "78701");

    const auto body{sentBody(f.client, kLocationPath)};
    REQUIRE(body["ZipCode"].as<std::string>() == "78701");
    REQUIRE(body["TypeId"].as<long>() == 71);
    REQUIRE(body["CityName"].as<std::string>() == "");
    REQUIRE(body["PreferredDay"].as<long>() == 0);
}

TEST_CASE("Location dates decode slots in API order", "[api]")
{
    ApiFixture f{};
    f.client.reply(kDatesPath, 200, R"({"LocationAvailabilityDates":[
        {"AvailabilityDate":"2024-05-03T00:00:00","AvailableTimeSlots":[
            {"SlotId":90,"Duration":20,"StartDateTime":"2024-05-03T10:00:00","FormattedStartDateTime":"Friday 10:00 AM"},
            {"SlotId":91,"Duration":20,"StartDateTime":"2024-05-03T08:00:00","FormattedStartDateTime":"Friday 8:00 AM"}]},
        {"AvailabilityDate":"2024-05-04T00:00:00","AvailableTimeSlots":[]}]})");

    const auto result{f.api.fetchLocationDates(12, true)};
    REQUIRE(result.ok());
    REQUIRE(result.value.size() == 2);
    REQUIRE(result.value[0].timeSlots.size() == 2);
    REQUIRE(result.value[0].timeSlots[0].slotId == 90);
    REQUIRE(result.value[0].timeSlots[1].formattedStartDateTime == "Friday 8:00 AM");
    REQUIRE(result.value[1].timeSlots.empty());

    const auto body{sentBody(f.client, kDatesPath)};
    REQUIRE(body["LocationId"].as<long>() == 12);
    REQUIRE(body["SameDay"].as<bool>() == true);
    REQUIRE(body["StartDate"].isNull());
    REQUIRE(body["TypeId"].as<long>() == 71);
}

TEST_CASE("Malformed replies are reported as parse errors", "[api]")
{
    ApiFixture f{};
    f.client.reply(kDatesPath, 200, "<html>maintenance</html>");

    const auto result{f.api.fetchLocationDates(1, false)};
    REQUIRE(result.failed());
    REQUIRE(result.status.code == StatusCode::ParseError);
}

TEST_CASE("Hold counts only a literal true as held", "[api]")
{
    ApiFixture f{};

    f.client.enqueue(kHoldPath, 200, holdReply(true));
    auto held{f.api.holdSlot(90)};
    REQUIRE(held.ok());
    REQUIRE(held.value.held);

    f.client.enqueue(kHoldPath, 200, R"({"SlotHeldSuccessfully":"true","ErrorMessage":null})");
    held = f.api.holdSlot(90);
    REQUIRE(held.ok());
    REQUIRE_FALSE(held.value.held);

    f.client.enqueue(kHoldPath, 200, holdReply(false, "Slot no longer available"));
    held = f.api.holdSlot(90);
    REQUIRE_FALSE(held.value.held);
    REQUIRE(held.value.errorMessage == "Slot no longer available");

    const auto body{sentBody(f.client, kHoldPath)};
    REQUIRE(body["SlotId"].as<long>() == 90);
    REQUIRE(body["Last4Ssn"].as<std::string>() == "1234");
    REQUIRE(body["DateOfBirth"].as<std::string>() == "01/02/1990");
}

TEST_CASE("Booking request carries the slot, site and eligibility id", "[api]")
{
    ApiFixture f{};
    f.info.phoneNumber = "5125550100";
    f.client.reply(kEligibilityPath, 200, R"([{"ResponseId":987654}])");
    f.client.reply(kNewBookingPath, 200, bookedReply("ABC123"));

    const auto responseId{f.api.fetchResponseId()};
    REQUIRE(responseId.ok());
    REQUIRE(responseId.value == "987654");

    const TimeSlot slot{.slotId = 90, .duration = 20, .startDateTime = "2024-05-03T10:00:00"};
    const auto result{f.api.book(slot, 12, responseId.value)};
    REQUIRE(result.ok());
    REQUIRE(result.value.booked);
    REQUIRE(result.value.confirmationNumber == "ABC123");

    const auto body{sentBody(f.client, kNewBookingPath)};
    REQUIRE(body["BookingDateTime"].as<std::string>() == "2024-05-03T10:00:00");
    REQUIRE(body["BookingDuration"].as<long>() == 20);
    REQUIRE(body["SiteId"].as<long>() == 12);
    REQUIRE(body["ResponseId"].as<long>() == 987654);
    REQUIRE(body["SendSms"].as<bool>() == true);
    REQUIRE(body["CellPhone"].as<std::string>() == "5125550100");
    REQUIRE(body["ServiceTypeId"].as<long>() == 71);
    REQUIRE(body["SpanishLanguage"].as<std::string>() == "N");
    REQUIRE(body["AdaRequired"].as<bool>() == false);

    const auto eligibility{sentBody(f.client, kEligibilityPath)};
    REQUIRE(eligibility["CardNumber"].as<std::string>() == "");
    REQUIRE(eligibility["LastFourDigitsSsn"].as<std::string>() == "1234");
}

TEST_CASE("A null Booking object is not a booking", "[api]")
{
    ApiFixture f{};
    f.client.reply(kNewBookingPath, 200, R"({"Booking":null,"ErrorMessage":"Duplicate"})");

    const auto result{f.api.book(TimeSlot{}, 12, "1")};
    REQUIRE(result.ok());
    REQUIRE_FALSE(result.value.booked);
    REQUIRE(result.value.rawBody.find("Duplicate") != std::string::npos);

    const auto body{sentBody(f.client, kNewBookingPath)};
    REQUIRE(body["SendSms"].as<bool>() == false);
}

TEST_CASE("Confirmation URL points at the public scheduler", "[api]")
{
    REQUIRE(SchedulerApi::confirmationUrl("ABC123") == "https://public.txdpsscheduler.com/?b=ABC123");
}
