#include "api/SchedulerApi.hpp"

#include "common/Logger.hpp"
#include "transport/Transport.hpp"

#include <ArduinoJson.h>

#include <utility>

namespace slotwatch
{
namespace
{
constexpr auto *TAG{"SchedulerApi"};

std::string toJson(const JsonDocument &doc)
{
    std::string json;
    serializeJson(doc, json);
    return json;
}

/// Strings are returned as-is, numbers in their JSON form
std::string asText(const JsonVariantConst value)
{
    if (value.isNull())
    {
        return {};
    }
    if (value.is<const char *>())
    {
        return value.as<const char *>();
    }
    std::string text;
    serializeJson(value, text);
    return text;
}

void addIdentity(JsonDocument &doc, const PersonalInfoConfig &info)
{
    doc["FirstName"] = info.firstName;
    doc["LastName"] = info.lastName;
    doc["DateOfBirth"] = info.dob;
    doc["LastFourDigitsSsn"] = info.lastFourSsn;
}

template<typename T>
Result<T> parseFailure(const char *path, const DeserializationError err)
{
    LOG_ERROR(TAG, "%s: malformed reply (%s)", path, err.c_str());
    return Result<T>::Error(Status::ParseError("Malformed API reply"));
}
} // namespace

SchedulerApi::SchedulerApi(Transport &transport, const PersonalInfoConfig &personalInfo)
    : m_transport(transport)
    , m_personalInfo(personalInfo)
{
}

Result<std::vector<ExistingBooking>> SchedulerApi::fetchExistingBookings()
{
    constexpr auto *path{"/api/Booking"};

    JsonDocument request{};
    addIdentity(request, m_personalInfo);

    const auto response{m_transport.request(path, HttpMethod::Post, toJson(request))};
    if (response.failed())
    {
        return Result<std::vector<ExistingBooking>>::Error(response.status);
    }

    JsonDocument doc{};
    if (const auto err = deserializeJson(doc, response.value.body); err)
    {
        return parseFailure<std::vector<ExistingBooking>>(path, err);
    }

    std::vector<ExistingBooking> bookings{};
    for (const auto item: doc.as<JsonArrayConst>())
    {
        bookings.push_back(ExistingBooking{
                .confirmationNumber = asText(item["ConfirmationNumber"]),
                .siteName = item["SiteName"] | "",
                .bookingDateTime = item["BookingDateTime"] | "",
                .serviceTypeId = item["ServiceTypeId"] | 0,
        });
    }
    return Result<std::vector<ExistingBooking>>::Ok(std::move(bookings));
}

Status SchedulerApi::cancelBooking(const std::string &confirmationNumber)
{
    JsonDocument request{};
    request["ConfirmationNumber"] = confirmationNumber;
    request["DateOfBirth"] = m_personalInfo.dob;
    request["LastFourDigitsSsn"] = m_personalInfo.lastFourSsn;
    request["FirstName"] = m_personalInfo.firstName;
    request["LastName"] = m_personalInfo.lastName;

    return m_transport.request("/api/CancelBooking", HttpMethod::Post, toJson(request)).status;
}

Result<std::string> SchedulerApi::fetchResponseId()
{
    constexpr auto *path{"/api/Eligibility"};

    JsonDocument request{};
    addIdentity(request, m_personalInfo);
    request["CardNumber"] = "";

    const auto response{m_transport.request(path, HttpMethod::Post, toJson(request))};
    if (response.failed())
    {
        return Result<std::string>::Error(response.status);
    }

    JsonDocument doc{};
    if (const auto err = deserializeJson(doc, response.value.body); err)
    {
        return parseFailure<std::string>(path, err);
    }

    const auto responseId{doc[0]["ResponseId"].as<JsonVariantConst>()};
    if (responseId.isNull())
    {
        LOG_ERROR(TAG, "%s: no ResponseId in reply", path);
        return Result<std::string>::Error(Status::ParseError("Eligibility reply has no ResponseId"));
    }

    std::string literal;
    serializeJson(responseId, literal);
    return Result<std::string>::Ok(std::move(literal));
}

Result<std::vector<Location>> SchedulerApi::searchLocations(const std::string &zipCode)
{
    constexpr auto *path{"/api/AvailableLocation/"};

    JsonDocument request{};
    request["CityName"] = "";
    request["PreferredDay"] = 0;
    request["TypeId"] = typeId();
    request["ZipCode"] = zipCode;

    const auto response{m_transport.request(path, HttpMethod::Post, toJson(request))};
    if (response.failed())
    {
        return Result<std::vector<Location>>::Error(response.status);
    }

    JsonDocument doc{};
    if (const auto err = deserializeJson(doc, response.value.body); err)
    {
        return parseFailure<std::vector<Location>>(path, err);
    }

    std::vector<Location> locations{};
    for (const auto item: doc.as<JsonArrayConst>())
    {
        locations.push_back(Location{
                .id = item["Id"] | 0,
                .name = item["Name"] | "",
                .address = item["Address"] | "",
                .distance = item["Distance"] | 0.0,
                .zipCode = zipCode,
        });
    }
    return Result<std::vector<Location>>::Ok(std::move(locations));
}

Result<std::vector<AvailabilityDate>> SchedulerApi::fetchLocationDates(const int locationId, const bool sameDay)
{
    constexpr auto *path{"/api/AvailableLocationDates"};

    JsonDocument request{};
    request["LocationId"] = locationId;
    request["PreferredDay"] = 0;
    request["SameDay"] = sameDay;
    request["StartDate"] = nullptr;
    request["TypeId"] = typeId();

    const auto response{m_transport.request(path, HttpMethod::Post, toJson(request))};
    if (response.failed())
    {
        return Result<std::vector<AvailabilityDate>>::Error(response.status);
    }

    JsonDocument doc{};
    if (const auto err = deserializeJson(doc, response.value.body); err)
    {
        return parseFailure<std::vector<AvailabilityDate>>(path, err);
    }

    std::vector<AvailabilityDate> dates{};
    for (const auto item: doc["LocationAvailabilityDates"].as<JsonArrayConst>())
    {
        AvailabilityDate date{.availabilityDate = item["AvailabilityDate"] | ""};
        for (const auto slot: item["AvailableTimeSlots"].as<JsonArrayConst>())
        {
            date.timeSlots.push_back(TimeSlot{
                    .slotId = slot["SlotId"] | 0,
                    .duration = slot["Duration"] | 0,
                    .startDateTime = slot["StartDateTime"] | "",
                    .formattedStartDateTime = slot["FormattedStartDateTime"] | "",
            });
        }
        dates.push_back(std::move(date));
    }
    return Result<std::vector<AvailabilityDate>>::Ok(std::move(dates));
}

Result<HoldResult> SchedulerApi::holdSlot(const int slotId)
{
    constexpr auto *path{"/api/HoldSlot"};

    JsonDocument request{};
    request["DateOfBirth"] = m_personalInfo.dob;
    request["FirstName"] = m_personalInfo.firstName;
    request["LastName"] = m_personalInfo.lastName;
    request["Last4Ssn"] = m_personalInfo.lastFourSsn;
    request["SlotId"] = slotId;

    const auto response{m_transport.request(path, HttpMethod::Post, toJson(request))};
    if (response.failed())
    {
        return Result<HoldResult>::Error(response.status);
    }

    JsonDocument doc{};
    if (const auto err = deserializeJson(doc, response.value.body); err)
    {
        return parseFailure<HoldResult>(path, err);
    }

    // Only a literal true counts as held
    const auto held{doc["SlotHeldSuccessfully"]};
    return Result<HoldResult>::Ok(HoldResult{
            .held = held.is<bool>() && held.as<bool>(),
            .errorMessage = asText(doc["ErrorMessage"]),
    });
}

Result<BookResult> SchedulerApi::book(const TimeSlot &slot, const int siteId, const std::string &responseId)
{
    constexpr auto *path{"/api/NewBooking"};
    const auto &info{m_personalInfo};

    JsonDocument request{};
    request["AdaRequired"] = false;
    request["BookingDateTime"] = slot.startDateTime;
    request["BookingDuration"] = slot.duration;
    request["CardNumber"] = "";
    request["CellPhone"] = info.phoneNumber;
    request["DateOfBirth"] = info.dob;
    request["Email"] = info.email;
    request["FirstName"] = info.firstName;
    request["LastName"] = info.lastName;
    request["HomePhone"] = "";
    request["Last4Ssn"] = info.lastFourSsn;
    request["ResponseId"] = serialized(responseId);
    request["SendSms"] = !info.phoneNumber.empty();
    request["ServiceTypeId"] = typeId();
    request["SiteId"] = siteId;
    request["SpanishLanguage"] = "N";

    const auto response{m_transport.request(path, HttpMethod::Post, toJson(request))};
    if (response.failed())
    {
        return Result<BookResult>::Error(response.status);
    }

    BookResult result{.rawBody = response.value.body};

    JsonDocument doc{};
    if (const auto err = deserializeJson(doc, response.value.body); err)
    {
        LOG_ERROR(TAG, "%s: malformed reply (%s)", path, err.c_str());
        return Result<BookResult>::Ok(std::move(result));
    }

    const auto booking{doc["Booking"].as<JsonVariantConst>()};
    if (booking.is<JsonObjectConst>())
    {
        result.booked = true;
        result.confirmationNumber = asText(booking["ConfirmationNumber"]);
    }
    return Result<BookResult>::Ok(std::move(result));
}

std::string SchedulerApi::confirmationUrl(const std::string &confirmationNumber)
{
    return std::string{kConfirmationUrlPrefix} + confirmationNumber;
}
} // namespace slotwatch
