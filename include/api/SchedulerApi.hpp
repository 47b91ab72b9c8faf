#ifndef SLOTWATCH_API_SCHEDULERAPI_HPP
#define SLOTWATCH_API_SCHEDULERAPI_HPP

/**
 * @file SchedulerApi.hpp
 * @brief Typed calls to the public scheduling API.
 *
 * Encodes request bodies from the operator's personal info, sends them
 * through Transport and decodes the JSON replies. A Transport failure is
 * forwarded unchanged (StatusCode::Fatal); a reply that cannot be decoded is
 * reported as StatusCode::ParseError.
 */

#include "common/Config.hpp"
#include "common/Types.hpp"
#include "core/Result.hpp"

#include <string>
#include <vector>

namespace slotwatch
{
class Transport;

struct HoldResult
{
    bool held{false};
    std::string errorMessage{};
};

struct BookResult
{
    bool booked{false}; ///< Reply carried a non-null Booking object
    std::string confirmationNumber{};
    std::string rawBody{}; ///< Reply as received, logged on rejection
};

class SchedulerApi
{
public:
    static constexpr auto *kConfirmationUrlPrefix{"https://public.txdpsscheduler.com/?b="};

    SchedulerApi(Transport &transport, const PersonalInfoConfig &personalInfo);

    SchedulerApi(const SchedulerApi &) = delete;
    SchedulerApi &operator=(const SchedulerApi &) = delete;

    /// All bookings on file for the operator, any service type
    [[nodiscard]] Result<std::vector<ExistingBooking>> fetchExistingBookings();

    /// Reply body is not inspected
    [[nodiscard]] Status cancelBooking(const std::string &confirmationNumber);

    /**
     * @brief Fetch a fresh eligibility ResponseId
     * @return The id as a JSON literal, passed back verbatim to book()
     */
    [[nodiscard]] Result<std::string> fetchResponseId();

    /// Offices near a zip code, tagged with that zip code, in API order
    [[nodiscard]] Result<std::vector<Location>> searchLocations(const std::string &zipCode);

    [[nodiscard]] Result<std::vector<AvailabilityDate>> fetchLocationDates(int locationId, bool sameDay);

    [[nodiscard]] Result<HoldResult> holdSlot(int slotId);

    [[nodiscard]] Result<BookResult> book(const TimeSlot &slot, int siteId, const std::string &responseId);

    [[nodiscard]] static std::string confirmationUrl(const std::string &confirmationNumber);

    [[nodiscard]] int typeId() const
    {
        return m_personalInfo.typeId > 0 ? m_personalInfo.typeId : DEFAULT_SERVICE_TYPE_ID;
    }

private:
    Transport &m_transport;
    const PersonalInfoConfig &m_personalInfo;
};
} // namespace slotwatch

#endif // SLOTWATCH_API_SCHEDULERAPI_HPP
