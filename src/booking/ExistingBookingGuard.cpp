#include "booking/ExistingBookingGuard.hpp"

#include "api/SchedulerApi.hpp"
#include "common/DateTime.hpp"
#include "common/Logger.hpp"

#include <algorithm>
#include <iterator>

namespace slotwatch
{
namespace
{
constexpr auto *TAG{"BookingGuard"};
} // namespace

ExistingBookingGuard::ExistingBookingGuard(SchedulerApi &api, const int typeId, const bool cancelIfExist)
    : m_api(api)
    , m_typeId(typeId)
    , m_cancelIfExist(cancelIfExist)
{
}

Status ExistingBookingGuard::refresh()
{
    auto result{m_api.fetchExistingBookings()};
    if (result.failed())
    {
        LOG_ERROR(TAG, "Existing booking check failed: %s", toString(result.status.code));
        return result.status;
    }

    m_bookings.clear();
    std::copy_if(result.value.begin(), result.value.end(), std::back_inserter(m_bookings),
                 [this](const ExistingBooking &booking) { return booking.serviceTypeId == m_typeId; });

    LOG_DEBUG(TAG, "%u booking(s) on file, %u of type %d", static_cast<unsigned>(result.value.size()),
              static_cast<unsigned>(m_bookings.size()), m_typeId);
    return Status::Ok();
}

void ExistingBookingGuard::logStartupWarning() const
{
    if (!exists())
    {
        return;
    }

    const auto &first{m_bookings.front()};
    LOG_WARN(TAG, "You have an existing booking at %s %s.", first.siteName.c_str(),
             formatDisplayDateTime(first.bookingDateTime).c_str());
    LOG_WARN(TAG, "This application will continue to run, and cancel the existing booking if a new one is found.");
}

Status ExistingBookingGuard::cancelFirst()
{
    if (!exists())
    {
        return Status::Ok();
    }

    const auto confirmationNumber{m_bookings.front().confirmationNumber};
    LOG_INFO(TAG, "Canceling existing appointment: %s.", confirmationNumber.c_str());

    if (const auto status = m_api.cancelBooking(confirmationNumber); status.failed())
    {
        return status;
    }

    LOG_INFO(TAG, "Appointment cancelled.");
    m_bookings.clear();
    return Status::Ok();
}
} // namespace slotwatch
