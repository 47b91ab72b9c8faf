#include "common/Config.hpp"

#include "common/DateTime.hpp"

#include <algorithm>
#include <cctype>

namespace slotwatch
{
namespace
{
bool isDigits(const std::string &text, const std::size_t count)
{
    return text.size() == count && std::all_of(text.begin(), text.end(), [](const unsigned char c) {
               return std::isdigit(c) != 0;
           });
}
} // namespace

Status Config::validate() const
{
    if (personalInfo.firstName.empty() || personalInfo.lastName.empty())
    {
        return Status::InvalidArg("personalInfo name is required");
    }
    if (!parseUsDate(personalInfo.dob))
    {
        return Status::InvalidArg("personalInfo.dob must be MM/DD/YYYY");
    }
    if (!isDigits(personalInfo.lastFourSsn, 4))
    {
        return Status::InvalidArg("personalInfo.lastFourSSN must be 4 digits");
    }
    if (personalInfo.email.empty())
    {
        return Status::InvalidArg("personalInfo.email is required");
    }
    if (personalInfo.typeId <= 0)
    {
        return Status::InvalidArg("personalInfo.typeId must be positive");
    }

    if (location.zipCodes.empty())
    {
        return Status::InvalidArg("location.zipCode must list at least one zip code");
    }
    if (location.daysAround.start < 0 || location.daysAround.start > location.daysAround.end)
    {
        return Status::InvalidArg("location.daysAround must satisfy 0 <= start <= end");
    }
    if (!location.daysAround.startDate.empty() && !parseIsoDate(location.daysAround.startDate))
    {
        return Status::InvalidArg("location.daysAround.startDate must be YYYY-MM-DD");
    }
    if (location.timesAround.start < 0 || location.timesAround.start >= location.timesAround.end ||
        location.timesAround.end > 24)
    {
        return Status::InvalidArg("location.timesAround must satisfy 0 <= start < end <= 24");
    }
    for (const auto day: location.preferredDays)
    {
        if (day < 0 || day > 6)
        {
            return Status::InvalidArg("location.preferredDays entries must be 0..6");
        }
    }

    if (appSettings.intervalMs == 0)
    {
        return Status::InvalidArg("appSettings.interval must be positive");
    }
    if (appSettings.headersTimeoutMs == 0 || appSettings.headersTimeoutMs > AppSettingsConfig::kMaxHeadersTimeoutMs)
    {
        return Status::InvalidArg("appSettings.headersTimeout must be 1..65535 ms");
    }

    return Status::Ok();
}
} // namespace slotwatch
