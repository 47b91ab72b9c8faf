#ifndef SLOTWATCH_TESTS_FIXTURES_HPP
#define SLOTWATCH_TESTS_FIXTURES_HPP

#include "booking/IPollControl.hpp"
#include "common/Config.hpp"

#include <string>

namespace slotwatch::test
{
inline constexpr auto *kBookingPath{"/api/Booking"};
inline constexpr auto *kCancelPath{"/api/CancelBooking"};
inline constexpr auto *kEligibilityPath{"/api/Eligibility"};
inline constexpr auto *kLocationPath{"/api/AvailableLocation/"};
inline constexpr auto *kDatesPath{"/api/AvailableLocationDates"};
inline constexpr auto *kHoldPath{"/api/HoldSlot"};
inline constexpr auto *kNewBookingPath{"/api/NewBooking"};

inline PersonalInfoConfig makePersonalInfo()
{
    PersonalInfoConfig info{};
    info.firstName = "Jane";
    info.lastName = "Doe";
    info.dob = "01/02/1990";
    info.lastFourSsn = "1234";
    info.email = "jane@example.com";
    return info;
}

/// Counts pause/resume calls from the booking state machine
class RecordingPollControl : public IPollControl
{
public:
    void pause() override
    {
        paused = true;
        ++pauses;
    }

    void resume() override
    {
        paused = false;
        ++resumes;
    }

    [[nodiscard]] bool isPaused() const override
    {
        return paused;
    }

    bool paused{false};
    int pauses{0};
    int resumes{0};
};

inline std::string holdReply(const bool held, const std::string &message = "")
{
    return std::string{R"({"SlotHeldSuccessfully":)"} + (held ? "true" : "false") + R"(,"ErrorMessage":")" + message + R"("})";
}

inline std::string bookedReply(const std::string &confirmation)
{
    return R"({"Booking":{"ConfirmationNumber":")" + confirmation + R"("}})";
}
} // namespace slotwatch::test

#endif // SLOTWATCH_TESTS_FIXTURES_HPP
