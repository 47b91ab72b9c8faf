#ifndef SLOTWATCH_CONFIG_HPP
#define SLOTWATCH_CONFIG_HPP

#include "common/Types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace slotwatch
{
struct PersonalInfoConfig
{
    static constexpr auto kDefaultTypeId{DEFAULT_SERVICE_TYPE_ID};

    std::string firstName{};
    std::string lastName{};
    std::string dob{}; ///< MM/DD/YYYY
    std::string lastFourSsn{};
    std::string email{};
    std::string phoneNumber{}; ///< Optional; enables SMS confirmation
    int typeId{kDefaultTypeId};

    [[nodiscard]] bool isConfigured() const
    {
        return !firstName.empty() && !lastName.empty() && !dob.empty() && !lastFourSsn.empty() && !email.empty();
    }

    void restoreDefaults()
    {
        firstName.clear();
        lastName.clear();
        dob.clear();
        lastFourSsn.clear();
        email.clear();
        phoneNumber.clear();
        typeId = kDefaultTypeId;
    }
};

struct LocationConfig
{
    static constexpr auto kDefaultMiles{25};
    static constexpr auto kDefaultPickLocation{false};
    static constexpr auto kDefaultSameDay{false};
    static constexpr auto kDefaultDaysStart{0};
    static constexpr auto kDefaultDaysEnd{30};
    static constexpr auto kDefaultHourStart{0};
    static constexpr auto kDefaultHourEnd{24};

    /// Day-offset window relative to startDate (or today), inclusive both ends
    struct DaysAround
    {
        std::string startDate{}; ///< YYYY-MM-DD; empty = today
        int start{kDefaultDaysStart};
        int end{kDefaultDaysEnd};
    };

    /// Hour window [start, end)
    struct TimesAround
    {
        int start{kDefaultHourStart};
        int end{kDefaultHourEnd};
    };

    std::vector<std::string> zipCodes{};
    double miles{kDefaultMiles};
    bool pickLocation{kDefaultPickLocation}; ///< Interactive selection over the serial console
    bool sameDay{kDefaultSameDay};
    std::vector<int> preferredDays{}; ///< 0 = Sunday ... 6 = Saturday; empty = any
    DaysAround daysAround{};
    TimesAround timesAround{};

    [[nodiscard]] bool isConfigured() const
    {
        return !zipCodes.empty();
    }

    void restoreDefaults()
    {
        zipCodes.clear();
        miles = kDefaultMiles;
        pickLocation = kDefaultPickLocation;
        sameDay = kDefaultSameDay;
        preferredDays.clear();
        daysAround = DaysAround{};
        timesAround = TimesAround{};
    }
};

struct AppSettingsConfig
{
    static constexpr auto kDefaultIntervalMs{10'000}; // 10 seconds between rounds
    static constexpr auto kDefaultHeadersTimeoutMs{20'000}; // 20 seconds
    static constexpr auto kMaxHeadersTimeoutMs{65'535}; // HTTPClient read timeout is 16-bit
    static constexpr auto kDefaultMaxRetry{3};
    static constexpr auto kDefaultCancelIfExist{false};
    static constexpr auto kDefaultWebServer{false};
    static constexpr auto kDefaultWebServerPort{3000};
    static constexpr auto kDefaultTimezone{"CST6CDT,M3.2.0,M11.1.0"}; // America/Chicago

    std::uint32_t intervalMs{kDefaultIntervalMs};
    std::uint32_t headersTimeoutMs{kDefaultHeadersTimeoutMs};
    std::uint8_t maxRetry{kDefaultMaxRetry};
    bool cancelIfExist{kDefaultCancelIfExist};
    bool webServer{kDefaultWebServer};
    std::uint16_t webServerPort{kDefaultWebServerPort};
    std::string timezone{kDefaultTimezone}; ///< POSIX TZ string for SNTP local time

    [[nodiscard]] constexpr bool isConfigured() const // NOLINT
    {
        return true; // Always considered configured
    }

    void restoreDefaults()
    {
        intervalMs = kDefaultIntervalMs;
        headersTimeoutMs = kDefaultHeadersTimeoutMs;
        maxRetry = kDefaultMaxRetry;
        cancelIfExist = kDefaultCancelIfExist;
        webServer = kDefaultWebServer;
        webServerPort = kDefaultWebServerPort;
        timezone = kDefaultTimezone;
    }
};

struct WiFiConfig
{
    static constexpr auto kStationConnectionTimeoutMs{10'000}; // 10 seconds
    static constexpr auto kStationMaxFastConnectionAttempts{10};
    static constexpr auto kStationFastReconnectIntervalMs{5'000}; // 5 seconds
    static constexpr auto kStationSlowReconnectIntervalMs{600'000}; // 10 minutes

    std::string stationSsid{};
    std::string stationPassword{};
    std::uint32_t stationConnectionTimeoutMs{kStationConnectionTimeoutMs};
    std::uint32_t stationFastReconnectIntervalMs{kStationFastReconnectIntervalMs};
    std::uint32_t stationSlowReconnectIntervalMs{kStationSlowReconnectIntervalMs};
    std::uint8_t stationMaxFastConnectionAttempts{kStationMaxFastConnectionAttempts};

    [[nodiscard]] bool isConfigured() const
    {
        return !stationSsid.empty();
    }

    void restoreDefaults()
    {
        stationSsid.clear();
        stationPassword.clear();
        stationConnectionTimeoutMs = kStationConnectionTimeoutMs;
        stationFastReconnectIntervalMs = kStationFastReconnectIntervalMs;
        stationSlowReconnectIntervalMs = kStationSlowReconnectIntervalMs;
        stationMaxFastConnectionAttempts = kStationMaxFastConnectionAttempts;
    }
};

struct LogConfig
{
    static constexpr auto kDefaultColorOutput{true};

    bool colorOutput{kDefaultColorOutput};

    void restoreDefaults()
    {
        colorOutput = kDefaultColorOutput;
    }
};

struct Config
{
    PersonalInfoConfig personalInfo{};
    LocationConfig location{};
    AppSettingsConfig appSettings{};
    WiFiConfig wifi{};
    LogConfig log{};

    [[nodiscard]] bool isConfigured() const
    {
        return personalInfo.isConfigured() && location.isConfigured() && appSettings.isConfigured() && wifi.isConfigured();
    }

    /**
     * @brief Check field ranges and formats
     * @return Ok, or InvalidArg naming the first offending field
     */
    [[nodiscard]] Status validate() const;

    void restoreDefaults()
    {
        personalInfo.restoreDefaults();
        location.restoreDefaults();
        appSettings.restoreDefaults();
        wifi.restoreDefaults();
        log.restoreDefaults();
    }

    static Config makeDefault()
    {
        return Config{};
    }
};
} // namespace slotwatch

#endif // SLOTWATCH_CONFIG_HPP
