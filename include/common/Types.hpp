#ifndef SLOTWATCH_COMMON_TYPES_HPP
#define SLOTWATCH_COMMON_TYPES_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace slotwatch
{
enum class StatusCode : std::uint8_t
{
    Ok = 0, ///< Operation completed successfully
    Error, ///< Generic error occurred
    NotReady, ///< Resource not ready for operation
    InvalidArg, ///< Invalid argument provided
    NotFound, ///< Requested resource not found
    NetworkError, ///< Transport-level failure (no HTTP response)
    ParseError, ///< Response or document could not be decoded
    Fatal, ///< Unrecoverable for this run (retry ceiling exhausted)

    _Count, // NOLINT - Sentinel value for enum iteration
};

inline const char *toString(const StatusCode code)
{
    switch (code)
    {
        case StatusCode::Ok: return "ok";
        case StatusCode::Error: return "error";
        case StatusCode::NotReady: return "not_ready";
        case StatusCode::InvalidArg: return "invalid_arg";
        case StatusCode::NotFound: return "not_found";
        case StatusCode::NetworkError: return "network_error";
        case StatusCode::ParseError: return "parse_error";
        case StatusCode::Fatal: return "fatal";
        default: return "unknown";
    }
}

/**
 * @brief Status result wrapper for operations
 *
 * Combines a status code with an optional error message.
 * Messages are static strings; dynamic detail is logged at the failure site.
 *
 * Example usage:
 * @code
 * Status result = someOperation();
 * if (result.failed()) {
 *     LOG_ERROR(TAG, "Operation failed: %s", result.message);
 * }
 * @endcode
 */
struct Status
{
    StatusCode code{StatusCode::Ok};
    const char *message{nullptr};

    // Convenience query methods
    [[nodiscard]] bool ok() const
    {
        return code == StatusCode::Ok;
    }

    [[nodiscard]] bool failed() const
    {
        return code != StatusCode::Ok;
    }

    [[nodiscard]] bool isFatal() const
    {
        return code == StatusCode::Fatal;
    }

    // Factory methods for common status results
    static Status Ok()
    {
        return {StatusCode::Ok, nullptr};
    }

    static Status Error(const char *msg = nullptr)
    {
        return {StatusCode::Error, msg};
    }

    static Status NotReady(const char *msg = nullptr)
    {
        return {StatusCode::NotReady, msg};
    }

    static Status InvalidArg(const char *msg = nullptr)
    {
        return {StatusCode::InvalidArg, msg};
    }

    static Status NotFound(const char *msg = nullptr)
    {
        return {StatusCode::NotFound, msg};
    }

    static Status ParseError(const char *msg = nullptr)
    {
        return {StatusCode::ParseError, msg};
    }

    static Status Fatal(const char *msg = nullptr)
    {
        return {StatusCode::Fatal, msg};
    }
};

/// Appointment type used when none is configured (new driver license)
inline constexpr int DEFAULT_SERVICE_TYPE_ID{71};

/**
 * @brief Office returned by the location search
 *
 * @note Immutable once selected into the scan set
 */
struct Location
{
    int id{0};
    std::string name{};
    std::string address{};
    double distance{0.0}; ///< Miles from zipCode
    std::string zipCode{}; ///< Zip code the search was issued for
};

/**
 * @brief A single bookable slot at one location
 */
struct TimeSlot
{
    int slotId{0};
    int duration{0}; ///< Minutes
    std::string startDateTime{}; ///< ISO local wall clock, e.g. "2024-05-10T10:00:00"
    std::string formattedStartDateTime{}; ///< Human text as rendered by the API
};

/**
 * @brief One calendar date with its slots, in API order
 */
struct AvailabilityDate
{
    std::string availabilityDate{}; ///< ISO date or date-time
    std::vector<TimeSlot> timeSlots{};
};

/**
 * @brief A booking the operator already holds
 */
struct ExistingBooking
{
    std::string confirmationNumber{};
    std::string siteName{};
    std::string bookingDateTime{};
    int serviceTypeId{0};
};

enum class BookingState : std::uint8_t
{
    Idle = 0, ///< Scanning, nothing in flight
    Holding, ///< Hold request issued
    Booking, ///< Slot held, booking in progress
    Booked, ///< Terminal success
    Failed, ///< Last attempt rejected; not in flight

    _Count, // NOLINT
};

inline const char *toString(const BookingState bookingState)
{
    switch (bookingState)
    {
        case BookingState::Idle: return "idle";
        case BookingState::Holding: return "holding";
        case BookingState::Booking: return "booking";
        case BookingState::Booked: return "booked";
        case BookingState::Failed: return "failed";
        default: return "unknown";
    }
}

enum class BookingOutcome : std::uint8_t
{
    Skipped = 0, ///< Another attempt in flight (or already booked); no side effects
    HoldRejected, ///< API refused the hold; polling resumed
    BookRejected, ///< API returned no booking; polling resumed
    Booked, ///< Appointment confirmed
    PolicyAbort, ///< Existing booking present and auto-cancel disabled
    Fatal, ///< Transport gave up

    _Count, // NOLINT
};

inline const char *toString(const BookingOutcome outcome)
{
    switch (outcome)
    {
        case BookingOutcome::Skipped: return "skipped";
        case BookingOutcome::HoldRejected: return "hold_rejected";
        case BookingOutcome::BookRejected: return "book_rejected";
        case BookingOutcome::Booked: return "booked";
        case BookingOutcome::PolicyAbort: return "policy_abort";
        case BookingOutcome::Fatal: return "fatal";
        default: return "unknown";
    }
}

/// Outcomes after which the run is over
inline bool isTerminal(const BookingOutcome outcome)
{
    return outcome == BookingOutcome::Booked || outcome == BookingOutcome::PolicyAbort || outcome == BookingOutcome::Fatal;
}

enum class WiFiState : std::uint8_t
{
    Disconnected = 0, ///< Not connected to any network
    Connecting, ///< Attempting to connect
    Connected, ///< Successfully connected to WiFi
    Error, ///< Connection error occurred

    _Count, // NOLINT
};

inline const char *toString(const WiFiState wifiState)
{
    switch (wifiState)
    {
        case WiFiState::Disconnected: return "disconnected";
        case WiFiState::Connecting: return "connecting";
        case WiFiState::Connected: return "connected";
        case WiFiState::Error: return "error";
        default: return "unknown";
    }
}

/**
 * @brief Base metrics structure for all services
 *
 * Provides common telemetry fields inherited by service-specific metrics.
 */
struct ServiceMetrics
{
    std::uint32_t operationCount{0}; ///< Total operations performed
    std::uint32_t errorCount{0}; ///< Total errors encountered
    std::uint32_t lastOperationMs{0}; ///< Timestamp of last operation
};

/**
 * @brief Transport metrics
 */
struct TransportMetrics
{
    std::uint32_t requests{0}; ///< Logical requests issued
    std::uint32_t attempts{0}; ///< Wire attempts including retries
    std::uint32_t retries{0}; ///< Attempts that were retries
    std::uint32_t fatalFailures{0}; ///< Requests that exhausted the ceiling
};

/**
 * @brief Poll scheduler metrics
 */
struct PollMetrics : ServiceMetrics
{
    std::uint32_t roundsCompleted{0}; ///< Full passes over the location set
    std::uint32_t locationsChecked{0}; ///< Individual availability checks
    std::uint32_t candidatesFound{0}; ///< Checks that produced a candidate slot
    std::uint32_t roundsSkipped{0}; ///< Rounds skipped for lack of a reference date
};

/**
 * @brief Booking state machine metrics
 */
struct BookingMetrics
{
    std::uint32_t attempts{0}; ///< Attempts that reached the hold request
    std::uint32_t skipped{0}; ///< Attempts rejected by the in-flight guard
    std::uint32_t holdFailures{0};
    std::uint32_t bookFailures{0};
    std::uint32_t cancellations{0}; ///< Existing bookings cancelled before booking
};

/**
 * @brief WiFi service metrics
 *
 * Monitors WiFi connectivity and signal quality.
 */
struct WiFiMetrics : ServiceMetrics
{
    std::int8_t rssi{0}; ///< Signal strength (dBm)
    std::uint32_t disconnectCount{0}; ///< Disconnect event count
    bool connected{false}; ///< Current connection status
};
} // namespace slotwatch

#endif // SLOTWATCH_COMMON_TYPES_HPP
