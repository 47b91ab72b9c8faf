#ifndef SLOTWATCH_PLATFORM_TIME_HPP
#define SLOTWATCH_PLATFORM_TIME_HPP

/**
 * @file PlatformTime.hpp
 * @brief Uptime and wall-clock helpers for ESP32 and the native test build
 *
 * ESP32 reads the Arduino tick counter; the native build (unit tests on the
 * development host) uses the standard steady clock. Wall-clock access is
 * shared: both targets provide time()/localtime_r once SNTP (or the host OS)
 * has set the clock.
 */

#include <cstdint>
#include <ctime>
#include <optional>

// ============================================================================
// ESP32 Implementation
// ============================================================================

#if defined(ARDUINO_ARCH_ESP32) || defined(SLOTWATCH_PLATFORM_ESP32)

#include <Arduino.h>

namespace slotwatch::platform
{
/// Milliseconds since boot (wraps after ~49 days)
inline std::uint32_t uptimeMs()
{
    return millis();
}
} // namespace slotwatch::platform

// ============================================================================
// Native Implementation - host builds and unit tests
// ============================================================================

#elif defined(SLOTWATCH_PLATFORM_NATIVE)

#include <chrono>

namespace slotwatch::platform
{
/// Milliseconds since first call (wraps after ~49 days)
inline std::uint32_t uptimeMs()
{
    static const auto start{std::chrono::steady_clock::now()};
    const auto elapsed{std::chrono::steady_clock::now() - start};
    return static_cast<std::uint32_t>(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count());
}
} // namespace slotwatch::platform

#else
#error "Unsupported platform: Define ARDUINO_ARCH_ESP32 or SLOTWATCH_PLATFORM_NATIVE"
#endif

namespace slotwatch::platform
{
/**
 * @brief Current local time, if the wall clock has been set
 *
 * @return Broken-down local time, or nullopt before SNTP sync
 *
 * @note Threshold: considers time valid only after 2020-09-13
 */
inline std::optional<std::tm> getLocalTime()
{
    const auto now{time(nullptr)};
    if (static_cast<std::int64_t>(now) <= 1'600'000'000)
    {
        return std::nullopt;
    }

    std::tm local{};
    localtime_r(&now, &local);
    return local;
}
} // namespace slotwatch::platform

#endif // SLOTWATCH_PLATFORM_TIME_HPP
