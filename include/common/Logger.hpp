#ifndef SLOTWATCH_COMMON_LOGGER_HPP
#define SLOTWATCH_COMMON_LOGGER_HPP

/**
 * @file Logger.hpp
 * @brief Leveled console logging with compile-time level selection.
 *
 * Lines are written as `[timestamp][L][Tag] message`. The timestamp is local
 * wall-clock time once it is known, uptime milliseconds before that.
 */

#include <cstddef>
#include <cstdint>

namespace slotwatch
{
enum class LogLevel : std::uint8_t
{
    Trace,
    Debug,
    Info,
    Warn,
    Error,

    Count // Sentinel for iteration
};

[[nodiscard]] inline constexpr const char *toString(LogLevel lvl) noexcept
{
    switch (lvl)
    {
        case LogLevel::Trace: return "T";
        case LogLevel::Debug: return "D";
        case LogLevel::Info: return "I";
        case LogLevel::Warn: return "W";
        case LogLevel::Error: return "E";
        default: return "?";
    }
}
} // namespace slotwatch

namespace slotwatch::log
{
// Compile-time log level configuration
#ifndef SLOTWATCH_LOG_LEVEL
#ifdef SLOTWATCH_DEBUG
#define SLOTWATCH_LOG_LEVEL 1 // Debug
#else
#define SLOTWATCH_LOG_LEVEL 2 // Info
#endif
#endif

/// Enable or disable ANSI colors (timestamp yellow, info green, warn yellow, error red)
void setColorOutput(bool enabled);

[[nodiscard]] bool colorOutput();

void logPrint(LogLevel level, const char *tag, const char *fmt, ...)
#if defined(__GNUC__)
        __attribute__((format(printf, 3, 4)))
#endif
        ;

/**
 * @brief printf into a fixed buffer
 *
 * A message longer than the buffer is cut and ends in "...".
 * @return false if the message was cut
 */
bool formatMessage(char *buf, std::size_t len, const char *fmt, ...)
#if defined(__GNUC__)
        __attribute__((format(printf, 3, 4)))
#endif
        ;

/// Print a raw line of any length (no timestamp or level), e.g. round separators or response bodies
void logRaw(const char *line, LogLevel level = LogLevel::Info);
} // namespace slotwatch::log

#if SLOTWATCH_LOG_LEVEL <= 0
#define LOG_TRACE(tag, fmt, ...) slotwatch::log::logPrint(slotwatch::LogLevel::Trace, tag, fmt, ##__VA_ARGS__)
#else
#define LOG_TRACE(tag, fmt, ...) ((void) 0)
#endif

#if SLOTWATCH_LOG_LEVEL <= 1
#define LOG_DEBUG(tag, fmt, ...) slotwatch::log::logPrint(slotwatch::LogLevel::Debug, tag, fmt, ##__VA_ARGS__)
#else
#define LOG_DEBUG(tag, fmt, ...) ((void) 0)
#endif

#if SLOTWATCH_LOG_LEVEL <= 2
#define LOG_INFO(tag, fmt, ...) slotwatch::log::logPrint(slotwatch::LogLevel::Info, tag, fmt, ##__VA_ARGS__)
#else
#define LOG_INFO(tag, fmt, ...) ((void) 0)
#endif

#if SLOTWATCH_LOG_LEVEL <= 3
#define LOG_WARN(tag, fmt, ...) slotwatch::log::logPrint(slotwatch::LogLevel::Warn, tag, fmt, ##__VA_ARGS__)
#else
#define LOG_WARN(tag, fmt, ...) ((void) 0)
#endif

#if SLOTWATCH_LOG_LEVEL <= 4
#define LOG_ERROR(tag, fmt, ...) slotwatch::log::logPrint(slotwatch::LogLevel::Error, tag, fmt, ##__VA_ARGS__)
#else
#define LOG_ERROR(tag, fmt, ...) ((void) 0)
#endif

#endif // SLOTWATCH_COMMON_LOGGER_HPP
