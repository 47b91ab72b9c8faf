#include "common/Logger.hpp"

#include "platform/PlatformTime.hpp"

#include <cstdarg>
#include <cstdio>
#include <cstring>

#if defined(ARDUINO_ARCH_ESP32) || defined(SLOTWATCH_PLATFORM_ESP32)
#include <Arduino.h>
#endif

namespace slotwatch::log
{
namespace
{
constexpr auto *COLOR_RESET{"\x1b[0m"};
constexpr auto *COLOR_RED{"\x1b[31m"};
constexpr auto *COLOR_GREEN{"\x1b[32m"};
constexpr auto *COLOR_YELLOW{"\x1b[33m"};
constexpr char ELLIPSIS[]{"..."};

bool s_colorOutput{false};

const char *levelColor(const LogLevel level)
{
    switch (level)
    {
        case LogLevel::Info: return COLOR_GREEN;
        case LogLevel::Warn: return COLOR_YELLOW;
        case LogLevel::Error: return COLOR_RED;
        default: return "";
    }
}

void formatTimestamp(char *buf, const std::size_t len)
{
    if (const auto local = platform::getLocalTime())
    {
        // MM/DD/YYYY h:mm:ss, 12-hour clock without AM/PM
        auto hour{local->tm_hour % 12};
        if (hour == 0)
        {
            hour = 12;
        }
        std::snprintf(buf, len, "%02d/%02d/%04d %d:%02d:%02d",
                      local->tm_mon + 1, local->tm_mday, local->tm_year + 1900,
                      hour, local->tm_min, local->tm_sec);
        return;
    }
    std::snprintf(buf, len, "%6lu", static_cast<unsigned long>(platform::uptimeMs()));
}

bool formatMessageV(char *buf, const std::size_t len, const char *fmt, va_list args)
{
    const auto written{std::vsnprintf(buf, len, fmt, args)};
    if (written < 0)
    {
        buf[0] = '\0';
        return false;
    }
    if (static_cast<std::size_t>(written) < len)
    {
        return true;
    }
    if (len >= sizeof(ELLIPSIS))
    {
        std::memcpy(buf + len - sizeof(ELLIPSIS), ELLIPSIS, sizeof(ELLIPSIS));
    }
    return false;
}

void writeLine(const LogLevel level, const char *line)
{
#if defined(ARDUINO_ARCH_ESP32) || defined(SLOTWATCH_PLATFORM_ESP32)
    (void) level;
    Serial.println(line);
#else
    auto *stream{(level >= LogLevel::Warn) ? stderr : stdout};
    std::fputs(line, stream);
    std::fputc('\n', stream);
    std::fflush(stream);
#endif
}
} // namespace

void setColorOutput(const bool enabled)
{
    s_colorOutput = enabled;
}

bool colorOutput()
{
    return s_colorOutput;
}

bool formatMessage(char *buf, const std::size_t len, const char *fmt, ...)
{
    va_list args;
    va_start(args, fmt);
    const auto complete{formatMessageV(buf, len, fmt, args)};
    va_end(args);
    return complete;
}

void logPrint(const LogLevel level, const char *tag, const char *fmt, ...)
{
    char message[512];
    va_list args;
    va_start(args, fmt);
    formatMessageV(message, sizeof(message), fmt, args);
    va_end(args);

    char timestamp[32];
    formatTimestamp(timestamp, sizeof(timestamp));

    char line[640];
    if (s_colorOutput)
    {
        std::snprintf(line, sizeof(line), "%s[%s]%s[%s][%s] %s%s%s",
                      COLOR_YELLOW, timestamp, COLOR_RESET,
                      toString(level), tag,
                      levelColor(level), message, COLOR_RESET);
    }
    else
    {
        std::snprintf(line, sizeof(line), "[%s][%s][%s] %s", timestamp, toString(level), tag, message);
    }

    writeLine(level, line);
}

void logRaw(const char *line, const LogLevel level)
{
    writeLine(level, line);
}
} // namespace slotwatch::log
