#include "services/ConfigService.hpp"

#include "common/Logger.hpp"
#include "storage/IFileStore.hpp"

#include <ArduinoJson.h>

#include <cstdint>
#include <limits>

namespace slotwatch
{
namespace
{
constexpr auto *TAG{"ConfigService"};

void parseZipCodes(const JsonArrayConst zips, std::vector<std::string> &out)
{
    out.clear();
    for (const auto zip: zips)
    {
        if (zip.is<const char *>())
        {
            out.emplace_back(zip.as<const char *>());
        }
        else if (zip.is<long>())
        {
            out.push_back(std::to_string(zip.as<long>()));
        }
    }
}
/**
 * @brief Copy an integer setting into a narrower field
 *
 * An absent key keeps the current value. A present value must be an integer
 * that fits T, otherwise @p error is returned.
 */
template<typename T>
Status readInteger(const JsonVariantConst value, T &out, const char *error)
{
    if (value.isNull())
    {
        return Status::Ok();
    }
    if (!value.is<std::int64_t>())
    {
        return Status::InvalidArg(error);
    }

    const auto raw{value.as<std::int64_t>()};
    if (raw < static_cast<std::int64_t>(std::numeric_limits<T>::min()) ||
        raw > static_cast<std::int64_t>(std::numeric_limits<T>::max()))
    {
        return Status::InvalidArg(error);
    }
    out = static_cast<T>(raw);
    return Status::Ok();
}

Result<Config> rejected(const Status status)
{
    LOG_WARN(TAG, "Config rejected: %s", status.message);
    return Result<Config>::Error(status);
}
} // namespace

ConfigService::ConfigService(IFileStore &store)
    : ServiceBase("ConfigService")
    , m_store(store)
{
}

Status ConfigService::begin()
{
    setState(ServiceState::Initializing);

    const auto contents{m_store.readFile(CONFIG_PATH)};
    if (contents.failed())
    {
        LOG_ERROR(m_name, "Cannot read %s: %s", CONFIG_PATH, toString(contents.status.code));
        setState(ServiceState::Error);
        return contents.status;
    }

    auto parsed{parse(contents.value)};
    if (parsed.failed())
    {
        LOG_ERROR(m_name, "Invalid configuration: %s", parsed.status.message ? parsed.status.message : toString(parsed.status.code));
        setState(ServiceState::Error);
        return parsed.status;
    }

    m_config = std::move(parsed.value);
    log::setColorOutput(m_config.log.colorOutput);

    LOG_INFO(m_name, "Config loaded: %u zip code(s), window +%d..+%d days, %02d:00-%02d:00, interval %ums",
             static_cast<unsigned>(m_config.location.zipCodes.size()),
             m_config.location.daysAround.start, m_config.location.daysAround.end,
             m_config.location.timesAround.start, m_config.location.timesAround.end,
             m_config.appSettings.intervalMs);

    setState(ServiceState::Running);
    return Status::Ok();
}

void ConfigService::loop()
{
    // Configuration is read once at boot
}

void ConfigService::end()
{
    setState(ServiceState::Stopped);
}

Result<Config> ConfigService::parse(const std::string &json)
{
    JsonDocument doc{};
    if (const auto err = deserializeJson(doc, json); err)
    {
        LOG_ERROR(TAG, "JSON parse error: %s", err.c_str());
        return Result<Config>::Error(Status::ParseError("Config JSON malformed"));
    }

    auto cfg{Config::makeDefault()};
    const auto root{doc.as<JsonObjectConst>()};
    Status status{};

    // Personal info
    if (const auto info = root["personalInfo"].as<JsonObjectConst>())
    {
        cfg.personalInfo.firstName = info["firstName"] | cfg.personalInfo.firstName;
        cfg.personalInfo.lastName = info["lastName"] | cfg.personalInfo.lastName;
        cfg.personalInfo.dob = info["dob"] | cfg.personalInfo.dob;
        cfg.personalInfo.lastFourSsn = info["lastFourSSN"] | cfg.personalInfo.lastFourSsn;
        cfg.personalInfo.email = info["email"] | cfg.personalInfo.email;
        cfg.personalInfo.phoneNumber = info["phoneNumber"] | cfg.personalInfo.phoneNumber;
        if (status = readInteger(info["typeId"], cfg.personalInfo.typeId, "personalInfo.typeId must be an integer");
            status.failed())
        {
            return rejected(status);
        }
    }

    // Location
    if (const auto loc = root["location"].as<JsonObjectConst>())
    {
        if (loc["zipCode"].is<JsonArrayConst>())
        {
            parseZipCodes(loc["zipCode"].as<JsonArrayConst>(), cfg.location.zipCodes);
        }
        cfg.location.miles = loc["miles"] | cfg.location.miles;
        cfg.location.pickLocation = loc["pickDPSLocation"] | cfg.location.pickLocation;
        cfg.location.sameDay = loc["sameDay"] | cfg.location.sameDay;

        if (loc["preferredDays"].is<JsonArrayConst>())
        {
            cfg.location.preferredDays.clear();
            for (const auto day: loc["preferredDays"].as<JsonArrayConst>())
            {
                if (!day.is<int>())
                {
                    return rejected(Status::InvalidArg("location.preferredDays entries must be 0..6"));
                }
                cfg.location.preferredDays.push_back(day.as<int>());
            }
        }

        if (const auto days = loc["daysAround"].as<JsonObjectConst>())
        {
            if (days["startDate"].is<const char *>())
            {
                cfg.location.daysAround.startDate = days["startDate"].as<const char *>();
            }
            if (status = readInteger(days["start"], cfg.location.daysAround.start, "location.daysAround.start must be an integer");
                status.failed())
            {
                return rejected(status);
            }
            if (status = readInteger(days["end"], cfg.location.daysAround.end, "location.daysAround.end must be an integer");
                status.failed())
            {
                return rejected(status);
            }
        }

        if (const auto times = loc["timesAround"].as<JsonObjectConst>())
        {
            if (status = readInteger(times["start"], cfg.location.timesAround.start, "location.timesAround.start must be an integer");
                status.failed())
            {
                return rejected(status);
            }
            if (status = readInteger(times["end"], cfg.location.timesAround.end, "location.timesAround.end must be an integer");
                status.failed())
            {
                return rejected(status);
            }
        }
    }

    // App settings
    if (const auto app = root["appSettings"].as<JsonObjectConst>())
    {
        if (status = readInteger(app["interval"], cfg.appSettings.intervalMs, "appSettings.interval must be 1..4294967295 ms");
            status.failed())
        {
            return rejected(status);
        }
        if (status = readInteger(app["headersTimeout"], cfg.appSettings.headersTimeoutMs, "appSettings.headersTimeout must be 1..65535 ms");
            status.failed())
        {
            return rejected(status);
        }
        if (status = readInteger(app["maxRetry"], cfg.appSettings.maxRetry, "appSettings.maxRetry must be 0..255"); status.failed())
        {
            return rejected(status);
        }
        if (status = readInteger(app["webserverPort"], cfg.appSettings.webServerPort, "appSettings.webserverPort must be 0..65535");
            status.failed())
        {
            return rejected(status);
        }
        cfg.appSettings.cancelIfExist = app["cancelIfExist"] | cfg.appSettings.cancelIfExist;
        cfg.appSettings.webServer = app["webserver"] | cfg.appSettings.webServer;
        cfg.appSettings.timezone = app["timezone"] | cfg.appSettings.timezone;
    }

    // WiFi
    if (const auto wifi = root["wifi"].as<JsonObjectConst>())
    {
        cfg.wifi.stationSsid = wifi["ssid"] | cfg.wifi.stationSsid;
        cfg.wifi.stationPassword = wifi["password"] | cfg.wifi.stationPassword;
        if (status = readInteger(wifi["connectTimeoutMs"], cfg.wifi.stationConnectionTimeoutMs, "wifi.connectTimeoutMs must be 0..4294967295");
            status.failed())
        {
            return rejected(status);
        }
    }

    // Log
    if (const auto log = root["log"].as<JsonObjectConst>())
    {
        cfg.log.colorOutput = log["colorOutput"] | cfg.log.colorOutput;
    }

    if (status = cfg.validate(); status.failed())
    {
        return rejected(status);
    }

    return Result<Config>::Ok(std::move(cfg));
}
} // namespace slotwatch
