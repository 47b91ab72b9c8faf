#include "services/LocationService.hpp"

#include "api/SchedulerApi.hpp"
#include "common/Logger.hpp"
#include "storage/IFileStore.hpp"

#include <ArduinoJson.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <iterator>
#include <unordered_set>
#include <utility>

namespace slotwatch
{
namespace
{
constexpr auto *TAG{"LocationService"};

std::string joinNames(const std::vector<Location> &locations)
{
    std::string names;
    for (const auto &location: locations)
    {
        if (!names.empty())
        {
            names += ", ";
        }
        names += location.name;
    }
    return names;
}
} // namespace

LocationService::LocationService(SchedulerApi &api, IFileStore &store, const LocationConfig &config, ILocationPrompt *prompt)
    : ServiceBase("LocationService")
    , m_api(api)
    , m_store(store)
    , m_config(config)
    , m_prompt(prompt)
{
}

Status LocationService::begin()
{
    setState(ServiceState::Initializing);
    m_selected.clear();

    const auto discovered{discover()};
    if (discovered.failed())
    {
        setState(ServiceState::Error);
        return discovered.status;
    }

    const auto status{m_config.pickLocation ? selectInteractive(discovered.value) : selectByDistance(discovered.value)};
    if (status.failed())
    {
        setState(status.code == StatusCode::NotFound ? ServiceState::Stopped : ServiceState::Error);
        return status;
    }

    setState(ServiceState::Running);
    return Status::Ok();
}

void LocationService::loop()
{
    // Selection happens once at startup
}

void LocationService::end()
{
    setState(ServiceState::Stopped);
}

Result<std::vector<Location>> LocationService::discover()
{
    std::vector<Location> all{};
    for (const auto &zipCode: m_config.zipCodes)
    {
        auto found{m_api.searchLocations(zipCode)};
        if (found.failed())
        {
            LOG_ERROR(m_name, "Location search for %s failed: %s", zipCode.c_str(), toString(found.status.code));
            if (found.status.isFatal())
            {
                return Result<std::vector<Location>>::Error(found.status);
            }
            return Result<std::vector<Location>>::Error(Status::Fatal("Location search reply unusable"));
        }
        LOG_DEBUG(m_name, "%u location(s) near %s", static_cast<unsigned>(found.value.size()), zipCode.c_str());
        all.insert(all.end(), found.value.begin(), found.value.end());
    }
    return Result<std::vector<Location>>::Ok(mergeByDistance(std::move(all)));
}

Status LocationService::selectInteractive(const std::vector<Location> &discovered)
{
    if (m_store.exists(CACHE_PATH))
    {
        const auto contents{m_store.readFile(CACHE_PATH)};
        auto cached{contents.ok() ? fromCacheJson(contents.value) : Result<std::vector<Location>>::Error(contents.status)};
        if (cached.ok() && !cached.value.empty())
        {
            m_selected = std::move(cached.value);
            LOG_INFO(m_name, "Found location selection cache. To reset, delete %s.", CACHE_PATH);
            return Status::Ok();
        }
        LOG_WARN(m_name, "Ignoring unreadable location cache %s", CACHE_PATH);
    }

    if (m_prompt == nullptr)
    {
        LOG_ERROR(m_name, "Interactive location selection is not available on this build");
        return Status::Fatal("No location prompt");
    }

    for (const auto index: m_prompt->choose(discovered))
    {
        m_selected.push_back(discovered[index]);
    }
    if (m_selected.empty())
    {
        LOG_ERROR(m_name, "You must choose at least one location.");
        return Status::Fatal("No location chosen");
    }

    if (const auto status = m_store.writeFile(CACHE_PATH, toCacheJson(m_selected)); status.failed())
    {
        LOG_WARN(m_name, "Could not write %s: %s", CACHE_PATH, toString(status.code));
    }
    LOG_INFO(m_name, "Selected %u location(s): %s", static_cast<unsigned>(m_selected.size()), joinNames(m_selected).c_str());
    return Status::Ok();
}

Status LocationService::selectByDistance(const std::vector<Location> &discovered)
{
    m_selected = withinMiles(discovered, m_config.miles);
    if (m_selected.empty())
    {
        if (discovered.empty())
        {
            LOG_ERROR(m_name, "No locations found. Please update your settings and try again.");
        }
        else
        {
            LOG_ERROR(m_name, "No locations found. The nearest location is %g miles away. Please update your settings and try again.",
                      discovered.front().distance);
        }
        return Status::NotFound("No locations within range");
    }

    LOG_INFO(m_name, "Found %u locations that match your settings.", static_cast<unsigned>(m_selected.size()));
    LOG_INFO(m_name, "%s", joinNames(m_selected).c_str());
    return Status::Ok();
}

std::vector<Location> LocationService::mergeByDistance(std::vector<Location> locations)
{
    std::stable_sort(locations.begin(), locations.end(),
                     [](const Location &a, const Location &b) { return a.distance < b.distance; });

    std::unordered_set<int> seen{};
    std::vector<Location> merged{};
    for (auto &location: locations)
    {
        if (seen.insert(location.id).second)
        {
            merged.push_back(std::move(location));
        }
    }
    return merged;
}

std::vector<Location> LocationService::withinMiles(const std::vector<Location> &locations, const double miles)
{
    std::vector<Location> near{};
    std::copy_if(locations.begin(), locations.end(), std::back_inserter(near),
                 [miles](const Location &location) { return location.distance < miles; });
    return near;
}

std::string LocationService::describe(const Location &location)
{
    char distance[24]{};
    std::snprintf(distance, sizeof(distance), "%g", location.distance);
    return location.name + " - " + location.address + " - " + distance + " miles away from " + location.zipCode + "!";
}

std::vector<std::size_t> LocationService::parseSelection(const std::string &input, const std::size_t count)
{
    std::vector<std::size_t> indices{};
    std::size_t value{0};
    bool haveDigits{false};
    bool valid{true};

    const auto flush = [&]() {
        if (haveDigits && valid && value >= 1 && value <= count &&
            std::find(indices.begin(), indices.end(), value - 1) == indices.end())
        {
            indices.push_back(value - 1);
        }
        value = 0;
        haveDigits = false;
        valid = true;
    };

    for (const auto c: input)
    {
        const auto uc{static_cast<unsigned char>(c)};
        if (c == ',')
        {
            flush();
        }
        else if (std::isdigit(uc) != 0)
        {
            haveDigits = true;
            value = value < count + 1 ? value * 10 + static_cast<std::size_t>(c - '0') : value;
        }
        else if (std::isspace(uc) == 0)
        {
            valid = false;
        }
    }
    flush();
    return indices;
}

std::string LocationService::toCacheJson(const std::vector<Location> &locations)
{
    JsonDocument doc;
    const auto arr{doc.to<JsonArray>()};

    for (const auto &location: locations)
    {
        const auto obj{arr.add<JsonObject>()};
        obj["Id"] = location.id;
        obj["Name"] = location.name;
        obj["Address"] = location.address;
        obj["Distance"] = location.distance;
        obj["ZipCode"] = location.zipCode;
    }

    std::string json;
    serializeJson(doc, json);
    return json;
}

Result<std::vector<Location>> LocationService::fromCacheJson(const std::string &json)
{
    JsonDocument doc;
    if (const auto err = deserializeJson(doc, json); err)
    {
        LOG_WARN(TAG, "Location cache parse error: %s", err.c_str());
        return Result<std::vector<Location>>::Error(Status::ParseError("Location cache malformed"));
    }
    if (!doc.is<JsonArrayConst>())
    {
        return Result<std::vector<Location>>::Error(Status::ParseError("Location cache is not an array"));
    }

    std::vector<Location> locations{};
    for (const auto item: doc.as<JsonArrayConst>())
    {
        locations.push_back(Location{
                .id = item["Id"] | 0,
                .name = item["Name"] | "",
                .address = item["Address"] | "",
                .distance = item["Distance"] | 0.0,
                .zipCode = item["ZipCode"] | "",
        });
    }
    return Result<std::vector<Location>>::Ok(std::move(locations));
}
} // namespace slotwatch
