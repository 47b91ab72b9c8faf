#include "services/SerialLocationPrompt.hpp"

#include "common/Logger.hpp"

#include <Arduino.h>

namespace slotwatch
{
namespace
{
constexpr auto *TAG{"LocationPrompt"};
} // namespace

std::vector<std::size_t> SerialLocationPrompt::choose(const std::vector<Location> &locations)
{
    LOG_INFO(TAG, "Choose DPS Location (comma-separated numbers, then Enter):");
    for (std::size_t i{0}; i < locations.size(); ++i)
    {
        Serial.printf("%u. %s\n", static_cast<unsigned>(i + 1), LocationService::describe(locations[i]).c_str());
    }
    Serial.print("> ");

    // Drop anything typed before the prompt
    while (Serial.available() > 0)
    {
        Serial.read();
    }

    Serial.setTimeout(m_timeoutMs);
    const auto line{Serial.readStringUntil('\n')};
    Serial.println();

    return LocationService::parseSelection(line.c_str(), locations.size());
}
} // namespace slotwatch
