/**
 * @file main.cpp
 * @brief SlotWatch - ESP32 Firmware Entry Point
 *
 * Watches the Texas DPS public scheduler for an appointment slot inside the
 * configured date and hour window, then holds and books it.
 *
 * @note C++20 Standard - No C++23 features used.
 * @note Embedded-safe: No exceptions.
 *
 * Operation Flow:
 * 1. Mount LittleFS and load /config.json
 * 2. Connect WiFi and wait for SNTP time
 * 3. Check for an existing booking, then select locations
 * 4. Poll locations round after round until a slot is booked
 */

#include <Arduino.h>

#include "App.hpp"
#include "common/Logger.hpp"

namespace
{
constexpr auto *MAIN_TAG = "Main";
constexpr auto SERIAL_BAUD{115200};

slotwatch::App g_app{};
} // namespace

void setup()
{
    Serial.begin(SERIAL_BAUD);
    delay(100);

    if (const auto status = g_app.begin(); status.failed())
    {
        LOG_ERROR(MAIN_TAG, "Startup failed: %s", status.message ? status.message : slotwatch::toString(status.code));
    }
}

void loop()
{
    g_app.loop();

    if (g_app.getState() == slotwatch::App::AppState::Error || g_app.getState() == slotwatch::App::AppState::Finished)
    {
        delay(10);
    }
}
