#include <catch2/catch_test_macros.hpp>

#include "common/Logger.hpp"
#include "services/ConfigService.hpp"
#include "support/MemoryFileStore.hpp"

#include <string>

using namespace slotwatch;
using slotwatch::test::MemoryFileStore;

namespace
{
constexpr auto *kValidConfig{R"({
  "personalInfo": { "firstName": "Jane", "lastName": "Doe", "dob": "01/02/1990",
                    "lastFourSSN": "1234", "email": "jane@example.com", "phoneNumber": "5125550100" },
  "location": { "zipCode": ["78701", 78664], "miles": 15, "pickDPSLocation": false,
                "sameDay": false, "preferredDays": [1, 3],
                "daysAround": { "startDate": "2024-05-01", "start": 2, "end": 14 },
                "timesAround": { "start": 8, "end": 12 } },
  "appSettings": { "interval": 15000, "headersTimeout": 5000, "maxRetry": 2,
                   "cancelIfExist": true, "webserver": true, "webserverPort": 8080 },
  "wifi": { "ssid": "home", "password": "secret" },
  "log": { "colorOutput": false }
})"};

std::string withField(const std::string &from, const std::string &to)
{
    std::string json{kValidConfig};
    const auto pos{json.find(from)};
    REQUIRE(pos != std::string::npos);
    json.replace(pos, from.size(), to);
    return json;
}
} // namespace

TEST_CASE("A complete configuration parses into typed settings", "[config]")
{
    const auto result{ConfigService::parse(kValidConfig)};
    REQUIRE(result.ok());

    const auto &cfg{result.value};
    REQUIRE(cfg.personalInfo.firstName == "Jane");
    REQUIRE(cfg.personalInfo.typeId == DEFAULT_SERVICE_TYPE_ID);
    REQUIRE(cfg.location.zipCodes == std::vector<std::string>{"78701", "78664"});
    REQUIRE(cfg.location.miles == 15.0);
    REQUIRE(cfg.location.preferredDays == std::vector<int>{1, 3});
    REQUIRE(cfg.location.daysAround.startDate == "2024-05-01");
    REQUIRE(cfg.location.daysAround.start == 2);
    REQUIRE(cfg.location.daysAround.end == 14);
    REQUIRE(cfg.location.timesAround.start == 8);
    REQUIRE(cfg.location.timesAround.end == 12);
    REQUIRE(cfg.appSettings.intervalMs == 15000);
    REQUIRE(cfg.appSettings.headersTimeoutMs == 5000);
    REQUIRE(cfg.appSettings.maxRetry == 2);
    REQUIRE(cfg.appSettings.cancelIfExist);
    REQUIRE(cfg.appSettings.webServer);
    REQUIRE(cfg.appSettings.webServerPort == 8080);
    REQUIRE(cfg.wifi.stationSsid == "home");
    REQUIRE_FALSE(cfg.log.colorOutput);
    REQUIRE(cfg.isConfigured());
}

TEST_CASE("Omitted settings keep their defaults", "[config]")
{
    const auto result{ConfigService::parse(R"({
      "personalInfo": { "firstName": "Jane", "lastName": "Doe", "dob": "01/02/1990",
                        "lastFourSSN": "1234", "email": "jane@example.com" },
      "location": { "zipCode": ["78701"] }
    })")};
    REQUIRE(result.ok());

    const auto &cfg{result.value};
    REQUIRE(cfg.appSettings.intervalMs == AppSettingsConfig::kDefaultIntervalMs);
    REQUIRE(cfg.appSettings.headersTimeoutMs == AppSettingsConfig::kDefaultHeadersTimeoutMs);
    REQUIRE(cfg.appSettings.maxRetry == AppSettingsConfig::kDefaultMaxRetry);
    REQUIRE(cfg.appSettings.webServerPort == AppSettingsConfig::kDefaultWebServerPort);
    REQUIRE_FALSE(cfg.appSettings.cancelIfExist);
    REQUIRE(cfg.location.miles == LocationConfig::kDefaultMiles);
    REQUIRE(cfg.location.daysAround.end == LocationConfig::kDefaultDaysEnd);
    REQUIRE(cfg.location.timesAround.end == 24);
    REQUIRE(cfg.location.daysAround.startDate.empty());
    REQUIRE(cfg.personalInfo.typeId == 71);
}

TEST_CASE("Invalid settings are rejected with the offending field", "[config]")
{
    SECTION("malformed JSON")
    {
        REQUIRE(ConfigService::parse("{ not json").status.code == StatusCode::ParseError);
    }

    SECTION("date of birth format")
    {
        const auto result{ConfigService::parse(withField("01/02/1990", "1990-01-02"))};
        REQUIRE(result.status.code == StatusCode::InvalidArg);
        REQUIRE(std::string{result.status.message}.find("dob") != std::string::npos);
    }

    SECTION("SSN digits")
    {
        REQUIRE(ConfigService::parse(withField(R"("1234")", R"("12a4")")).status.code == StatusCode::InvalidArg);
    }

    SECTION("empty zip list")
    {
        REQUIRE(ConfigService::parse(withField(R"(["78701", 78664])", "[]")).status.code == StatusCode::InvalidArg);
    }

    SECTION("inverted day window")
    {
        REQUIRE(ConfigService::parse(withField(R"("start": 2, "end": 14)", R"("start": 20, "end": 14)")).failed());
    }

    SECTION("empty hour window")
    {
        REQUIRE(ConfigService::parse(withField(R"("start": 8, "end": 12)", R"("start": 12, "end": 12)")).failed());
    }

    SECTION("hour past midnight")
    {
        REQUIRE(ConfigService::parse(withField(R"("start": 8, "end": 12)", R"("start": 8, "end": 25)")).failed());
    }

    SECTION("weekday out of range")
    {
        REQUIRE(ConfigService::parse(withField("[1, 3]", "[1, 7]")).failed());
    }

    SECTION("start date format")
    {
        REQUIRE(ConfigService::parse(withField("2024-05-01", "05/01/2024")).failed());
    }

    SECTION("zero interval")
    {
        REQUIRE(ConfigService::parse(withField(R"("interval": 15000)", R"("interval": 0)")).failed());
    }

    SECTION("negative interval")
    {
        const auto result{ConfigService::parse(withField(R"("interval": 15000)", R"("interval": -5)"))};
        REQUIRE(result.status.code == StatusCode::InvalidArg);
        REQUIRE(std::string{result.status.message}.find("appSettings.interval") != std::string::npos);
    }

    SECTION("retry count wider than its field")
    {
        const auto result{ConfigService::parse(withField(R"("maxRetry": 2)", R"("maxRetry": 300)"))};
        REQUIRE(result.status.code == StatusCode::InvalidArg);
        REQUIRE(std::string{result.status.message}.find("appSettings.maxRetry") != std::string::npos);
    }

    SECTION("retry count given as text")
    {
        REQUIRE(ConfigService::parse(withField(R"("maxRetry": 2)", R"("maxRetry": "2")")).status.code ==
                StatusCode::InvalidArg);
    }

    SECTION("port past 65535")
    {
        REQUIRE(ConfigService::parse(withField(R"("webserverPort": 8080)", R"("webserverPort": 70000)")).status.code ==
                StatusCode::InvalidArg);
    }

    SECTION("headers timeout past the HTTP client's 16-bit limit")
    {
        const auto result{ConfigService::parse(withField(R"("headersTimeout": 5000)", R"("headersTimeout": 65536)"))};
        REQUIRE(result.status.code == StatusCode::InvalidArg);
        REQUIRE(std::string{result.status.message}.find("appSettings.headersTimeout") != std::string::npos);
    }

    SECTION("weekday given as text")
    {
        REQUIRE(ConfigService::parse(withField("[1, 3]", R"([1, "Monday"])")).status.code == StatusCode::InvalidArg);
    }
}

TEST_CASE("Boundary values of numeric settings are kept exactly", "[config]")
{
    auto json{withField(R"("headersTimeout": 5000)", R"("headersTimeout": 65535)")};
    json.replace(json.find(R"("maxRetry": 2)"), 13, R"("maxRetry": 255)");
    json.replace(json.find(R"("webserverPort": 8080)"), 21, R"("webserverPort": 65535)");

    const auto result{ConfigService::parse(json)};
    REQUIRE(result.ok());
    REQUIRE(result.value.appSettings.headersTimeoutMs == 65535U);
    REQUIRE(result.value.appSettings.maxRetry == 255);
    REQUIRE(result.value.appSettings.webServerPort == 65535);
}

TEST_CASE("Config service loads /config.json from the file store", "[config]")
{
    MemoryFileStore store{};
    ConfigService service{store};

    SECTION("missing file")
    {
        REQUIRE(service.begin().code == StatusCode::NotFound);
        REQUIRE(service.getState() == ServiceState::Error);
    }

    SECTION("valid file")
    {
        store.m_files[ConfigService::CONFIG_PATH] = kValidConfig;
        REQUIRE(service.begin().ok());
        REQUIRE(service.isRunning());
        REQUIRE(service.get().location.zipCodes.size() == 2);
        REQUIRE_FALSE(log::colorOutput());
        log::setColorOutput(LogConfig::kDefaultColorOutput);
    }
}
