#include "diagnostics/diag.h"
#include "ingest/reading.h"
#include "logger.h"
#include "monitor/device_registry.h"
#include "prefferences.h"
#include "snapshot/console_publisher.h"
#include "time/wall_clock.h"
#include "weather/http_weather_source.h"
#include "weather/weather_cache.h"

#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>

// Host poll loop. One climate reading per stdin line:
//   <current_f> <target_f> <hvac_action> <equipment_running|->
// or "unavailable" when the climate entity could not be read.
// Usage: climate_learning_host [history_path] [device_id] [zip] [weather_api_key] [rate_per_kwh]

namespace {
MonitorConfig gConfig;
SystemClock gClock;
Logger gLogger;
ConsolePublisher gPublisher;
HttpWeatherSource* gWeatherSource = nullptr;
DeviceRegistry* gRegistry = nullptr;
bool gRunning = true;

bool parseReadingLine(const std::string& line, uint64_t nowMs, Reading& outReading) {
    if (line == "unavailable") {
        outReading = Reading{};
        outReading.timestampMs = nowMs;
        outReading.available = false;
        return true;
    }

    std::istringstream in(line);
    float current = 0.0F;
    float target = 0.0F;
    std::string action;
    std::string equipment;
    if (!(in >> current >> target >> action >> equipment)) {
        return false;
    }
    if (equipment == "-") {
        equipment.clear();
    }
    outReading = readingFromClimateState(nowMs, current, target, action, equipment, gConfig.runningEquipmentToken);
    return true;
}

void applyArguments(int argc, char** argv) {
    if (argc > 1) {
        gConfig.historyPath = argv[1];
    }
    if (argc > 2) {
        gConfig.deviceId = argv[2];
    }
    if (argc > 4) {
        gConfig.zipCode = argv[3];
        gConfig.weatherApiKey = argv[4];
    }
    if (argc > 5) {
        gConfig.hasEnergyRate = true;
        gConfig.energyRatePerKwh = std::strtof(argv[5], nullptr);
    }
}
}  // namespace

bool setup(int argc, char** argv) {
    applyArguments(argc, argv);

    static HttpWeatherSource weatherSource(gConfig.weatherApiKey, gConfig.zipCode, gConfig.weatherTimeoutMs);
    static WeatherCache weatherCache(weatherSource, gConfig.weatherCacheSeconds);
    static DeviceRegistry registry(weatherCache, gPublisher, gLogger);
    gWeatherSource = &weatherSource;
    gRegistry = &registry;

    if (!gClock.isValid()) {
        diag::log(DiagLevel::WARN, "MAIN", "system clock not set; cycle timestamps will be wrong");
    }
    if (!gWeatherSource->configured()) {
        diag::log(DiagLevel::INFO, "MAIN", "weather lookup not configured; outdoor temperature unavailable");
    }

    const ConfigIssue issue = gRegistry->addDevice(gConfig, gClock.nowUnixMs());
    if (issue != ConfigIssue::NONE) {
        diag::logf(DiagLevel::ERROR, "MAIN", "invalid configuration: %s", configIssueToString(issue));
        return false;
    }
    return true;
}

void loop() {
    std::string line;
    if (!std::getline(std::cin, line)) {
        gRunning = false;
        return;
    }
    if (line.empty() || line[0] == '#') {
        return;
    }

    Reading reading{};
    if (!parseReadingLine(line, gClock.nowUnixMs(), reading)) {
        diag::logf(DiagLevel::WARN, "MAIN", "unparsed reading: %s", line.c_str());
        return;
    }

    const DeviceMonitor::PollStatus status = gRegistry->poll(gConfig.deviceId, reading);
    if (status != DeviceMonitor::PollStatus::OK) {
        diag::logf(DiagLevel::DEBUG, "MAIN", "poll: %s", pollStatusToString(status));
    }
}

int main(int argc, char** argv) {
    if (!setup(argc, argv)) {
        return EXIT_FAILURE;
    }
    while (gRunning) {
        loop();
    }
    diag::logf(DiagLevel::INFO, "MAIN", "feed closed after %u logged events", static_cast<unsigned>(gLogger.size()));
    return EXIT_SUCCESS;
}
