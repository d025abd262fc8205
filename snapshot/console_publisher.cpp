#include "console_publisher.h"

#include <cstdio>

#include "../diagnostics/diag.h"

namespace {

std::string optionalField(bool present, float value, const char* format) {
    if (!present) {
        return "n/a";
    }
    char buffer[24];
    std::snprintf(buffer, sizeof(buffer), format, static_cast<double>(value));
    return buffer;
}

}  // namespace

void ConsolePublisher::publish(const std::string& metricName, const MetricSnapshot& snapshot) {
    diag::log(DiagLevel::INFO, "SNAPSHOT", format(metricName, snapshot).c_str());
}

std::string ConsolePublisher::format(const std::string& metricName, const MetricSnapshot& snapshot) {
    std::string out = metricName;
    out += ": runtime=" + optionalField(true, snapshot.stateRuntimeSec, "%.0fs");
    out += " avg=" + optionalField(snapshot.hasAverageRuntime, snapshot.averageRuntimeSec, "%.0fs");
    out += " samples=" + std::to_string(snapshot.sampleCount);
    out += " tpd=" + optionalField(snapshot.hasAverageTimePerDegree, snapshot.averageSecondsPerDegree, "%.0fs/F");
    out += " score=" + optionalField(snapshot.hasEfficiencyScore, snapshot.efficiencyScore, "%.1f");
    out += " cost=" + optionalField(snapshot.hasEstimatedDailyCost, snapshot.estimatedDailyCost, "$%.2f");
    out += " outdoor=" + optionalField(snapshot.hasOutdoorTemperature, snapshot.outdoorTemperatureF, "%.1fF");
    if (snapshot.outdoorTemperatureStale) {
        out += "(stale)";
    }
    out += snapshot.alert ? " ALERT" : "";
    return out;
}
