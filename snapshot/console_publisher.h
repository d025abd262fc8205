#pragma once

#include <string>

#include "metric_snapshot.h"

// Host publisher: one diagnostics line per snapshot, absent fields printed as "n/a".
class ConsolePublisher : public ISnapshotPublisher {
public:
    void publish(const std::string& metricName, const MetricSnapshot& snapshot) override;

    static std::string format(const std::string& metricName, const MetricSnapshot& snapshot);
};
