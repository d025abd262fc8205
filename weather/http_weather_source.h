#pragma once

#include <cstdint>
#include <string>

#include "outdoor_temperature_source.h"

// Current conditions from weatherapi.com, keyed by ZIP code.
class HttpWeatherSource : public IOutdoorTemperatureSource {
public:
    HttpWeatherSource(const std::string& apiKey, const std::string& location, uint32_t timeoutMs);

    FetchResult fetchTemperatureF(float& outTemperatureF) override;

    bool configured() const;
    std::string requestPath() const;

private:
    FetchResult httpGet(const std::string& path, int& outStatus, std::string& outBody);

    std::string apiKey_;
    std::string location_;
    uint32_t timeoutMs_;
};

namespace weather_json {

// Finds "key": <number> inside the object named by objectKey (or anywhere when objectKey is null).
bool extractNumber(const std::string& payload, const char* objectKey, const char* key, float& outValue);

// Status code from an HTTP/1.x status line, or -1.
int parseStatusLine(const std::string& response);

std::string urlEncode(const std::string& value);

}  // namespace weather_json
