#pragma once

#include <cstdint>

enum class FetchResult : uint8_t {
    OK = 0,
    NOT_CONFIGURED = 1,
    NETWORK_ERROR = 2,
    TIMEOUT = 3,
    HTTP_ERROR = 4,
    RATE_LIMITED = 5,
    PARSE_ERROR = 6,
};

inline const char* fetchResultToString(FetchResult result) {
    switch (result) {
        case FetchResult::OK:
            return "OK";
        case FetchResult::NOT_CONFIGURED:
            return "NOT_CONFIGURED";
        case FetchResult::NETWORK_ERROR:
            return "NETWORK_ERROR";
        case FetchResult::TIMEOUT:
            return "TIMEOUT";
        case FetchResult::HTTP_ERROR:
            return "HTTP_ERROR";
        case FetchResult::RATE_LIMITED:
            return "RATE_LIMITED";
        case FetchResult::PARSE_ERROR:
            return "PARSE_ERROR";
        default:
            return "UNKNOWN";
    }
}

// One upstream lookup per call. Implementations must bound the call by a timeout.
class IOutdoorTemperatureSource {
public:
    virtual ~IOutdoorTemperatureSource() = default;
    virtual FetchResult fetchTemperatureF(float& outTemperatureF) = 0;
};
