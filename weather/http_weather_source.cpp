#include "http_weather_source.h"

#include <cctype>
#include <cstdlib>
#include <cstring>

#include "../diagnostics/diag.h"
#include "../prefferences.h"

#if __has_include(<Arduino.h>)
#include <Arduino.h>
#endif

#if __has_include(<WiFi.h>)
#include <WiFi.h>
#define WEATHER_HAS_WIFI 1
#else
#define WEATHER_HAS_WIFI 0
#endif

#if __has_include(<HTTPClient.h>)
#include <HTTPClient.h>
#define WEATHER_HAS_HTTP_CLIENT 1
#else
#define WEATHER_HAS_HTTP_CLIENT 0
#endif

#if !WEATHER_HAS_HTTP_CLIENT
#include <cerrno>
#include <chrono>

#include <netdb.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>
#include <unistd.h>
#endif

namespace {
constexpr int kHttpOk = 200;
constexpr int kHttpTooManyRequests = 429;
constexpr size_t kMaxResponseBytes = 16384;

#if !WEATHER_HAS_HTTP_CLIENT
// Closes the descriptor on every path.
class SocketHandle {
public:
    explicit SocketHandle(int fd) : fd_(fd) {}
    ~SocketHandle() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    SocketHandle(const SocketHandle&) = delete;
    SocketHandle& operator=(const SocketHandle&) = delete;

    int get() const {
        return fd_;
    }

private:
    int fd_;
};

bool applySocketTimeouts(int fd, uint32_t timeoutMs) {
    timeval timeout{};
    timeout.tv_sec = static_cast<time_t>(timeoutMs / 1000U);
    timeout.tv_usec = static_cast<suseconds_t>((timeoutMs % 1000U) * 1000U);
    // SO_SNDTIMEO also bounds connect() on Linux.
    return setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout)) == 0 &&
           setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &timeout, sizeof(timeout)) == 0;
}

uint32_t remainingBudgetMs(std::chrono::steady_clock::time_point deadline) {
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
        return 0U;
    }
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
    return (left > 0) ? static_cast<uint32_t>(left) : 1U;
}

bool isTimeoutErrno(int error) {
    return error == EAGAIN || error == EWOULDBLOCK || error == EINPROGRESS || error == ETIMEDOUT;
}
#endif

}  // namespace

namespace weather_json {

bool extractNumber(const std::string& payload, const char* objectKey, const char* key, float& outValue) {
    if (key == nullptr) {
        return false;
    }

    size_t searchFrom = 0;
    if (objectKey != nullptr) {
        const std::string objectPattern = std::string("\"") + objectKey + "\"";
        const size_t objectPos = payload.find(objectPattern);
        if (objectPos == std::string::npos) {
            return false;
        }
        const size_t bracePos = payload.find('{', objectPos + objectPattern.size());
        if (bracePos == std::string::npos) {
            return false;
        }
        searchFrom = bracePos + 1U;
    }

    const std::string pattern = std::string("\"") + key + "\"";
    const size_t keyPos = payload.find(pattern, searchFrom);
    if (keyPos == std::string::npos) {
        return false;
    }

    const size_t colonPos = payload.find(':', keyPos + pattern.size());
    if (colonPos == std::string::npos) {
        return false;
    }

    const char* start = payload.c_str() + colonPos + 1U;
    while (*start == ' ' || *start == '\t' || *start == '\r' || *start == '\n') {
        ++start;
    }

    char* end = nullptr;
    const float value = std::strtof(start, &end);
    if (end == start) {
        return false;
    }

    outValue = value;
    return true;
}

int parseStatusLine(const std::string& response) {
    if (response.compare(0, 5, "HTTP/") != 0) {
        return -1;
    }
    const size_t spacePos = response.find(' ');
    if (spacePos == std::string::npos) {
        return -1;
    }
    const char* start = response.c_str() + spacePos + 1U;
    char* end = nullptr;
    const long status = std::strtol(start, &end, 10);
    if (end == start || status < 100 || status > 599) {
        return -1;
    }
    return static_cast<int>(status);
}

std::string urlEncode(const std::string& value) {
    static const char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size());
    for (const char c : value) {
        const unsigned char byte = static_cast<unsigned char>(c);
        if (std::isalnum(byte) != 0 || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(c);
        } else {
            out.push_back('%');
            out.push_back(kHex[byte >> 4]);
            out.push_back(kHex[byte & 0x0FU]);
        }
    }
    return out;
}

}  // namespace weather_json

HttpWeatherSource::HttpWeatherSource(const std::string& apiKey, const std::string& location, uint32_t timeoutMs)
    : apiKey_(apiKey), location_(location), timeoutMs_(timeoutMs) {}

bool HttpWeatherSource::configured() const {
    return !apiKey_.empty() && !location_.empty();
}

std::string HttpWeatherSource::requestPath() const {
    return std::string(kWeatherApiPath) + "?key=" + weather_json::urlEncode(apiKey_) +
           "&q=" + weather_json::urlEncode(location_);
}

FetchResult HttpWeatherSource::fetchTemperatureF(float& outTemperatureF) {
    if (!configured()) {
        return FetchResult::NOT_CONFIGURED;
    }

    int status = -1;
    std::string body;
    const FetchResult transport = httpGet(requestPath(), status, body);
    if (transport != FetchResult::OK) {
        return transport;
    }

    if (status == kHttpTooManyRequests) {
        diag::log(DiagLevel::WARN, "WEATHER", "Weather API rate limit reached");
        return FetchResult::RATE_LIMITED;
    }
    if (status != kHttpOk) {
        diag::logf(DiagLevel::WARN, "WEATHER", "Weather API error: %d", status);
        return FetchResult::HTTP_ERROR;
    }

    float temperatureF = 0.0F;
    if (!weather_json::extractNumber(body, "current", "temp_f", temperatureF)) {
        diag::log(DiagLevel::WARN, "WEATHER", "temp_f missing from response");
        return FetchResult::PARSE_ERROR;
    }

    outTemperatureF = temperatureF;
    return FetchResult::OK;
}

FetchResult HttpWeatherSource::httpGet(const std::string& path, int& outStatus, std::string& outBody) {
#if WEATHER_HAS_HTTP_CLIENT
#if WEATHER_HAS_WIFI
    if (WiFi.status() != WL_CONNECTED) {
        return FetchResult::NETWORK_ERROR;
    }
#endif

    HTTPClient http;
    http.setConnectTimeout(static_cast<int32_t>(timeoutMs_));
    http.setTimeout(static_cast<uint16_t>(timeoutMs_));

    const String url = String("http://") + kWeatherApiHost + path.c_str();
    if (!http.begin(url)) {
        return FetchResult::NETWORK_ERROR;
    }

    const int status = http.GET();
    if (status == HTTPC_ERROR_READ_TIMEOUT) {
        http.end();
        return FetchResult::TIMEOUT;
    }
    if (status < 0) {
        http.end();
        return FetchResult::NETWORK_ERROR;
    }

    outStatus = status;
    outBody = http.getString().c_str();
    http.end();
    return FetchResult::OK;
#else
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs_);

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* resolved = nullptr;
    if (getaddrinfo(kWeatherApiHost, "80", &hints, &resolved) != 0 || resolved == nullptr) {
        return FetchResult::NETWORK_ERROR;
    }

    // getaddrinfo itself cannot be interrupted; whatever it used comes off the socket budget.
    const uint32_t remainingMs = remainingBudgetMs(deadline);
    if (remainingMs == 0U) {
        freeaddrinfo(resolved);
        return FetchResult::TIMEOUT;
    }

    SocketHandle sock(socket(resolved->ai_family, resolved->ai_socktype, resolved->ai_protocol));
    if (sock.get() < 0 || !applySocketTimeouts(sock.get(), remainingMs)) {
        freeaddrinfo(resolved);
        return FetchResult::NETWORK_ERROR;
    }

    const int connected = connect(sock.get(), resolved->ai_addr, resolved->ai_addrlen);
    const int connectErrno = errno;
    freeaddrinfo(resolved);
    if (connected != 0) {
        return isTimeoutErrno(connectErrno) ? FetchResult::TIMEOUT : FetchResult::NETWORK_ERROR;
    }

    const std::string request = "GET " + path + " HTTP/1.0\r\nHost: " + kWeatherApiHost +
                                "\r\nAccept: application/json\r\nConnection: close\r\n\r\n";
    size_t sent = 0;
    while (sent < request.size()) {
        const ssize_t n = send(sock.get(), request.data() + sent, request.size() - sent, 0);
        if (n <= 0) {
            return isTimeoutErrno(errno) ? FetchResult::TIMEOUT : FetchResult::NETWORK_ERROR;
        }
        sent += static_cast<size_t>(n);
    }

    std::string response;
    char buffer[2048];
    while (true) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return FetchResult::TIMEOUT;
        }
        const ssize_t n = recv(sock.get(), buffer, sizeof(buffer), 0);
        if (n == 0) {
            break;
        }
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return isTimeoutErrno(errno) ? FetchResult::TIMEOUT : FetchResult::NETWORK_ERROR;
        }
        response.append(buffer, static_cast<size_t>(n));
        if (response.size() > kMaxResponseBytes) {
            return FetchResult::PARSE_ERROR;
        }
    }

    outStatus = weather_json::parseStatusLine(response);
    if (outStatus < 0) {
        return FetchResult::PARSE_ERROR;
    }

    const size_t bodyStart = response.find("\r\n\r\n");
    outBody = (bodyStart != std::string::npos) ? response.substr(bodyStart + 4U) : std::string();
    return FetchResult::OK;
#endif
}
