#pragma once

#include <cstdarg>
#include <cstdint>
#include <cstdio>

#include "../prefferences.h"

#if __has_include(<Arduino.h>)
#include <Arduino.h>
#define DIAG_HAS_SERIAL 1
#else
#define DIAG_HAS_SERIAL 0
#endif

enum class DiagLevel : uint8_t {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3,
};

namespace diag {

inline bool enabled(DiagLevel level) {
    return static_cast<uint8_t>(level) <= kDiagnosticsLogLevel;
}

inline const char* levelLabel(DiagLevel level) {
    switch (level) {
        case DiagLevel::ERROR:
            return "ERROR";
        case DiagLevel::WARN:
            return "WARN";
        case DiagLevel::INFO:
            return "INFO";
        case DiagLevel::DEBUG:
            return "DEBUG";
        default:
            return "UNK";
    }
}

inline void log(DiagLevel level, const char* tag, const char* message) {
    if (!enabled(level)) {
        return;
    }

#if DIAG_HAS_SERIAL
    Serial.print('[');
    Serial.print(levelLabel(level));
    Serial.print("] [");
    Serial.print(tag != nullptr ? tag : "GEN");
    Serial.print("] ");
    Serial.println(message != nullptr ? message : "");
#else
    std::fprintf(stderr,
                 "[%s] [%s] %s\n",
                 levelLabel(level),
                 tag != nullptr ? tag : "GEN",
                 message != nullptr ? message : "");
    std::fflush(stderr);
#endif
}

// printf-style variant; output longer than the line buffer is truncated.
inline void logf(DiagLevel level, const char* tag, const char* format, ...) {
    if (!enabled(level) || format == nullptr) {
        return;
    }

    char line[192];
    va_list args;
    va_start(args, format);
    std::vsnprintf(line, sizeof(line), format, args);
    va_end(args);
    log(level, tag, line);
}

}  // namespace diag
