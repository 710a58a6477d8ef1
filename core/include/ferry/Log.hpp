// Minimal logging utility (header-only) for the Ferry core and engine.
// FERRY_LOG=1 enables info/warn/error, FERRY_LOG=2 also enables debug.
#pragma once
#include <cstdio>
#include <cstdlib>
#include <cstdarg>

namespace ferry {

inline int logLevel() {
    const char* v = std::getenv("FERRY_LOG");
    if (!v || !*v || *v == '0') return 0;
    return (*v >= '2' && *v <= '9') ? 2 : 1;
}

inline bool logEnabled() { return logLevel() > 0; }

inline void logf(const char* level, const char* fmt, ...) {
    if (!logEnabled()) return;
    std::fprintf(stderr, "[Ferry][%s] ", level);
    va_list ap;
    va_start(ap, fmt);
    std::vfprintf(stderr, fmt, ap);
    va_end(ap);
    std::fprintf(stderr, "\n");
}

} // namespace ferry

#define LOGD(fmt, ...) \
    do { \
        if (ferry::logLevel() >= 2) \
            ferry::logf("DEBUG", fmt, ##__VA_ARGS__); \
    } while (0)

#define LOGI(fmt, ...) \
    do { \
        if (ferry::logEnabled()) \
            ferry::logf("INFO", fmt, ##__VA_ARGS__); \
    } while (0)

#define LOGW(fmt, ...) \
    do { \
        if (ferry::logEnabled()) \
            ferry::logf("WARN", fmt, ##__VA_ARGS__); \
    } while (0)

#define LOGE(fmt, ...) \
    do { \
        if (ferry::logEnabled()) \
            ferry::logf("ERROR", fmt, ##__VA_ARGS__); \
    } while (0)
