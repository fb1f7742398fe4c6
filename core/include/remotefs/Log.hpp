// Minimal logging utility (header-only) for RemoteFS core.
// Enabled with REMOTEFS_LOG=1; REMOTEFS_LOG=debug also prints LOGD lines.
#pragma once
#include <cstdio>
#include <cstdlib>
#include <cstdarg>
#include <cstring>

namespace remotefs {

inline bool logEnabled() {
    const char* v = std::getenv("REMOTEFS_LOG");
    return v && *v && *v != '0';
}

inline bool debugLogEnabled() {
    const char* v = std::getenv("REMOTEFS_LOG");
    return v && std::strcmp(v, "debug") == 0;
}

inline void logf(const char* level, const char* fmt, ...) {
    if (!logEnabled()) return;
    std::fprintf(stderr, "[RemoteFS][%s] ", level);
    va_list ap;
    va_start(ap, fmt);
    std::vfprintf(stderr, fmt, ap);
    va_end(ap);
    std::fprintf(stderr, "\n");
}

} // namespace remotefs

#define LOGI(fmt, ...) \
    do { \
        if (remotefs::logEnabled()) \
            remotefs::logf("INFO", fmt, ##__VA_ARGS__); \
    } while (0)

#define LOGW(fmt, ...) \
    do { \
        if (remotefs::logEnabled()) \
            remotefs::logf("WARN", fmt, ##__VA_ARGS__); \
    } while (0)

#define LOGE(fmt, ...) \
    do { \
        if (remotefs::logEnabled()) \
            remotefs::logf("ERROR", fmt, ##__VA_ARGS__); \
    } while (0)

#define LOGD(fmt, ...) \
    do { \
        if (remotefs::debugLogEnabled()) \
            remotefs::logf("DEBUG", fmt, ##__VA_ARGS__); \
    } while (0)
