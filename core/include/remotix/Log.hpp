// Logging for the Remotix core and the remotix-hostkey tool (header-only).
// Session lifecycle, dropped queue work, trust store I/O and key fetch
// failures go to stderr as "[Remotix][LEVEL] ..." when REMOTIX_LOG is set
// to anything other than 0. Silent otherwise.
#pragma once
#include <cstdio>
#include <cstdlib>
#include <cstdarg>

namespace remotix {

inline bool logEnabled() {
    const char* v = std::getenv("REMOTIX_LOG");
    return v && *v && *v != '0';
}

inline void logf(const char* level, const char* fmt, ...) {
    if (!logEnabled()) return;
    std::fprintf(stderr, "[Remotix][%s] ", level);
    va_list ap;
    va_start(ap, fmt);
    std::vfprintf(stderr, fmt, ap);
    va_end(ap);
    std::fprintf(stderr, "\n");
}

} // namespace remotix

#define LOGI(fmt, ...) \
    do { \
        if (remotix::logEnabled()) \
            remotix::logf("INFO", fmt, ##__VA_ARGS__); \
    } while (0)

#define LOGW(fmt, ...) \
    do { \
        if (remotix::logEnabled()) \
            remotix::logf("WARN", fmt, ##__VA_ARGS__); \
    } while (0)

#define LOGE(fmt, ...) \
    do { \
        if (remotix::logEnabled()) \
            remotix::logf("ERROR", fmt, ##__VA_ARGS__); \
    } while (0)
