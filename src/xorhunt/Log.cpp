#include "xorhunt/Log.h"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>

namespace xorhunt {

namespace {
std::atomic<bool> gLogEnabled{true};
std::mutex gLogMutex;
} // namespace

void logf(const char *fmt, ...) {
    if (!gLogEnabled.load(std::memory_order_relaxed)) return;
    std::lock_guard<std::mutex> lock(gLogMutex);
    va_list ap;
    va_start(ap, fmt);
    std::fprintf(stderr, "[xorhunt] ");
    std::vfprintf(stderr, fmt, ap);
    std::fprintf(stderr, "\n");
    std::fflush(stderr);
    va_end(ap);
}

void setLogEnabled(bool enabled) {
    gLogEnabled.store(enabled, std::memory_order_relaxed);
}

} // namespace xorhunt
