// Log.cpp – stdout / stderr sinks for pdz::log.

#include "PDZReader/Log.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>

namespace pdz::log {

namespace {

std::atomic<Level> g_level{Level::Warn};

void vprint(FILE* f, const char* prefix, const char* fmt, va_list args) {
    std::fputs(prefix, f);
    std::vfprintf(f, fmt, args);
    std::fputc('\n', f);
    std::fflush(f);
}

} // namespace

void setLevel(Level level) noexcept { g_level.store(level, std::memory_order_relaxed); }

Level level() noexcept { return g_level.load(std::memory_order_relaxed); }

bool enabled(Level lvl) noexcept {
    return lvl != Level::Off && static_cast<int>(lvl) >= static_cast<int>(level());
}

void debug(const char* fmt, ...) {
    if (!enabled(Level::Debug)) return;
    va_list args;
    va_start(args, fmt);
    vprint(stdout, "[DEBUG] ", fmt, args);
    va_end(args);
}

void info(const char* fmt, ...) {
    if (!enabled(Level::Info)) return;
    va_list args;
    va_start(args, fmt);
    vprint(stdout, "", fmt, args);
    va_end(args);
}

void warn(const char* fmt, ...) {
    if (!enabled(Level::Warn)) return;
    va_list args;
    va_start(args, fmt);
    vprint(stderr, "[WARN] ", fmt, args);
    va_end(args);
}

void error(const char* fmt, ...) {
    if (!enabled(Level::Error)) return;
    va_list args;
    va_start(args, fmt);
    vprint(stderr, "[ERROR] ", fmt, args);
    va_end(args);
}

} // namespace pdz::log
