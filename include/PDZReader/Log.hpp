#pragma once
// Log.hpp – Levelled printf-style diagnostics.
//
// Debug and Info go to stdout, Warn and Error to stderr.  The threshold is
// process-wide; the default (Warn) keeps decoding silent unless a block or
// field had to be dropped.

namespace pdz::log {

enum class Level { Debug, Info, Warn, Error, Off };

void setLevel(Level level) noexcept;
[[nodiscard]] Level level() noexcept;
[[nodiscard]] bool  enabled(Level level) noexcept;

void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

} // namespace pdz::log

#define PDZ_LOG_DEBUG(fmt, ...) ::pdz::log::debug(fmt __VA_OPT__(,) __VA_ARGS__)
#define PDZ_LOG_INFO(fmt, ...)  ::pdz::log::info(fmt __VA_OPT__(,) __VA_ARGS__)
#define PDZ_LOG_WARN(fmt, ...)  ::pdz::log::warn(fmt __VA_OPT__(,) __VA_ARGS__)
#define PDZ_LOG_ERROR(fmt, ...) ::pdz::log::error(fmt __VA_OPT__(,) __VA_ARGS__)
