// Log.hpp
//
// Leveled console logging for MediaFlow. Lines go to stderr through fmt and
// carry the same bracketed tags the engine has always printed ([DEBUG] ...).
#pragma once
#include <fmt/core.h>
#include <cstdio>
#include <string>

namespace MediaFlow {
namespace log {

enum class Level { Debug = 0, Info, Warn, Error, Off };

// Process-wide threshold; messages below it are dropped
void setLevel(Level level);
Level level();
inline bool enabled(Level l) { return l >= level() && level() != Level::Off; }

template <typename... Args>
void write(Level l, const char* tag, const char* format, const Args&... args) {
    if (!enabled(l)) return;
    std::string msg = fmt::vformat(format, fmt::make_format_args(args...));
    fmt::print(stderr, "[{}] {}\n", tag, msg);
}

template <typename... Args>
void debug(const char* format, const Args&... args) { write(Level::Debug, "DEBUG", format, args...); }
template <typename... Args>
void info(const char* format, const Args&... args) { write(Level::Info, "INFO", format, args...); }
template <typename... Args>
void warn(const char* format, const Args&... args) { write(Level::Warn, "WARN", format, args...); }
template <typename... Args>
void error(const char* format, const Args&... args) { write(Level::Error, "ERROR", format, args...); }

} // namespace log
} // namespace MediaFlow
