#pragma once

#include <kapla/result.hpp>
#include <string>
#include <cstdio>

namespace kapla::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

// -q -> Warn, none -> Info, -v -> Debug, -vv and beyond -> Trace
Level level_for_verbosity(int verbosity);

// Accepts the names returned by level_name()
Result<Level> parse_level(const std::string& name);

void set_color_enabled(bool enabled);
bool is_color_enabled();

// All entry points are safe to call from orchestrator worker threads;
// a line is never interleaved with another.
void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

const char* level_name(Level lvl);

} // namespace kapla::log
