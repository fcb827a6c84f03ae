#include <kapla/log.hpp>
#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <vector>

#include <unistd.h>

namespace kapla::log {

namespace {

std::atomic<Level> g_level{Info};
// -1: not decided yet, decided from stderr on first use
std::atomic<int> g_color{-1};
// Serializes writes so lines from worker threads never interleave
std::mutex g_write_mutex;

const char* level_color(Level lvl) {
    switch (lvl) {
        case Trace: return "\033[90m";
        case Debug: return "\033[36m";
        case Info:  return "\033[32m";
        case Warn:  return "\033[33m";
        case Error: return "\033[31m";
    }
    return "";
}

std::string vformat(const char* fmt, va_list args) {
    va_list copy;
    va_copy(copy, args);
    int n = std::vsnprintf(nullptr, 0, fmt, copy);
    va_end(copy);
    if (n <= 0) return "";
    std::vector<char> buf(static_cast<size_t>(n) + 1);
    std::vsnprintf(buf.data(), buf.size(), fmt, args);
    return std::string(buf.data(), static_cast<size_t>(n));
}

void emit(Level lvl, const char* fmt, va_list args) {
    if (lvl < g_level.load(std::memory_order_relaxed)) return;

    std::string line;
    if (is_color_enabled()) {
        line = std::string(level_color(lvl)) + level_name(lvl) + "\033[0m: ";
    } else {
        line = std::string(level_name(lvl)) + ": ";
    }
    line += vformat(fmt, args);
    line += '\n';

    std::lock_guard<std::mutex> lock(g_write_mutex);
    std::fputs(line.c_str(), stderr);
    std::fflush(stderr);
}

} // namespace

void set_level(Level lvl) {
    g_level.store(lvl);
}

Level get_level() {
    return g_level.load();
}

Level level_for_verbosity(int verbosity) {
    if (verbosity < 0) return Warn;
    if (verbosity == 0) return Info;
    if (verbosity == 1) return Debug;
    return Trace;
}

Result<Level> parse_level(const std::string& name) {
    for (Level lvl : {Trace, Debug, Info, Warn, Error}) {
        if (name == level_name(lvl)) return Result<Level>::ok(lvl);
    }
    return KaplaError{KaplaError::Config,
        "unknown log level '" + name + "'",
        "expected one of: trace, debug, info, warn, error"};
}

void set_color_enabled(bool enabled) {
    g_color.store(enabled ? 1 : 0);
}

bool is_color_enabled() {
    int c = g_color.load();
    if (c < 0) {
        c = isatty(fileno(stderr)) ? 1 : 0;
        int expected = -1;
        if (!g_color.compare_exchange_strong(expected, c)) c = expected;
    }
    return c == 1;
}

const char* level_name(Level lvl) {
    switch (lvl) {
        case Trace: return "trace";
        case Debug: return "debug";
        case Info:  return "info";
        case Warn:  return "warn";
        case Error: return "error";
    }
    return "unknown";
}

#define KAPLA_LOG_ENTRY(fn, lvl)            \
    void fn(const char* fmt, ...) {         \
        va_list args;                       \
        va_start(args, fmt);                \
        emit(lvl, fmt, args);               \
        va_end(args);                       \
    }

KAPLA_LOG_ENTRY(trace, Trace)
KAPLA_LOG_ENTRY(debug, Debug)
KAPLA_LOG_ENTRY(info, Info)
KAPLA_LOG_ENTRY(warn, Warn)
KAPLA_LOG_ENTRY(error, Error)

#undef KAPLA_LOG_ENTRY

} // namespace kapla::log
