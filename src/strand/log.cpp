#include <strand/log.hpp>

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

namespace strand::log {

namespace {

// Clones for different URIs can run on different threads; one line per
// message is written under this lock.
std::mutex g_write_mutex;
std::atomic<Level> g_level{Info};
std::atomic<int> g_color{-1};   // -1 = not probed yet
Sink g_sink;

bool color_on() {
    int c = g_color.load();
    if (c < 0) {
        c = isatty(fileno(stderr)) ? 1 : 0;
        g_color.store(c);
    }
    return c == 1;
}

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
    va_list probe;
    va_copy(probe, args);
    int len = std::vsnprintf(nullptr, 0, fmt, probe);
    va_end(probe);
    if (len <= 0) return std::string();

    std::string out(static_cast<size_t>(len), '\0');
    std::vsnprintf(&out[0], out.size() + 1, fmt, args);
    return out;
}

void write_stderr(Level lvl, const std::string& msg) {
    if (color_on()) {
        std::fprintf(stderr, "%s%s\033[0m: %s\n",
                     level_color(lvl), level_name(lvl), msg.c_str());
    } else {
        std::fprintf(stderr, "%s: %s\n", level_name(lvl), msg.c_str());
    }
}

void emit(Level lvl, const char* fmt, va_list args) {
    if (lvl < g_level.load()) return;
    std::string msg = vformat(fmt, args);

    std::lock_guard<std::mutex> lock(g_write_mutex);
    if (g_sink) {
        g_sink(lvl, msg);
    } else {
        write_stderr(lvl, msg);
    }
}

} // namespace

void set_level(Level lvl) { g_level.store(lvl); }
Level get_level() { return g_level.load(); }

void set_color_enabled(bool enabled) { g_color.store(enabled ? 1 : 0); }
bool is_color_enabled() { return color_on(); }

void set_sink(Sink sink) {
    std::lock_guard<std::mutex> lock(g_write_mutex);
    g_sink = std::move(sink);
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

Result<Level> level_from_string(const std::string& name) {
    for (Level lvl : {Trace, Debug, Info, Warn, Error}) {
        if (name == level_name(lvl)) return Result<Level>::ok(lvl);
    }
    return StrandError{StrandError::Config,
        "unknown log level '" + name + "'",
        "expected one of: trace, debug, info, warn, error"};
}

#define STRAND_LOG_FN(fn, lvl)            \
    void fn(const char* fmt, ...) {       \
        va_list args;                     \
        va_start(args, fmt);              \
        emit(lvl, fmt, args);             \
        va_end(args);                     \
    }

STRAND_LOG_FN(trace, Trace)
STRAND_LOG_FN(debug, Debug)
STRAND_LOG_FN(info, Info)
STRAND_LOG_FN(warn, Warn)
STRAND_LOG_FN(error, Error)

#undef STRAND_LOG_FN

} // namespace strand::log
