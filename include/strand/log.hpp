#pragma once

#include <strand/result.hpp>

#include <functional>
#include <string>

// printf-style logging to stderr as "<level>: <message>". Safe to call from
// several threads; each message is written as one line.
namespace strand::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

// Colour defaults to on when stderr is a terminal
void set_color_enabled(bool enabled);
bool is_color_enabled();

// Receives formatted messages (without the level prefix) instead of stderr.
// An empty function restores stderr output.
using Sink = std::function<void(Level, const std::string&)>;
void set_sink(Sink sink);

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

const char* level_name(Level lvl);

// "trace" | "debug" | "info" | "warn" | "error"
Result<Level> level_from_string(const std::string& name);

} // namespace strand::log
