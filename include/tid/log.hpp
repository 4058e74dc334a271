#pragma once

#include <tid/result.hpp>
#include <cstdio>
#include <string>

namespace tid::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

// "trace" | "debug" | "info" | "warn" | "error"
Result<Level> parse_level(const std::string& name);
const char* level_name(Level lvl);

void set_color_enabled(bool enabled);
bool is_color_enabled();

// Destination for all messages; stderr unless redirected. Passing
// nullptr restores stderr.
void set_output(std::FILE* out);

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

} // namespace tid::log
