#pragma once

#include <string>
#include <cstdio>

namespace volt::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

// Parse "trace", "debug", "info", "warn" or "error" (case-insensitive).
// Returns false and leaves `out` untouched on anything else.
bool level_from_name(const std::string& name, Level& out);

void set_color_enabled(bool enabled);
bool is_color_enabled();

// Destination stream, stderr by default. Color detection follows the stream.
void set_output(std::FILE* stream);
std::FILE* get_output();

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

// Returns the name string for a level
const char* level_name(Level lvl);

} // namespace volt::log
