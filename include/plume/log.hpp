#pragma once

#include <plume/result.hpp>
#include <string>
#include <cstdio>

namespace plume::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

// Case-insensitive level name ("trace" ... "error")
Result<Level> parse_level(const std::string& name);

// Reads PLUME_LOG; unknown values are reported and ignored
void init_from_env();

void set_color_enabled(bool enabled);
bool is_color_enabled();

// Destination stream, stderr by default. Passing nullptr restores stderr.
void set_output(FILE* out);

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

bool enabled(Level lvl);

// Returns the name string for a level
const char* level_name(Level lvl);

} // namespace plume::log
