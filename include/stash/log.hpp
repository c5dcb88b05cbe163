#pragma once

#include <stash/result.hpp>
#include <string>
#include <cstdio>

namespace stash::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

// "trace", "debug", "info", "warn"/"warning", "error" (case-insensitive)
Result<Level> parse_level(const std::string& name);

void set_color_enabled(bool enabled);
bool is_color_enabled();

// Mirror every emitted message, timestamped, into an append-only file.
// An empty path closes the current file.
Status set_log_file(const std::string& path);

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

// Returns the name string for a level
const char* level_name(Level lvl);

} // namespace stash::log
