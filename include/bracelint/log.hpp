#pragma once

#include <string>
#include <cstdio>

namespace bracelint::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

// Parse "trace" / "debug" / "info" / "warn" / "error" (case-insensitive).
bool parse_level(const std::string& name, Level& out);

// Apply BRACELINT_LOG=<level> if set. Returns false on an unknown level name.
bool init_from_env();

void set_color_enabled(bool enabled);
bool is_color_enabled();

void log_at(Level lvl, const char* fmt, ...);

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

const char* level_name(Level lvl);

} // namespace bracelint::log
