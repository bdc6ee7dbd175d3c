#pragma once

#include <modsrc/result.hpp>
#include <string>

namespace modsrc::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

void set_color_enabled(bool enabled);
bool is_color_enabled();

// True when a message at lvl would be written
bool enabled(Level lvl);

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

// Returns the name string for a level
const char* level_name(Level lvl);

// Inverse of level_name(); case-insensitive, also accepts "warning"
Result<Level> parse_level(const std::string& name);

} // namespace modsrc::log
