#pragma once

#include <stackup/result.hpp>
#include <string>
#include <cstdio>

namespace stackup::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

// "trace" .. "error", case-insensitive
Result<Level> parse_level(const std::string& name);

void set_color_enabled(bool enabled);
bool is_color_enabled();

// Destination for log lines, stderr unless redirected
void set_stream(std::FILE* stream);

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

const char* level_name(Level lvl);

} // namespace stackup::log
