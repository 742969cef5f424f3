#pragma once

#include <stdint.h>

#ifndef STOKER_LOG_LEVEL
#define STOKER_LOG_LEVEL 1
#endif

// Line logger shared by the portable core and the firmware.
// Lines look like "[POLL] device refresh failed: ...". The firmware routes
// them to Serial; native builds drop them unless a sink is installed.
namespace Log {

enum class Level : uint8_t {
  debug = 0,
  info = 1,
  warn = 2,
  error = 3,
};

using Sink = void (*)(Level level, const char* line);

void setSink(Sink sink);
void setLevel(Level level);
bool enabled(Level level);

void debug(const char* tag, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
void info(const char* tag, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
void warn(const char* tag, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
void error(const char* tag, const char* fmt, ...) __attribute__((format(printf, 2, 3)));

} // namespace Log
