#include "services/Log.h"

#include <atomic>
#include <cstdarg>
#include <cstdio>

namespace Log {

namespace {
std::atomic<Sink> gSink{nullptr};
std::atomic<uint8_t> gLevel{(uint8_t)STOKER_LOG_LEVEL};

constexpr size_t kLineMax = 256;

void vwrite(Level level, const char* tag, const char* fmt, va_list args) {
  const Sink sink = gSink.load();
  if (!sink || !enabled(level)) return;

  char line[kLineMax];
  int n = std::snprintf(line, sizeof(line), "[%s] ", tag ? tag : "-");
  if (n < 0) return;
  if ((size_t)n < sizeof(line)) {
    std::vsnprintf(line + n, sizeof(line) - (size_t)n, fmt, args);
  }
  sink(level, line);
}
} // namespace

void setSink(Sink sink) {
  gSink.store(sink);
}

void setLevel(Level level) {
  gLevel.store((uint8_t)level);
}

bool enabled(Level level) {
  return (uint8_t)level >= gLevel.load();
}

void debug(const char* tag, const char* fmt, ...) {
  va_list args;
  va_start(args, fmt);
  vwrite(Level::debug, tag, fmt, args);
  va_end(args);
}

void info(const char* tag, const char* fmt, ...) {
  va_list args;
  va_start(args, fmt);
  vwrite(Level::info, tag, fmt, args);
  va_end(args);
}

void warn(const char* tag, const char* fmt, ...) {
  va_list args;
  va_start(args, fmt);
  vwrite(Level::warn, tag, fmt, args);
  va_end(args);
}

void error(const char* tag, const char* fmt, ...) {
  va_list args;
  va_start(args, fmt);
  vwrite(Level::error, tag, fmt, args);
  va_end(args);
}

} // namespace Log
