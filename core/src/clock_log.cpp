#include "clock_log.hpp"

#include <cstdarg>
#include <cstdio>

namespace matrixclock {

namespace {

void stdoutSink(const char *line) {
  std::fputs(line, stdout);
  std::fputc('\n', stdout);
}

LogSink activeSink = stdoutSink;

}  // namespace

void setLogSink(LogSink sink) { activeSink = sink ? sink : stdoutSink; }

void logf(const char *tag, const char *fmt, ...) {
  char line[kLogLineMax];
  int used = std::snprintf(line, sizeof(line), "[%s] ", tag ? tag : "clock");
  if (used < 0) {
    return;
  }
  if (static_cast<size_t>(used) < sizeof(line)) {
    va_list args;
    va_start(args, fmt);
    std::vsnprintf(line + used, sizeof(line) - used, fmt, args);
    va_end(args);
  }
  activeSink(line);
}

}  // namespace matrixclock
