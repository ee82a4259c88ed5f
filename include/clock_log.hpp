#pragma once

#include <cstddef>

namespace matrixclock {

/** Receives one formatted log line without a trailing newline. */
typedef void (*LogSink)(const char *line);

constexpr size_t kLogLineMax = 192;

/** Routes log lines to `sink`. Passing nullptr restores the stdout sink. */
void setLogSink(LogSink sink);

/** Emits a `[tag] message` line. Lines longer than kLogLineMax are cut. */
void logf(const char *tag, const char *fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 2, 3)))
#endif
    ;

}  // namespace matrixclock
