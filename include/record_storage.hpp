#pragma once

#include <string>

namespace matrixclock {

/**
 * Named records on non-volatile storage. Only ConfigStore touches it, and
 * only from the main loop.
 */
class RecordStorage {
 public:
  virtual ~RecordStorage() = default;

  virtual bool exists(const char *name) = 0;

  /** Reads the whole record. Returns false when missing or unreadable. */
  virtual bool read(const char *name, std::string &out) = 0;

  /** Creates or truncates `name` and writes `data` to it. */
  virtual bool write(const char *name, const std::string &data) = 0;

  /** Atomically replaces `to` with `from`. */
  virtual bool promote(const char *from, const char *to) = 0;

  virtual bool remove(const char *name) = 0;
};

}  // namespace matrixclock
