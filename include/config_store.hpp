#pragma once

#include <cstdint>
#include <string>

#include "contracts.hpp"
#include "record_storage.hpp"
#include "task.hpp"

namespace matrixclock {

/**
 * Owns the Configuration record. Readers get copies; the only mutation path
 * is applyUpdate(), which validates before committing.
 */
class ConfigStore : public Task {
 public:
  enum class LoadResult : uint8_t { Loaded, Defaulted, Corrupt };

  explicit ConfigStore(RecordStorage &storage) : storage_(storage) {}

  /** Loads the stored record, falling back to defaults when it is absent or corrupt. */
  LoadResult load();

  /** Returns a snapshot of the committed configuration. */
  contracts::Configuration current() const { return config_; }

  /**
   * Validates `update` against the committed record and commits it in one
   * step. On failure `error` names the offending field and nothing changes.
   */
  bool applyUpdate(const contracts::ConfigUpdate &update, contracts::ValidationError &error);

  /** Decodes a JSON payload and applies it. */
  bool applyJson(const char *json, size_t length, contracts::ValidationError &error);

  /** Runs write-then-verify-then-swap for the committed record. */
  bool flush();

  uint32_t revision() const { return revision_; }
  bool dirty() const { return revision_ != persistedRevision_; }
  uint8_t persistFailures() const { return persistFailures_; }
  const std::string &lastError() const { return lastError_; }

  const char *name() const override { return "config"; }
  TaskStep step(uint32_t now) override;
  void restart(uint32_t now) override;

 private:
  bool fail(const char *reason);

  RecordStorage &storage_;
  contracts::Configuration config_;
  uint32_t revision_ = 0;
  uint32_t persistedRevision_ = 0;
  uint32_t nextAttemptMs_ = 0;
  uint8_t persistFailures_ = 0;
  bool retryPending_ = false;
  std::string lastError_;
};

/** Frames `json` as a storage record: the JSON, a newline, and 8 hex digits of CRC-32. */
std::string encodeConfigRecord(const std::string &json);

/** Checks the framing and checksum of a stored record and extracts the JSON. */
bool decodeConfigRecord(const std::string &record, std::string &json);

}  // namespace matrixclock
