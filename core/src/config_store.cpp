#include "config_store.hpp"

#include <cstdio>
#include <cstdlib>

#include "clock_log.hpp"
#include "clock_settings.hpp"
#include "crc32.hpp"

namespace matrixclock {

namespace {

constexpr size_t kChecksumDigits = 8;

const char *loadResultName(ConfigStore::LoadResult result) {
  switch (result) {
    case ConfigStore::LoadResult::Loaded:
      return "loaded";
    case ConfigStore::LoadResult::Defaulted:
      return "defaulted";
    case ConfigStore::LoadResult::Corrupt:
      return "corrupt";
  }
  return "?";
}

}  // namespace

std::string encodeConfigRecord(const std::string &json) {
  char checksum[kChecksumDigits + 1];
  std::snprintf(checksum, sizeof(checksum), "%08lx",
                static_cast<unsigned long>(crc32(json.data(), json.size())));
  std::string record;
  record.reserve(json.size() + 1 + kChecksumDigits);
  record += json;
  record += '\n';
  record += checksum;
  return record;
}

bool decodeConfigRecord(const std::string &record, std::string &json) {
  if (record.size() < kChecksumDigits + 2) {
    return false;
  }
  size_t split = record.size() - kChecksumDigits - 1;
  if (record[split] != '\n') {
    return false;
  }
  std::string digits = record.substr(split + 1);
  for (char c : digits) {
    bool hex = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
    if (!hex) {
      return false;
    }
  }
  uint32_t stored = static_cast<uint32_t>(std::strtoul(digits.c_str(), nullptr, 16));
  if (crc32(record.data(), split) != stored) {
    return false;
  }
  json.assign(record, 0, split);
  return true;
}

ConfigStore::LoadResult ConfigStore::load() {
  revision_ = 0;
  persistedRevision_ = 0;
  persistFailures_ = 0;
  retryPending_ = false;
  config_ = contracts::defaultConfiguration();

  if (storage_.exists(kConfigStagingName)) {
    logf("config", "removing leftover staging record");
    if (!storage_.remove(kConfigStagingName)) {
      logf("config", "could not remove %s", kConfigStagingName);
    }
  }

  LoadResult result = LoadResult::Loaded;
  std::string record;
  std::string json;
  contracts::ValidationError error;
  contracts::Configuration loaded;
  if (!storage_.exists(kConfigRecordName)) {
    result = LoadResult::Defaulted;
  } else if (!storage_.read(kConfigRecordName, record)) {
    logf("config", "stored record unreadable");
    result = LoadResult::Corrupt;
  } else if (!decodeConfigRecord(record, json)) {
    logf("config", "stored record failed checksum (%u bytes)",
         static_cast<unsigned>(record.size()));
    result = LoadResult::Corrupt;
  } else if (!contracts::decodeConfiguration(json.c_str(), json.size(), loaded, error)) {
    logf("config", "stored record rejected: %s %s", contracts::validationCodeName(error.code),
         error.field);
    result = LoadResult::Corrupt;
  } else {
    config_ = loaded;
  }

  logf("config", "load %s (format=%s offset=%d brightness=%u..%u)", loadResultName(result),
       contracts::timeFormatName(config_.timeFormat), config_.utcOffsetMinutes,
       config_.brightnessMin, config_.brightnessMax);
  return result;
}

bool ConfigStore::applyUpdate(const contracts::ConfigUpdate &update,
                              contracts::ValidationError &error) {
  contracts::Configuration next;
  if (!contracts::mergeUpdate(config_, update, next, error)) {
    logf("config", "update rejected: %s %s", contracts::validationCodeName(error.code),
         error.field);
    return false;
  }
  config_ = next;
  ++revision_;
  logf("config", "update applied, revision %lu", static_cast<unsigned long>(revision_));
  return true;
}

bool ConfigStore::applyJson(const char *json, size_t length, contracts::ValidationError &error) {
  contracts::ConfigUpdate update;
  if (!contracts::decodeConfigUpdate(json, length, update, error)) {
    logf("config", "update rejected: %s %s", contracts::validationCodeName(error.code),
         error.field);
    return false;
  }
  return applyUpdate(update, error);
}

bool ConfigStore::fail(const char *reason) {
  lastError_ = reason;
  logf("config", "persist failed: %s", reason);
  return false;
}

bool ConfigStore::flush() {
  lastError_.clear();
  uint32_t writing = revision_;
  std::string json;
  if (!contracts::encodeConfiguration(config_, json)) {
    return fail("encode");
  }
  std::string record = encodeConfigRecord(json);
  if (!storage_.write(kConfigStagingName, record)) {
    return fail("staging write");
  }
  std::string readBack;
  if (!storage_.read(kConfigStagingName, readBack) || readBack != record) {
    if (!storage_.remove(kConfigStagingName)) {
      logf("config", "could not remove %s", kConfigStagingName);
    }
    return fail("staging verify");
  }
  if (!storage_.promote(kConfigStagingName, kConfigRecordName)) {
    return fail("promote");
  }
  persistedRevision_ = writing;
  logf("config", "persisted revision %lu (%u bytes)", static_cast<unsigned long>(writing),
       static_cast<unsigned>(record.size()));
  return true;
}

TaskStep ConfigStore::step(uint32_t now) {
  if (!dirty()) {
    return TaskStep::ok(kPersistIntervalMs);
  }
  if (retryPending_ && static_cast<int32_t>(now - nextAttemptMs_) < 0) {
    return TaskStep::ok(nextAttemptMs_ - now);
  }
  if (flush()) {
    persistFailures_ = 0;
    retryPending_ = false;
    return TaskStep::ok(kPersistIntervalMs);
  }
  ++persistFailures_;
  if (persistFailures_ >= kPersistFaultLimit) {
    return TaskStep::fault();
  }
  retryPending_ = true;
  nextAttemptMs_ = now + kPersistRetryMs;
  return TaskStep::ok(kPersistRetryMs);
}

void ConfigStore::restart(uint32_t now) {
  persistFailures_ = 0;
  retryPending_ = false;
  nextAttemptMs_ = now;
  lastError_.clear();
}

}  // namespace matrixclock
