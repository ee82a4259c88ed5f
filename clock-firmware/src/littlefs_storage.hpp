#pragma once

#include <Arduino.h>
#include <LittleFS.h>

#include <string>

#include "record_storage.hpp"

/** RecordStorage on the LittleFS flash partition. */
class LittleFsStorage : public matrixclock::RecordStorage {
 public:
  /** Mounts the filesystem, formatting it once if the mount fails. */
  bool begin() {
    if (LittleFS.begin()) {
      return true;
    }
    Serial.println(F("[fs] mount failed, formatting"));
    return LittleFS.format() && LittleFS.begin();
  }

  bool exists(const char *name) override { return LittleFS.exists(name); }

  bool read(const char *name, std::string &out) override {
    File file = LittleFS.open(name, "r");
    if (!file) {
      return false;
    }
    out.clear();
    out.reserve(file.size());
    uint8_t chunk[64];
    while (file.available()) {
      int n = file.read(chunk, sizeof(chunk));
      if (n <= 0) {
        break;
      }
      out.append(reinterpret_cast<const char *>(chunk), static_cast<size_t>(n));
    }
    bool complete = out.size() == file.size();
    file.close();
    return complete;
  }

  bool write(const char *name, const std::string &data) override {
    File file = LittleFS.open(name, "w");
    if (!file) {
      return false;
    }
    size_t written = file.write(reinterpret_cast<const uint8_t *>(data.data()), data.size());
    file.close();
    return written == data.size();
  }

  bool promote(const char *from, const char *to) override { return LittleFS.rename(from, to); }

  bool remove(const char *name) override { return LittleFS.remove(name); }
};
