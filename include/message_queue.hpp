#pragma once

#include <cstddef>
#include <cstdint>

#include "clock_settings.hpp"
#include "color.hpp"

namespace matrixclock {

constexpr size_t kMessageTextMax = 160;
constexpr size_t kMessageQueueMaxCapacity = 16;

struct ScrollMessage {
  uint32_t id;
  char text[kMessageTextMax + 1];
  uint32_t enqueuedMs;
  uint8_t repeat;
  Color foreground;
  Color background;
};

/**
 * Copies at most `cap - 1` bytes of `src` into `dst`, never splitting a UTF-8
 * sequence and turning control characters (CR, LF, tab) into spaces.
 * Returns the number of bytes written.
 */
size_t copyMessageText(char *dst, size_t cap, const char *src, size_t length);

/**
 * Fixed-capacity FIFO of scroll messages. When full, the oldest entry is
 * dropped to make room. One producer (MQTT dispatch and runtime status) and
 * one consumer (Renderer), serialized by the cooperative scheduler.
 */
class MessageQueue {
 public:
  enum class PushResult : uint8_t { Queued, EvictedOldest, Rejected };

  explicit MessageQueue(size_t capacity = kMessageQueueCapacity);

  PushResult push(const char *text, size_t length, uint32_t now, uint8_t repeat, Color fg,
                  Color bg);

  /** The message being scrolled, or nullptr when idle. */
  const ScrollMessage *peekActive() const;

  /** Pops the active message. False when the queue was already empty. */
  bool advance();

  /** Entry `index` counted from the oldest, or nullptr. */
  const ScrollMessage *at(size_t index) const;

  size_t size() const { return count_; }
  size_t capacity() const { return capacity_; }
  bool empty() const { return count_ == 0; }
  uint32_t evicted() const { return evicted_; }
  void clear();

 private:
  ScrollMessage slots_[kMessageQueueMaxCapacity];
  size_t capacity_;
  size_t head_ = 0;
  size_t count_ = 0;
  uint32_t nextId_ = 1;
  uint32_t evicted_ = 0;
};

}  // namespace matrixclock
