#include "message_queue.hpp"

#include "clock_log.hpp"

namespace matrixclock {

size_t copyMessageText(char *dst, size_t cap, const char *src, size_t length) {
  if (!cap) {
    return 0;
  }
  size_t take = length < cap - 1 ? length : cap - 1;
  if (take < length) {
    // Back off to the start of the code point that would be split.
    while (take > 0 && (static_cast<uint8_t>(src[take]) & 0xC0) == 0x80) {
      --take;
    }
  }
  for (size_t i = 0; i < take; ++i) {
    uint8_t c = static_cast<uint8_t>(src[i]);
    dst[i] = c < 0x20 ? ' ' : src[i];
  }
  dst[take] = '\0';
  return take;
}

MessageQueue::MessageQueue(size_t capacity)
    : capacity_(capacity == 0 ? 1
                              : (capacity > kMessageQueueMaxCapacity ? kMessageQueueMaxCapacity
                                                                     : capacity)) {}

MessageQueue::PushResult MessageQueue::push(const char *text, size_t length, uint32_t now,
                                            uint8_t repeat, Color fg, Color bg) {
  if (!text || !length) {
    return PushResult::Rejected;
  }
  PushResult result = PushResult::Queued;
  if (count_ == capacity_) {
    logf("queue", "full, dropping message %lu", static_cast<unsigned long>(slots_[head_].id));
    head_ = (head_ + 1) % capacity_;
    --count_;
    ++evicted_;
    result = PushResult::EvictedOldest;
  }
  ScrollMessage &slot = slots_[(head_ + count_) % capacity_];
  slot.id = nextId_++;
  copyMessageText(slot.text, sizeof(slot.text), text, length);
  slot.enqueuedMs = now;
  slot.repeat = repeat == 0 ? 1 : repeat;
  slot.foreground = fg;
  slot.background = bg;
  ++count_;
  return result;
}

const ScrollMessage *MessageQueue::peekActive() const {
  return count_ ? &slots_[head_] : nullptr;
}

bool MessageQueue::advance() {
  if (!count_) {
    return false;
  }
  head_ = (head_ + 1) % capacity_;
  --count_;
  return true;
}

const ScrollMessage *MessageQueue::at(size_t index) const {
  if (index >= count_) {
    return nullptr;
  }
  return &slots_[(head_ + index) % capacity_];
}

void MessageQueue::clear() {
  head_ = 0;
  count_ = 0;
}

}  // namespace matrixclock
