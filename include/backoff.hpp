#pragma once

#include <cstdint>

namespace matrixclock {

/** Returns a uniformly distributed value in `[0, bound)`. */
typedef uint32_t (*RandomSource)(uint32_t bound);

/**
 * Delay schedule for a retry loop: `floorMs` doubled per consecutive failure,
 * clamped to `capMs`, plus up to `jitterMs` of random spread.
 */
struct BackoffPolicy {
  uint32_t floorMs;
  uint32_t capMs;
  uint32_t jitterMs;
};

/**
 * Records retry scheduling information for the network links.
 */
class Backoff {
 public:
  explicit Backoff(const BackoffPolicy &policy, RandomSource random = nullptr)
      : policy_(policy), random_(random) {}

  /** True when no retry is pending or the pending retry time has passed. */
  bool ready(uint32_t now) const {
    return !armed_ || static_cast<int32_t>(now - nextMs_) >= 0;
  }

  /**
   * Arms the next retry after the current step and advances the step.
   * Returns the delay that was scheduled.
   */
  uint32_t schedule(uint32_t now) {
    uint32_t delay = baseDelay(slot_);
    if (delay < policy_.capMs) {
      ++slot_;
    }
    if (policy_.jitterMs && random_) {
      delay += random_(policy_.jitterMs + 1);
    }
    nextMs_ = now + delay;
    lastDelayMs_ = delay;
    armed_ = true;
    if (attempts_ < 0xFF) {
      ++attempts_;
    }
    return delay;
  }

  /** Clears the pending retry and drops back to the floor delay. */
  void reset() {
    nextMs_ = 0;
    slot_ = 0;
    attempts_ = 0;
    lastDelayMs_ = 0;
    armed_ = false;
  }

  bool armed() const { return armed_; }
  uint32_t nextMs() const { return nextMs_; }
  uint32_t lastDelayMs() const { return lastDelayMs_; }
  uint8_t attempts() const { return attempts_; }

  /** Milliseconds until the pending retry, zero when ready. */
  uint32_t remaining(uint32_t now) const {
    return ready(now) ? 0 : nextMs_ - now;
  }

  void setRandomSource(RandomSource random) { random_ = random; }

 private:
  uint32_t baseDelay(uint8_t slot) const {
    uint32_t delay = policy_.floorMs;
    for (uint8_t i = 0; i < slot; ++i) {
      if (delay >= policy_.capMs / 2) {
        return policy_.capMs;
      }
      delay *= 2;
    }
    return delay < policy_.capMs ? delay : policy_.capMs;
  }

  BackoffPolicy policy_;
  RandomSource random_;
  uint32_t nextMs_ = 0;
  uint32_t lastDelayMs_ = 0;
  uint8_t slot_ = 0;
  uint8_t attempts_ = 0;
  bool armed_ = false;
};

}  // namespace matrixclock
