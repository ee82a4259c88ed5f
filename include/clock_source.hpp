#pragma once

#include <cstdint>

#include "backoff.hpp"
#include "config_store.hpp"
#include "task.hpp"
#include "udp_channel.hpp"

namespace matrixclock {

enum class SyncState : uint8_t { Unset, Synced, Stale, Failed };
enum class SyncOutcome : uint8_t { None, Success, Timeout, Malformed, Unreachable };

const char *syncStateName(SyncState state);
const char *syncOutcomeName(SyncOutcome outcome);

struct Timestamp {
  uint64_t epochMs;
};

/** Everything known about wall-clock time. Only ClockSource writes it. */
struct TimeState {
  uint64_t anchorEpochMs = 0;
  uint32_t anchorTick = 0;
  SyncState state = SyncState::Unset;
  SyncOutcome lastOutcome = SyncOutcome::None;
  uint8_t consecutiveFailures = 0;
  bool everSynced = false;
};

/**
 * Keeps wall-clock time anchored to the last successful NTP exchange and
 * runs that exchange without blocking: one step sends the request, later
 * steps poll for the reply until it arrives or times out.
 */
class ClockSource : public Task {
 public:
  ClockSource(UdpChannel &udp, const ConfigStore &config);

  /** Makes the next step start an exchange right away. */
  void requestSync(uint32_t now);

  /**
   * Current time at `tick`. False while no exchange has ever succeeded, so
   * nothing fabricated is ever shown.
   */
  bool now(uint32_t tick, Timestamp &out) const;

  void recordSuccess(uint64_t epochMs, uint32_t tick);
  void recordFailure(SyncOutcome outcome, uint32_t tick);

  SyncState state() const { return time_.state; }
  const TimeState &timeState() const { return time_; }
  bool exchangeActive() const { return exchangeActive_; }
  bool waitingForNetwork() const { return waitingForNetwork_; }
  uint32_t nextAttemptMs() const { return nextAttemptMs_; }
  uint32_t lastRetryDelayMs() const { return retry_.lastDelayMs(); }

  const char *name() const override { return "clock"; }
  TaskStep step(uint32_t now) override;
  void restart(uint32_t now) override;

 private:
  TaskStep beginExchange(uint32_t now);
  TaskStep pollExchange(uint32_t now);
  void endExchange();
  uint32_t untilNextAttempt(uint32_t now) const;

  UdpChannel &udp_;
  const ConfigStore &config_;
  TimeState time_;
  Backoff retry_;
  uint32_t nextAttemptMs_ = 0;
  uint32_t sentTick_ = 0;
  bool exchangeActive_ = false;
  bool waitingForNetwork_ = false;
};

}  // namespace matrixclock
