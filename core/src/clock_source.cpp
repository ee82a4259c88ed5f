#include "clock_source.hpp"

#include "clock_log.hpp"
#include "clock_settings.hpp"
#include "ntp_packet.hpp"

namespace matrixclock {

namespace {

constexpr BackoffPolicy kNtpRetryPolicy = {kNtpRetryFloorMs, kNtpRetryCapMs, 0};

}  // namespace

const char *syncStateName(SyncState state) {
  switch (state) {
    case SyncState::Unset:
      return "unset";
    case SyncState::Synced:
      return "synced";
    case SyncState::Stale:
      return "stale";
    case SyncState::Failed:
      return "failed";
  }
  return "?";
}

const char *syncOutcomeName(SyncOutcome outcome) {
  switch (outcome) {
    case SyncOutcome::None:
      return "none";
    case SyncOutcome::Success:
      return "success";
    case SyncOutcome::Timeout:
      return "timeout";
    case SyncOutcome::Malformed:
      return "malformed";
    case SyncOutcome::Unreachable:
      return "unreachable";
  }
  return "?";
}

ClockSource::ClockSource(UdpChannel &udp, const ConfigStore &config)
    : udp_(udp), config_(config), retry_(kNtpRetryPolicy) {}

void ClockSource::requestSync(uint32_t now) {
  nextAttemptMs_ = now;
}

bool ClockSource::now(uint32_t tick, Timestamp &out) const {
  if (!time_.everSynced) {
    return false;
  }
  out.epochMs = time_.anchorEpochMs + static_cast<uint32_t>(tick - time_.anchorTick);
  return true;
}

void ClockSource::recordSuccess(uint64_t epochMs, uint32_t tick) {
  SyncState before = time_.state;
  time_.anchorEpochMs = epochMs;
  time_.anchorTick = tick;
  time_.state = SyncState::Synced;
  time_.lastOutcome = SyncOutcome::Success;
  time_.consecutiveFailures = 0;
  time_.everSynced = true;
  retry_.reset();
  nextAttemptMs_ = tick + kNtpResyncIntervalMs;
  logf("time", "synced (%s -> synced), epoch %llu ms", syncStateName(before),
       static_cast<unsigned long long>(epochMs));
}

void ClockSource::recordFailure(SyncOutcome outcome, uint32_t tick) {
  SyncState before = time_.state;
  time_.lastOutcome = outcome;
  if (time_.consecutiveFailures < 0xFF) {
    ++time_.consecutiveFailures;
  }
  switch (time_.state) {
    case SyncState::Unset:
    case SyncState::Failed:
      time_.state = SyncState::Failed;
      break;
    case SyncState::Synced:
      if (time_.consecutiveFailures >= kNtpStaleAfterFailures) {
        time_.state = SyncState::Stale;
      }
      break;
    case SyncState::Stale:
      break;
  }
  uint32_t delay = retry_.schedule(tick);
  nextAttemptMs_ = tick + delay;
  logf("time", "sync %s (%u in a row, %s -> %s), retry in %lu ms", syncOutcomeName(outcome),
       time_.consecutiveFailures, syncStateName(before), syncStateName(time_.state),
       static_cast<unsigned long>(delay));
}

uint32_t ClockSource::untilNextAttempt(uint32_t now) const {
  int32_t left = static_cast<int32_t>(nextAttemptMs_ - now);
  return left > 0 ? static_cast<uint32_t>(left) : 0;
}

TaskStep ClockSource::step(uint32_t now) {
  if (exchangeActive_) {
    return pollExchange(now);
  }
  uint32_t wait = untilNextAttempt(now);
  if (wait) {
    return TaskStep::ok(wait);
  }
  return beginExchange(now);
}

TaskStep ClockSource::beginExchange(uint32_t now) {
  // No network yet is not a failed sync; the attempt stays due.
  if (!udp_.networkUp()) {
    if (!waitingForNetwork_) {
      logf("time", "waiting for network");
      waitingForNetwork_ = true;
    }
    return TaskStep::ok(kNetworkPollIntervalMs);
  }
  waitingForNetwork_ = false;
  if (!udp_.open()) {
    logf("time", "udp channel unavailable");
    return TaskStep::fault();
  }
  contracts::Configuration cfg = config_.current();
  uint8_t request[kNtpPacketSize];
  buildNtpRequest(request);
  if (!udp_.send(cfg.ntpServer, kNtpPort, request, sizeof(request))) {
    udp_.close();
    recordFailure(SyncOutcome::Unreachable, now);
    return TaskStep::ok(untilNextAttempt(now));
  }
  logf("time", "request sent to %s", cfg.ntpServer);
  sentTick_ = now;
  exchangeActive_ = true;
  return TaskStep::ok(kNtpPollIntervalMs);
}

TaskStep ClockSource::pollExchange(uint32_t now) {
  uint8_t reply[kNtpPacketSize + 20];
  int received = udp_.receive(reply, sizeof(reply));
  if (received < 0) {
    endExchange();
    recordFailure(SyncOutcome::Unreachable, now);
    return TaskStep::ok(untilNextAttempt(now));
  }
  if (received > 0) {
    endExchange();
    uint64_t epochMs = 0;
    if (!parseNtpResponse(reply, static_cast<size_t>(received), epochMs)) {
      recordFailure(SyncOutcome::Malformed, now);
      return TaskStep::ok(untilNextAttempt(now));
    }
    uint32_t roundTrip = now - sentTick_;
    recordSuccess(epochMs + roundTrip / 2, now);
    return TaskStep::ok(untilNextAttempt(now));
  }
  if (now - sentTick_ >= kNtpResponseTimeoutMs) {
    endExchange();
    recordFailure(SyncOutcome::Timeout, now);
    return TaskStep::ok(untilNextAttempt(now));
  }
  return TaskStep::ok(kNtpPollIntervalMs);
}

void ClockSource::endExchange() {
  udp_.close();
  exchangeActive_ = false;
}

void ClockSource::restart(uint32_t now) {
  if (exchangeActive_) {
    endExchange();
  }
  retry_.reset();
  requestSync(now);
}

}  // namespace matrixclock
