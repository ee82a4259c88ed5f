#include <unity.h>

#include "civil_time.hpp"
#include "clock_settings.hpp"
#include "clock_source.hpp"
#include "config_store.hpp"
#include "fakes.hpp"
#include "ntp_packet.hpp"

using namespace matrixclock;

namespace {

constexpr uint32_t kNovember2023 = 1700000000UL;  // 2023-11-14 22:13:20 UTC

struct Rig {
  fakes::FakeStorage storage;
  fakes::FakeUdp udp;
  ConfigStore config{storage};
  ClockSource clock{udp, config};

  Rig() { config.load(); }
};

int stateOf(const ClockSource &clock) { return static_cast<int>(clock.state()); }

}  // namespace

void setUp() {}
void tearDown() {}

void test_now_is_unavailable_before_first_sync() {
  Rig rig;
  Timestamp ts;
  TEST_ASSERT_EQUAL(static_cast<int>(SyncState::Unset), stateOf(rig.clock));
  TEST_ASSERT_FALSE(rig.clock.now(1234, ts));

  rig.clock.recordFailure(SyncOutcome::Timeout, 10);
  TEST_ASSERT_EQUAL(static_cast<int>(SyncState::Failed), stateOf(rig.clock));
  TEST_ASSERT_FALSE(rig.clock.now(20, ts));
}

void test_exchange_anchors_time_to_reply() {
  Rig rig;
  rig.clock.requestSync(1000);
  TaskStep sent = rig.clock.step(1000);
  TEST_ASSERT_EQUAL(static_cast<int>(TaskStatus::Ok), static_cast<int>(sent.status));
  TEST_ASSERT_EQUAL(1, rig.udp.sends);
  TEST_ASSERT_EQUAL_STRING(NTP_SERVER, rig.udp.lastHost.c_str());
  TEST_ASSERT_EQUAL(123, rig.udp.lastPort);
  TEST_ASSERT_EQUAL(kNtpPacketSize, rig.udp.lastRequest.size());
  TEST_ASSERT_EQUAL_HEX8(0xE3, rig.udp.lastRequest[0]);
  TEST_ASSERT_TRUE(rig.clock.exchangeActive());

  rig.clock.step(1020);
  TEST_ASSERT_TRUE(rig.clock.exchangeActive());

  rig.udp.replies.push_back(fakes::ntpReply(kNovember2023));
  rig.clock.step(1100);
  TEST_ASSERT_FALSE(rig.clock.exchangeActive());
  TEST_ASSERT_FALSE(rig.udp.isOpen);
  TEST_ASSERT_EQUAL(static_cast<int>(SyncState::Synced), stateOf(rig.clock));

  Timestamp ts;
  TEST_ASSERT_TRUE(rig.clock.now(1100, ts));
  // Half of the 100 ms round trip is credited to the reply.
  TEST_ASSERT_EQUAL_UINT64(kNovember2023 * 1000ULL + 50, ts.epochMs);
  TEST_ASSERT_TRUE(rig.clock.now(61100, ts));
  TEST_ASSERT_EQUAL_UINT64(kNovember2023 * 1000ULL + 60050, ts.epochMs);
  TEST_ASSERT_EQUAL_UINT32(1100 + kNtpResyncIntervalMs, rig.clock.nextAttemptMs());
}

void test_three_failures_after_sync_turn_stale() {
  Rig rig;
  rig.clock.recordSuccess(kNovember2023 * 1000ULL, 0);
  TEST_ASSERT_EQUAL(static_cast<int>(SyncState::Synced), stateOf(rig.clock));

  const SyncState expected[] = {SyncState::Synced, SyncState::Synced, SyncState::Stale,
                                SyncState::Stale, SyncState::Stale};
  for (int i = 0; i < 5; ++i) {
    rig.clock.recordFailure(SyncOutcome::Timeout, 1000 * (i + 1));
    TEST_ASSERT_EQUAL(static_cast<int>(expected[i]), stateOf(rig.clock));
  }
  Timestamp ts;
  TEST_ASSERT_TRUE(rig.clock.now(10000, ts));
  TEST_ASSERT_EQUAL_UINT64(kNovember2023 * 1000ULL + 10000, ts.epochMs);

  rig.clock.recordSuccess(kNovember2023 * 1000ULL + 20000, 20000);
  TEST_ASSERT_EQUAL(static_cast<int>(SyncState::Synced), stateOf(rig.clock));
  TEST_ASSERT_EQUAL(0, rig.clock.timeState().consecutiveFailures);
}

void test_alternating_outcomes_stay_synced() {
  Rig rig;
  for (int i = 0; i < 4; ++i) {
    rig.clock.recordSuccess(kNovember2023 * 1000ULL, i * 2000);
    TEST_ASSERT_EQUAL(static_cast<int>(SyncState::Synced), stateOf(rig.clock));
    rig.clock.recordFailure(SyncOutcome::Unreachable, i * 2000 + 1000);
    TEST_ASSERT_EQUAL(static_cast<int>(SyncState::Synced), stateOf(rig.clock));
  }
}

void test_failed_recovers_on_success() {
  Rig rig;
  rig.clock.recordFailure(SyncOutcome::Unreachable, 0);
  rig.clock.recordFailure(SyncOutcome::Timeout, 2000);
  TEST_ASSERT_EQUAL(static_cast<int>(SyncState::Failed), stateOf(rig.clock));
  rig.clock.recordSuccess(kNovember2023 * 1000ULL, 5000);
  TEST_ASSERT_EQUAL(static_cast<int>(SyncState::Synced), stateOf(rig.clock));
}

void test_timeouts_back_off_exponentially() {
  Rig rig;
  uint32_t now = 0;
  const uint32_t expected[] = {2000, 4000, 8000, 16000};
  rig.clock.requestSync(now);
  for (uint32_t delay : expected) {
    rig.clock.step(now);
    TEST_ASSERT_TRUE(rig.clock.exchangeActive());
    now += kNtpResponseTimeoutMs;
    rig.clock.step(now);
    TEST_ASSERT_FALSE(rig.clock.exchangeActive());
    TEST_ASSERT_EQUAL(static_cast<int>(SyncOutcome::Timeout),
                      static_cast<int>(rig.clock.timeState().lastOutcome));
    TEST_ASSERT_EQUAL_UINT32(delay, rig.clock.lastRetryDelayMs());
    TaskStep waiting = rig.clock.step(now);
    TEST_ASSERT_EQUAL_UINT32(delay, waiting.delayMs);
    now += delay;
  }
}

void test_retry_delay_is_capped() {
  Rig rig;
  for (int i = 0; i < 20; ++i) {
    rig.clock.recordFailure(SyncOutcome::Timeout, 0);
  }
  TEST_ASSERT_EQUAL_UINT32(kNtpRetryCapMs, rig.clock.lastRetryDelayMs());
}

void test_bad_replies_count_as_malformed() {
  Rig rig;
  rig.clock.requestSync(0);
  rig.clock.step(0);
  rig.udp.replies.push_back(fakes::ntpReply(kNovember2023, 0));
  rig.clock.step(20);
  TEST_ASSERT_EQUAL(static_cast<int>(SyncOutcome::Malformed),
                    static_cast<int>(rig.clock.timeState().lastOutcome));
  TEST_ASSERT_EQUAL(static_cast<int>(SyncState::Failed), stateOf(rig.clock));
}

void test_send_failure_is_unreachable() {
  Rig rig;
  rig.udp.sendOk = false;
  rig.clock.requestSync(0);
  TaskStep result = rig.clock.step(0);
  TEST_ASSERT_EQUAL(static_cast<int>(TaskStatus::Ok), static_cast<int>(result.status));
  TEST_ASSERT_EQUAL(static_cast<int>(SyncOutcome::Unreachable),
                    static_cast<int>(rig.clock.timeState().lastOutcome));
  TEST_ASSERT_FALSE(rig.udp.isOpen);
}

void test_unavailable_socket_faults_and_restart_keeps_time() {
  Rig rig;
  rig.clock.recordSuccess(kNovember2023 * 1000ULL, 0);
  rig.clock.requestSync(100);
  rig.udp.openOk = false;
  TaskStep result = rig.clock.step(100);
  TEST_ASSERT_EQUAL(static_cast<int>(TaskStatus::Fault), static_cast<int>(result.status));

  rig.clock.restart(1100);
  TEST_ASSERT_EQUAL(static_cast<int>(SyncState::Synced), stateOf(rig.clock));
  Timestamp ts;
  TEST_ASSERT_TRUE(rig.clock.now(1100, ts));
  TEST_ASSERT_EQUAL_UINT32(1100, rig.clock.nextAttemptMs());
}

void test_ntp_parse_validation() {
  uint64_t epochMs = 0;
  std::vector<uint8_t> good = fakes::ntpReply(kNovember2023, 1, 4, 0x80000000u);
  TEST_ASSERT_TRUE(parseNtpResponse(good.data(), good.size(), epochMs));
  TEST_ASSERT_EQUAL_UINT64(kNovember2023 * 1000ULL + 500, epochMs);

  TEST_ASSERT_FALSE(parseNtpResponse(good.data(), 47, epochMs));
  std::vector<uint8_t> client = fakes::ntpReply(kNovember2023, 2, 3);
  TEST_ASSERT_FALSE(parseNtpResponse(client.data(), client.size(), epochMs));
  std::vector<uint8_t> kiss = fakes::ntpReply(kNovember2023, 0);
  TEST_ASSERT_FALSE(parseNtpResponse(kiss.data(), kiss.size(), epochMs));
  std::vector<uint8_t> broadcast = fakes::ntpReply(kNovember2023, 3, 5);
  TEST_ASSERT_TRUE(parseNtpResponse(broadcast.data(), broadcast.size(), epochMs));

  std::vector<uint8_t> empty(kNtpPacketSize, 0);
  empty[0] = 0x24;
  empty[1] = 2;
  TEST_ASSERT_FALSE(parseNtpResponse(empty.data(), empty.size(), epochMs));
}

void test_ntp_era_rollover() {
  // NTP seconds 0x00000010 in era 1 is 2036-02-07 06:28:32 UTC.
  std::vector<uint8_t> packet(kNtpPacketSize, 0);
  packet[0] = 0x24;
  packet[1] = 1;
  packet[43] = 0x10;
  uint64_t epochMs = 0;
  TEST_ASSERT_TRUE(parseNtpResponse(packet.data(), packet.size(), epochMs));
  TEST_ASSERT_EQUAL_UINT64((kNtpEraSeconds + 16 - kNtpUnixOffset) * 1000ULL, epochMs);
}

void test_local_time_applies_offset() {
  LocalTime utc = toLocalTime(kNovember2023 * 1000ULL, 0);
  TEST_ASSERT_EQUAL(2023, utc.year);
  TEST_ASSERT_EQUAL(11, utc.month);
  TEST_ASSERT_EQUAL(14, utc.day);
  TEST_ASSERT_EQUAL(22, utc.hour);
  TEST_ASSERT_EQUAL(13, utc.minute);
  TEST_ASSERT_EQUAL(20, utc.second);
  TEST_ASSERT_EQUAL(2, utc.weekday);

  LocalTime east = toLocalTime(kNovember2023 * 1000ULL, 120);
  TEST_ASSERT_EQUAL(15, east.day);
  TEST_ASSERT_EQUAL(0, east.hour);

  LocalTime west = toLocalTime(kNovember2023 * 1000ULL, -1440);
  TEST_ASSERT_EQUAL(13, west.day);
  TEST_ASSERT_EQUAL(22, west.hour);

  LocalTime leap = toLocalTime(951782400000ULL, 0);  // 2000-02-29
  TEST_ASSERT_EQUAL(2000, leap.year);
  TEST_ASSERT_EQUAL(2, leap.month);
  TEST_ASSERT_EQUAL(29, leap.day);
}

void test_missing_network_defers_sync_without_failure() {
  Rig rig;
  rig.udp.network = false;
  rig.clock.requestSync(0);
  TaskStep waiting = rig.clock.step(0);
  TEST_ASSERT_EQUAL(static_cast<int>(TaskStatus::Ok), static_cast<int>(waiting.status));
  TEST_ASSERT_EQUAL_UINT32(kNetworkPollIntervalMs, waiting.delayMs);
  TEST_ASSERT_EQUAL(0, rig.udp.opens);
  TEST_ASSERT_EQUAL(0, rig.udp.sends);
  TEST_ASSERT_TRUE(rig.clock.waitingForNetwork());
  TEST_ASSERT_EQUAL(static_cast<int>(SyncState::Unset), stateOf(rig.clock));
  TEST_ASSERT_EQUAL(0, rig.clock.timeState().consecutiveFailures);

  rig.udp.network = true;
  rig.clock.step(kNetworkPollIntervalMs);
  TEST_ASSERT_EQUAL(1, rig.udp.sends);
  TEST_ASSERT_TRUE(rig.clock.exchangeActive());
  TEST_ASSERT_FALSE(rig.clock.waitingForNetwork());
}

int main() {
  UNITY_BEGIN();
  RUN_TEST(test_now_is_unavailable_before_first_sync);
  RUN_TEST(test_exchange_anchors_time_to_reply);
  RUN_TEST(test_three_failures_after_sync_turn_stale);
  RUN_TEST(test_alternating_outcomes_stay_synced);
  RUN_TEST(test_failed_recovers_on_success);
  RUN_TEST(test_timeouts_back_off_exponentially);
  RUN_TEST(test_retry_delay_is_capped);
  RUN_TEST(test_bad_replies_count_as_malformed);
  RUN_TEST(test_send_failure_is_unreachable);
  RUN_TEST(test_unavailable_socket_faults_and_restart_keeps_time);
  RUN_TEST(test_ntp_parse_validation);
  RUN_TEST(test_ntp_era_rollover);
  RUN_TEST(test_local_time_applies_offset);
  RUN_TEST(test_missing_network_defers_sync_without_failure);
  return UNITY_END();
}
