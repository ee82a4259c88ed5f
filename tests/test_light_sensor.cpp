#include <unity.h>

#include <cstring>

#include "clock_settings.hpp"
#include "config_store.hpp"
#include "fakes.hpp"
#include "light_sensor.hpp"

using namespace matrixclock;

namespace {

struct Rig {
  fakes::FakeStorage storage;
  fakes::FakeLightDriver driver;
  ConfigStore config{storage};
  LightSensor sensor{driver, config};

  Rig() { config.load(); }

  void bounds(const char *json) {
    contracts::ValidationError error;
    TEST_ASSERT_TRUE(config.applyJson(json, std::strlen(json), error));
  }
};

}  // namespace

void setUp() {}
void tearDown() {}

void test_mapping_is_linear_and_clamped() {
  TEST_ASSERT_EQUAL(10, mapBrightness(0.0f, 10, 90));
  TEST_ASSERT_EQUAL(10, mapBrightness(kLightRawMin, 10, 90));
  TEST_ASSERT_EQUAL(90, mapBrightness(kLightRawMax, 10, 90));
  TEST_ASSERT_EQUAL(90, mapBrightness(5000.0f, 10, 90));
  float middle = (kLightRawMin + kLightRawMax) / 2.0f;
  TEST_ASSERT_EQUAL(50, mapBrightness(middle, 10, 90));
  TEST_ASSERT_EQUAL(30, mapBrightness(middle, 30, 30));
}

void test_full_scale_step_settles_within_a_second() {
  Rig rig;
  rig.bounds("{\"brightness_min\":0,\"brightness_max\":100}");
  rig.driver.value = kLightRawMin;
  rig.sensor.step(0);
  TEST_ASSERT_EQUAL(0, rig.sensor.level());

  rig.driver.value = kLightRawMax;
  uint32_t now = 0;
  for (int i = 0; i < 10; ++i) {
    now += kLightSampleIntervalMs;
    rig.sensor.step(now);
  }
  TEST_ASSERT_TRUE(rig.sensor.level() >= 98);
  TEST_ASSERT_TRUE(rig.sensor.latest().valid);
  TEST_ASSERT_EQUAL(kLightRawMax, rig.sensor.latest().raw);
}

void test_single_spike_is_damped() {
  Rig rig;
  rig.bounds("{\"brightness_min\":0,\"brightness_max\":100}");
  rig.driver.value = kLightRawMin;
  rig.sensor.step(0);
  rig.driver.value = kLightRawMax;
  rig.sensor.step(100);
  TEST_ASSERT_TRUE(rig.sensor.level() < 50);
}

void test_small_wobble_is_ignored() {
  Rig rig;
  rig.bounds("{\"brightness_min\":0,\"brightness_max\":100}");
  uint16_t base = static_cast<uint16_t>(kLightRawMin + (kLightRawMax - kLightRawMin) / 2);
  rig.driver.value = base;
  rig.sensor.step(0);
  uint8_t settled = rig.sensor.level();
  // A reading one level higher moves the average by well under a level.
  rig.driver.value = static_cast<uint16_t>(base + (kLightRawMax - kLightRawMin) / 100);
  rig.sensor.step(100);
  TEST_ASSERT_EQUAL(settled, rig.sensor.level());
}

void test_bounds_change_takes_effect_immediately() {
  Rig rig;
  rig.driver.value = kLightRawMax;
  rig.sensor.step(0);
  TEST_ASSERT_EQUAL(CLOCK_BRIGHTNESS_MAX, rig.sensor.level());
  rig.bounds("{\"brightness_max\":81}");
  rig.sensor.step(100);
  TEST_ASSERT_EQUAL(81, rig.sensor.level());
}

void test_repeated_read_failures_fault_and_restart_recovers() {
  Rig rig;
  rig.driver.value = kLightRawMax;
  rig.sensor.step(0);
  uint8_t before = rig.sensor.level();

  rig.driver.failing = true;
  TaskStep result = TaskStep::ok(0);
  for (uint8_t i = 0; i < kLightReadFaultLimit; ++i) {
    result = rig.sensor.step(100 * (i + 1));
  }
  TEST_ASSERT_EQUAL(static_cast<int>(TaskStatus::Fault), static_cast<int>(result.status));
  TEST_ASSERT_EQUAL(before, rig.sensor.level());

  rig.sensor.restart(2000);
  TEST_ASSERT_EQUAL(0, rig.sensor.readFailures());
  TEST_ASSERT_FALSE(rig.sensor.latest().valid);
  rig.driver.failing = false;
  rig.driver.value = kLightRawMin;
  result = rig.sensor.step(2100);
  TEST_ASSERT_EQUAL(static_cast<int>(TaskStatus::Ok), static_cast<int>(result.status));
  TEST_ASSERT_EQUAL(CLOCK_BRIGHTNESS_MIN, rig.sensor.level());
}

int main() {
  UNITY_BEGIN();
  RUN_TEST(test_mapping_is_linear_and_clamped);
  RUN_TEST(test_full_scale_step_settles_within_a_second);
  RUN_TEST(test_single_spike_is_damped);
  RUN_TEST(test_small_wobble_is_ignored);
  RUN_TEST(test_bounds_change_takes_effect_immediately);
  RUN_TEST(test_repeated_read_failures_fault_and_restart_recovers);
  return UNITY_END();
}
