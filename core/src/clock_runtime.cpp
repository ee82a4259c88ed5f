#include "clock_runtime.hpp"

#include <cstring>

#include "clock_log.hpp"
#include "clock_settings.hpp"

namespace matrixclock {

namespace {

constexpr Color kStatusForeground = kYellow;
constexpr Color kStatusBackground = kBlack;
constexpr Color kErrorForeground = kRed;
constexpr Color kErrorBackground = kBlack;

}  // namespace

ClockRuntime::ClockRuntime(RecordStorage &storage, UdpChannel &udp, MqttClient &mqtt,
                           LightSensorDriver &lightDriver, DisplayDriver &display,
                           RandomSource random)
    : config_(storage),
      clock_(udp, config_),
      light_(lightDriver, config_),
      queue_(kMessageQueueCapacity),
      mqtt_(mqtt, config_, queue_, MQTT_TOPIC_BASE, random),
      renderer_(display, clock_, config_, queue_, light_) {
  mqtt_.setSyncHandler(&ClockRuntime::onSyncRequest, this);
}

void ClockRuntime::onSyncRequest(void *context, uint32_t now) {
  ClockRuntime *self = static_cast<ClockRuntime *>(context);
  self->clock_.requestSync(now);
  self->scheduler_.wake(self->clock_, now);
}

ConfigStore::LoadResult ClockRuntime::begin(uint32_t now) {
  ConfigStore::LoadResult loaded = config_.load();

  clock_.requestSync(now);
  TaskStep first = clock_.step(now);
  uint32_t clockDelay = first.delayMs;
  if (first.status == TaskStatus::Fault) {
    logf("boot", "first time sync could not start");
    clock_.restart(now);
    clockDelay = kTaskRestartDelayMs;
  }

  uint32_t mqttDelay = mqtt_.connect(now) ? kMqttServiceIntervalMs : mqtt_.retryDelay(now);

  struct Registration {
    Task *task;
    uint32_t delayMs;
  };
  const Registration tasks[] = {
      {&renderer_, 0}, {&light_, 0}, {&clock_, clockDelay}, {&mqtt_, mqttDelay},
      {&config_, kPersistIntervalMs},
  };
  for (const Registration &entry : tasks) {
    if (!scheduler_.add(*entry.task, now, entry.delayMs)) {
      logf("boot", "could not schedule %s", entry.task->name());
    }
  }

  observe(now);
  logf("boot", "runtime started with %u tasks", static_cast<unsigned>(scheduler_.size()));
  return loaded;
}

uint32_t ClockRuntime::runOnce(uint32_t now) {
  uint32_t idle = scheduler_.runOnce(now);
  observe(now);
  return idle;
}

void ClockRuntime::observe(uint32_t now) {
  SyncState sync = clock_.state();
  if (sync != seenSync_) {
    if (sync == SyncState::Synced) {
      scrollStatus("NTP synced", now);
    } else if (sync == SyncState::Failed || sync == SyncState::Stale) {
      scrollError("Time sync failed", now);
    }
    seenSync_ = sync;
  }

  bool connected = mqtt_.state() == LinkState::Connected;
  uint32_t sessions = mqtt_.sessions();
  if (seenConnected_ && (!connected || sessions != seenSessions_)) {
    scrollError("MQTT connection down", now);
  }
  if (connected && (!seenConnected_ || sessions != seenSessions_)) {
    scrollStatus("MQTT connected", now);
  }
  seenConnected_ = connected;
  seenSessions_ = sessions;
}

void ClockRuntime::scrollStatus(const char *text, uint32_t now) {
  queue_.push(text, std::strlen(text), now, 1, kStatusForeground, kStatusBackground);
}

void ClockRuntime::scrollError(const char *text, uint32_t now) {
  queue_.push(text, std::strlen(text), now, 1, kErrorForeground, kErrorBackground);
}

}  // namespace matrixclock
