#include "scheduler.hpp"

#include "clock_log.hpp"
#include "clock_settings.hpp"

namespace matrixclock {

bool Scheduler::add(Task &task, uint32_t now, uint32_t delayMs) {
  if (count_ >= kMaxTasks || find(task)) {
    return false;
  }
  slots_[count_] = Slot{&task, now + delayMs, 0, 0, false};
  ++count_;
  return true;
}

uint32_t Scheduler::runOnce(uint32_t now) {
  for (size_t i = 0; i < count_; ++i) {
    Slot &slot = slots_[i];
    if (static_cast<int32_t>(now - slot.dueMs) < 0) {
      continue;
    }
    if (slot.restartPending) {
      slot.restartPending = false;
      ++slot.restarts;
      logf("sched", "restarting %s (restart %lu)", slot.task->name(),
           static_cast<unsigned long>(slot.restarts));
      slot.task->restart(now);
    }
    TaskStep result = slot.task->step(now);
    if (result.status == TaskStatus::Ok) {
      slot.dueMs = now + result.delayMs;
      continue;
    }
    ++slot.faults;
    if (slot.task->restartable()) {
      logf("sched", "%s faulted, restart in %lu ms", slot.task->name(),
           static_cast<unsigned long>(kTaskRestartDelayMs));
      slot.restartPending = true;
      slot.dueMs = now + kTaskRestartDelayMs;
    } else {
      logf("sched", "%s faulted, continuing", slot.task->name());
      slot.dueMs = now;
    }
  }

  uint32_t wait = UINT32_MAX;
  for (size_t i = 0; i < count_; ++i) {
    int32_t left = static_cast<int32_t>(slots_[i].dueMs - now);
    uint32_t until = left > 0 ? static_cast<uint32_t>(left) : 0;
    if (until < wait) {
      wait = until;
    }
  }
  return count_ ? wait : 0;
}

bool Scheduler::wake(Task &task, uint32_t now) {
  Slot *slot = find(task);
  if (!slot) {
    return false;
  }
  if (!slot->restartPending) {
    slot->dueMs = now;
  }
  return true;
}

uint32_t Scheduler::faults(const Task &task) const {
  const Slot *slot = find(task);
  return slot ? slot->faults : 0;
}

uint32_t Scheduler::restarts(const Task &task) const {
  const Slot *slot = find(task);
  return slot ? slot->restarts : 0;
}

uint32_t Scheduler::dueMs(const Task &task) const {
  const Slot *slot = find(task);
  return slot ? slot->dueMs : 0;
}

Scheduler::Slot *Scheduler::find(const Task &task) {
  for (size_t i = 0; i < count_; ++i) {
    if (slots_[i].task == &task) {
      return &slots_[i];
    }
  }
  return nullptr;
}

const Scheduler::Slot *Scheduler::find(const Task &task) const {
  for (size_t i = 0; i < count_; ++i) {
    if (slots_[i].task == &task) {
      return &slots_[i];
    }
  }
  return nullptr;
}

}  // namespace matrixclock
