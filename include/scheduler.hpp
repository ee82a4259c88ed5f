#pragma once

#include <cstddef>
#include <cstdint>

#include "task.hpp"

namespace matrixclock {

constexpr size_t kMaxTasks = 8;

/**
 * Cooperative round-robin over a fixed set of tasks. Each due task gets one
 * step per pass; a faulting task is restarted after kTaskRestartDelayMs
 * unless it opts out of restarts.
 */
class Scheduler {
 public:
  /** Registers `task`, first due `delayMs` after `now`. False when full. */
  bool add(Task &task, uint32_t now, uint32_t delayMs = 0);

  /** Steps every due task once. Returns the time until the next one is due. */
  uint32_t runOnce(uint32_t now);

  /** Makes `task` due immediately. */
  bool wake(Task &task, uint32_t now);

  size_t size() const { return count_; }
  uint32_t faults(const Task &task) const;
  uint32_t restarts(const Task &task) const;
  /** Absolute tick at which `task` next runs. */
  uint32_t dueMs(const Task &task) const;

 private:
  struct Slot {
    Task *task;
    uint32_t dueMs;
    uint32_t faults;
    uint32_t restarts;
    bool restartPending;
  };

  Slot *find(const Task &task);
  const Slot *find(const Task &task) const;

  Slot slots_[kMaxTasks] = {};
  size_t count_ = 0;
};

}  // namespace matrixclock
