#pragma once

#include <cstdint>

namespace matrixclock {

enum class TaskStatus : uint8_t { Ok, Fault };

/**
 * Result of one cooperative step: whether the task is healthy and how long
 * the scheduler may leave it alone before calling it again.
 */
struct TaskStep {
  TaskStatus status;
  uint32_t delayMs;

  static TaskStep ok(uint32_t delayMs) { return TaskStep{TaskStatus::Ok, delayMs}; }
  static TaskStep fault() { return TaskStep{TaskStatus::Fault, 0}; }
};

/**
 * Unit of work driven by the Scheduler. `step()` must return promptly; the
 * return is the only suspension point, so nothing else runs while a step is
 * in progress.
 */
class Task {
 public:
  virtual ~Task() = default;

  virtual const char *name() const = 0;
  virtual TaskStep step(uint32_t now) = 0;

  /** Brings the task back to its initial state after a fault. */
  virtual void restart(uint32_t now) = 0;

  /** Tasks that return false are logged on fault but never restarted. */
  virtual bool restartable() const { return true; }
};

}  // namespace matrixclock
