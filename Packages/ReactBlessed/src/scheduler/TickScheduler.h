#pragma once

#include "scheduler/Scheduler.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace reactblessed {

// Scheduler driven by an explicit loop: each call to runPendingTasks() is one
// tick. Tasks scheduled while a tick runs wait for the next tick.
class TickScheduler : public Scheduler {
public:
  TickScheduler() = default;

  TaskHandle scheduleTask(
    SchedulerPriority priority,
    Task task,
    const TaskOptions& options = {}) override;

  void cancelTask(TaskHandle handle) override;

  SchedulerPriority getCurrentPriorityLevel() const override;

  double now() const override;

  // Runs every task that is due, highest priority first and FIFO within a
  // priority. Returns the number of tasks run.
  std::size_t runPendingTasks();

  [[nodiscard]] bool hasPendingTasks() const;
  [[nodiscard]] std::size_t pendingTaskCount() const;

private:
  struct ScheduledTask {
    TaskHandle handle;
    SchedulerPriority priority{SchedulerPriority::NormalPriority};
    double dueTime{0.0};
    uint64_t sequence{0};
    Task task;
  };

  void requeue(std::vector<ScheduledTask>& due, std::size_t from);

  std::vector<ScheduledTask> queue_{};
  std::vector<ScheduledTask>* running_{nullptr};
  SchedulerPriority currentPriority_{SchedulerPriority::NormalPriority};
  uint64_t nextTaskId_{1};
  uint64_t nextSequence_{1};
};

} // namespace reactblessed
