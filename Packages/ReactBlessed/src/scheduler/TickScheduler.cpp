#include "scheduler/TickScheduler.h"

#include <algorithm>
#include <chrono>
#include <utility>

namespace reactblessed {

TaskHandle TickScheduler::scheduleTask(
  SchedulerPriority priority,
  Task task,
  const TaskOptions& options) {
  if (!task) {
    return TaskHandle{};
  }

  ScheduledTask entry;
  entry.handle = TaskHandle{nextTaskId_++};
  entry.priority = priority;
  entry.dueTime = now() + std::max(0.0, options.delayMs);
  entry.sequence = nextSequence_++;
  entry.task = std::move(task);
  queue_.push_back(std::move(entry));
  return queue_.back().handle;
}

void TickScheduler::cancelTask(TaskHandle handle) {
  if (!handle) {
    return;
  }
  queue_.erase(
    std::remove_if(
      queue_.begin(),
      queue_.end(),
      [&](const ScheduledTask& entry) {
        return entry.handle == handle;
      }),
    queue_.end());
  if (running_ != nullptr) {
    for (auto& entry : *running_) {
      if (entry.handle == handle) {
        entry.task = nullptr;
      }
    }
  }
}

SchedulerPriority TickScheduler::getCurrentPriorityLevel() const {
  return currentPriority_;
}

double TickScheduler::now() const {
  const auto steadyNow = std::chrono::steady_clock::now().time_since_epoch();
  return std::chrono::duration_cast<std::chrono::duration<double, std::milli>>(steadyNow).count();
}

std::size_t TickScheduler::runPendingTasks() {
  const double tickTime = now();

  std::vector<ScheduledTask> due;
  std::vector<ScheduledTask> waiting;
  for (auto& entry : queue_) {
    if (entry.dueTime <= tickTime) {
      due.push_back(std::move(entry));
    } else {
      waiting.push_back(std::move(entry));
    }
  }
  queue_ = std::move(waiting);

  std::stable_sort(due.begin(), due.end(), [](const ScheduledTask& a, const ScheduledTask& b) {
    if (a.priority != b.priority) {
      return static_cast<uint8_t>(a.priority) < static_cast<uint8_t>(b.priority);
    }
    return a.sequence < b.sequence;
  });

  // Tasks cancelled by an earlier task of the same tick are skipped.
  running_ = &due;
  const auto previous = currentPriority_;
  std::size_t ran = 0;
  for (std::size_t index = 0; index < due.size(); ++index) {
    if (!due[index].task) {
      continue;
    }
    auto task = std::move(due[index].task);
    due[index].task = nullptr;
    currentPriority_ = due[index].priority;
    try {
      task();
    } catch (...) {
      currentPriority_ = previous;
      running_ = nullptr;
      requeue(due, index + 1);
      throw;
    }
    ++ran;
  }
  currentPriority_ = previous;
  running_ = nullptr;
  return ran;
}

void TickScheduler::requeue(std::vector<ScheduledTask>& due, std::size_t from) {
  for (std::size_t index = from; index < due.size(); ++index) {
    if (due[index].task) {
      queue_.push_back(std::move(due[index]));
    }
  }
}

bool TickScheduler::hasPendingTasks() const {
  return !queue_.empty();
}

std::size_t TickScheduler::pendingTaskCount() const {
  return queue_.size();
}

} // namespace reactblessed
