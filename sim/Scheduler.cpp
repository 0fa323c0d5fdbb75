#include "sim/Scheduler.hpp"

#include <cstddef>
#include <utility>

Scheduler::TaskId Scheduler::ScheduleAfter(const float delay, Callback fn) {
  Task task{};
  task.id = nextId_++;
  task.due = clock_ + ((delay > 0.0f) ? static_cast<double>(delay) : 0.0);
  task.fn = std::move(fn);
  tasks_.push_back(std::move(task));
  return tasks_.back().id;
}

bool Scheduler::Cancel(const TaskId id) {
  for (size_t i = 0; i < tasks_.size(); ++i) {
    if (tasks_[i].id == id) {
      tasks_.erase(tasks_.begin() + static_cast<std::ptrdiff_t>(i));
      return true;
    }
  }
  return false;
}

void Scheduler::CancelAll() { tasks_.clear(); }

bool Scheduler::IsPending(const TaskId id) const {
  for (const auto &task : tasks_) {
    if (task.id == id) {
      return true;
    }
  }
  return false;
}

int Scheduler::NextDueIndex() const {
  int best = -1;
  for (size_t i = 0; i < tasks_.size(); ++i) {
    // Ids grow monotonically, so the lower id wins a tie on due time.
    if (best < 0 || tasks_[i].due < tasks_[best].due ||
        (tasks_[i].due == tasks_[best].due && tasks_[i].id < tasks_[best].id)) {
      best = static_cast<int>(i);
    }
  }
  return best;
}

int Scheduler::Advance(const float dt) {
  // Accumulate in double so long sessions of small ticks don't drift.
  const double target = clock_ + ((dt > 0.0f) ? static_cast<double>(dt) : 0.0);
  int ran = 0;

  for (;;) {
    const int index = NextDueIndex();
    if (index < 0 || tasks_[index].due > target) {
      break;
    }
    Task task = std::move(tasks_[index]);
    tasks_.erase(tasks_.begin() + index);

    // Callbacks observe the time they were due at, not the end of the tick.
    if (task.due > clock_) {
      clock_ = task.due;
      now_ = static_cast<float>(clock_);
    }
    task.fn();
    ++ran;
  }

  clock_ = target;
  now_ = static_cast<float>(clock_);
  return ran;
}
