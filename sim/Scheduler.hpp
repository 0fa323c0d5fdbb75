#pragma once

#include <cstdint>
#include <functional>
#include <vector>

// Cooperative single-threaded timer queue. Stands in for engine-side delayed
// callbacks: nothing runs until Advance() is called, and callbacks run on the
// caller's thread in due-time order (ties in scheduling order).
class Scheduler {
public:
  using TaskId = uint64_t;
  using Callback = std::function<void()>;

  static constexpr TaskId kInvalidTask = 0;

  // Queues fn to run once `delay` seconds from Now(). Negative delays run on
  // the next Advance().
  TaskId ScheduleAfter(float delay, Callback fn);

  // Drops a pending task. Returns false if it already ran or was cancelled.
  bool Cancel(TaskId id);
  void CancelAll();

  // Moves the clock forward by dt, running everything that falls due. Tasks
  // scheduled from a callback run in the same call when they fall due before
  // the new time. Returns the number of callbacks that ran.
  int Advance(float dt);

  float Now() const { return now_; }
  int PendingCount() const { return static_cast<int>(tasks_.size()); }
  bool IsPending(TaskId id) const;

private:
  struct Task {
    TaskId id = kInvalidTask;
    double due = 0.0;
    Callback fn;
  };

  int NextDueIndex() const;

  std::vector<Task> tasks_;
  TaskId nextId_ = 1;
  double clock_ = 0.0;
  float now_ = 0.0f;
};
