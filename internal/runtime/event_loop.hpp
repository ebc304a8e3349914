#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <unordered_map>
#include <vector>

#include "internal/util/time.hpp"

namespace trailwatch::runtime {

/*
  Single-threaded cooperative scheduler.

  - Post() and PostDelayed() may be called from any thread
  - tasks always execute on the thread running Run()/RunReady()
  - delayed tasks fire in (due, sequence) order, so two timers with the
    same deadline run in the order they were scheduled
  - time is read through the injected Clock; with a ManualClock nothing
    fires until the clock is advanced and RunReady() is called
*/
class EventLoop {
 public:
  using Task   = std::function<void()>;
  using TaskId = uint64_t;

  explicit EventLoop(std::shared_ptr<util::Clock> clock);

  EventLoop(const EventLoop&)            = delete;
  EventLoop& operator=(const EventLoop&) = delete;

  void Post(Task task);

  TaskId PostDelayed(util::Millis delay, Task task);

  // False when the task already ran or was cancelled.
  bool Cancel(TaskId id);

  // Runs posted tasks and due timers until nothing is ready.
  // Returns the number of tasks executed.
  std::size_t RunReady();

  // Blocks until Stop().
  void Run();

  void Stop();

  std::size_t PendingTimers() const;

  util::Clock& Clock() const {
    return *clock_;
  }

 private:
  struct Timer {
    util::TimePoint due;
    TaskId          id;

    // min-heap on (due, id)
    bool operator>(const Timer& other) const {
      if (due != other.due) return due > other.due;
      return id > other.id;
    }
  };

  std::vector<Task> TakeReady();

  std::shared_ptr<util::Clock> clock_;

  mutable std::mutex      mutex_;
  std::condition_variable cv_;

  std::deque<Task>                                                  posted_;
  std::priority_queue<Timer, std::vector<Timer>, std::greater<Timer>> timers_;
  std::unordered_map<TaskId, Task>                                  timer_tasks_;

  TaskId   next_id_    = 1;
  uint64_t generation_ = 0;
  bool     stopped_    = false;
};

} // namespace trailwatch::runtime
