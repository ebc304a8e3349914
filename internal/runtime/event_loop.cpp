#include "event_loop.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace trailwatch::runtime {

namespace {

// Upper bound on one wait in Run(); the clock may be virtual and
// move without notifying us.
constexpr util::Millis kMaxWait{100};

} // namespace

EventLoop::EventLoop(std::shared_ptr<util::Clock> clock) : clock_(std::move(clock)) {
  if (!clock_) {
    throw std::invalid_argument("event loop requires a clock");
  }
}

void EventLoop::Post(Task task) {
  {
    std::lock_guard lock(mutex_);
    posted_.push_back(std::move(task));
    ++generation_;
  }
  cv_.notify_one();
}

EventLoop::TaskId EventLoop::PostDelayed(util::Millis delay, Task task) {
  TaskId id;
  {
    std::lock_guard lock(mutex_);
    id = next_id_++;
    timers_.push(Timer{clock_->Now() + delay, id});
    timer_tasks_.emplace(id, std::move(task));
    ++generation_;
  }
  cv_.notify_one();
  return id;
}

bool EventLoop::Cancel(TaskId id) {
  std::lock_guard lock(mutex_);
  // the heap entry is dropped lazily when it reaches the top
  return timer_tasks_.erase(id) > 0;
}

std::vector<EventLoop::Task> EventLoop::TakeReady() {
  std::vector<Task> ready;

  std::lock_guard lock(mutex_);
  while (!posted_.empty()) {
    ready.push_back(std::move(posted_.front()));
    posted_.pop_front();
  }

  const auto now = clock_->Now();
  while (!timers_.empty() && timers_.top().due <= now) {
    const auto id = timers_.top().id;
    timers_.pop();

    auto it = timer_tasks_.find(id);
    if (it == timer_tasks_.end()) continue; // cancelled

    ready.push_back(std::move(it->second));
    timer_tasks_.erase(it);
  }
  return ready;
}

std::size_t EventLoop::RunReady() {
  std::size_t executed = 0;
  while (true) {
    auto ready = TakeReady();
    if (ready.empty()) break;

    for (auto& task : ready) {
      try {
        task();
      } catch (const std::exception& e) {
        TRAILWATCH_LOG_ERROR("event loop task failed", {observability::StringField("error", e.what())});
      }
      ++executed;
    }
  }
  return executed;
}

void EventLoop::Run() {
  while (true) {
    RunReady();

    std::unique_lock lock(mutex_);
    if (stopped_) break;
    if (!posted_.empty()) continue;

    auto wait = kMaxWait;
    // skip cancelled timers so they do not shorten the wait forever
    while (!timers_.empty() && timer_tasks_.find(timers_.top().id) == timer_tasks_.end()) {
      timers_.pop();
    }
    if (!timers_.empty()) {
      const auto remaining = std::chrono::duration_cast<util::Millis>(timers_.top().due - clock_->Now());
      wait = std::clamp(remaining, util::Millis{0}, kMaxWait);
    }
    if (wait.count() == 0) continue;

    const auto seen = generation_;
    cv_.wait_for(lock, wait, [&] { return stopped_ || generation_ != seen; });
    if (stopped_) break;
  }
}

void EventLoop::Stop() {
  {
    std::lock_guard lock(mutex_);
    stopped_ = true;
  }
  cv_.notify_all();
}

std::size_t EventLoop::PendingTimers() const {
  std::lock_guard lock(mutex_);
  return timer_tasks_.size();
}

} // namespace trailwatch::runtime
