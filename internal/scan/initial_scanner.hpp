#pragma once

#include <cstdint>
#include <deque>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/notification.hpp"
#include "internal/runtime/event_loop.hpp"
#include "internal/watch/exclusion_filter.hpp"
#include "internal/watch/tree_walker.hpp"

namespace trailwatch::scan {

/*
  Walks the watch roots once and feeds every file found to the sink as a
  `discovered` notification.

  Paths are collected up front and drained on the event loop in batches
  of batch_size, with batch_pause between batches so live notifications
  interleave with the scan.
*/
class InitialScanner {
 public:
  struct Options {
    std::vector<std::string> roots;
    watch::WalkLimits        limits;
    uint32_t                 batch_size = 10;
    util::Millis             batch_pause{10};
  };

  using Sink       = std::function<void(const model::Notification&)>;
  using OnComplete = std::function<void(std::size_t discovered)>;

  InitialScanner(Options options, const watch::ExclusionFilter& filter, runtime::EventLoop& loop, Sink sink);
  ~InitialScanner();

  InitialScanner(const InitialScanner&)            = delete;
  InitialScanner& operator=(const InitialScanner&) = delete;

  // Walks the roots and schedules the first batch. on_complete runs on the
  // loop once the queue is empty. Must be called on the loop thread.
  void Start(OnComplete on_complete);

  // Drops anything not yet delivered; on_complete is not called.
  void Cancel();

  std::size_t Queued() const {
    return queue_.size();
  }

  bool Done() const {
    return done_;
  }

 private:
  void DrainBatch();

  Options                       options_;
  const watch::ExclusionFilter& filter_;
  runtime::EventLoop&           loop_;
  Sink                          sink_;
  OnComplete                    on_complete_;

  std::deque<std::string> queue_;
  std::size_t             delivered_ = 0;

  std::optional<runtime::EventLoop::TaskId> next_batch_;
  bool                                      done_ = false;
};

} // namespace trailwatch::scan
