#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "appearance_strategy.hpp"
#include "internal/correlate/pending_disappearance_registry.hpp"
#include "internal/measure/measurement_calculator.hpp"
#include "internal/model/notification.hpp"
#include "internal/runtime/event_loop.hpp"
#include "internal/store/event_store.hpp"

namespace trailwatch::classify {

/*
  EventClassifier

  Turns raw notifications into semantic events:

    changed      -> modify
    disappeared  -> pending disappearance, delete when it expires
    appeared     -> (after classification_delay) first matching strategy
    discovered   -> find, unless the path's own history already holds
                    the inode as an active file

  A changed notification for a path whose appearance is still waiting
  is held and recorded right after that appearance.

  Runs entirely on the event loop thread. OnNotification() must be called
  from a loop task; sources on other threads Post() onto the loop.
*/
class EventClassifier {
 public:
  struct Options {
    util::Millis move_threshold{100};
    util::Millis restore_time_limit{300000};
    util::Millis classification_delay{50};
  };

  EventClassifier(Options options, runtime::EventLoop& loop, correlate::PendingDisappearanceRegistry& registry,
                  store::EventStore& store, const measure::MeasurementCalculator& calculator);

  // Strategies default to DefaultAppearanceStrategies().
  EventClassifier(Options options, runtime::EventLoop& loop, correlate::PendingDisappearanceRegistry& registry,
                  store::EventStore& store, const measure::MeasurementCalculator& calculator,
                  std::vector<std::unique_ptr<AppearanceStrategy>> strategies);

  ~EventClassifier();

  EventClassifier(const EventClassifier&)            = delete;
  EventClassifier& operator=(const EventClassifier&) = delete;

  void OnNotification(const model::Notification& notification);

  // Cancels timers and forgets pending disappearances. No deletes are
  // synthesized for them.
  void Shutdown();

  std::size_t PendingTimers() const {
    return timers_.size();
  }

 private:
  void HandleChanged(const std::string& path);
  void HandleDisappeared(const std::string& path);
  void HandleAppeared(const std::string& path);
  void HandleDiscovered(const std::string& path);

  void ClassifyAppearance(const std::string& path);
  void ExpireDisappearances();
  void RecordDelete(const std::string& path, uint64_t inode);

  runtime::EventLoop::TaskId Schedule(util::Millis delay, std::function<void()> task);

  Options options_;

  runtime::EventLoop&                      loop_;
  correlate::PendingDisappearanceRegistry& registry_;
  store::EventStore&                       store_;
  const measure::MeasurementCalculator&    calculator_;

  std::vector<std::unique_ptr<AppearanceStrategy>> strategies_;

  std::unordered_set<runtime::EventLoop::TaskId> timers_;
  // path -> whether a change arrived while the appearance was pending
  std::unordered_map<std::string, bool>          pending_appearances_;
  bool                                           stopped_ = false;
};

} // namespace trailwatch::classify
