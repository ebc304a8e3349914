#pragma once

#include <cstdint>
#include <memory>
#include <optional>

#include "internal/classify/event_classifier.hpp"
#include "internal/correlate/pending_disappearance_registry.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/measure/measurement_calculator.hpp"
#include "internal/reconcile/startup_reconciler.hpp"
#include "internal/runtime/event_loop.hpp"
#include "internal/scan/initial_scanner.hpp"
#include "internal/store/event_store.hpp"
#include "internal/watch/exclusion_filter.hpp"
#include "internal/watch/inotify_watcher.hpp"

namespace trailwatch::core {

/*
  Engine

  Owns one event loop and everything that runs on it.

  Start():
    1. seed the event type catalog
    2. install inotify watches (live notifications queue up on the loop)
    3. run the initial scan in batches on the loop
    4. when the scan queue is drained, run the startup reconciler

  Run() drives the loop until Stop(). Tests skip Run() and pump the loop
  with RunReady() under a ManualClock instead.
*/
class Engine {
 public:
  struct Options {
    classify::EventClassifier::Options classifier;
    scan::InitialScanner::Options      scan;
    std::vector<std::string>           exclude_patterns;
    uint32_t                           reconcile_window = 1000;

    // false: no inotify source, notifications only arrive via Notify()
    bool watch = true;
  };

  Engine(Options options, std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock);
  ~Engine();

  Engine(const Engine&)            = delete;
  Engine& operator=(const Engine&) = delete;

  void Start();

  // Blocks on the loop; on return pending timers are cancelled and the
  // disappearance registry is cleared.
  void Run();

  // Safe from any thread.
  void Stop();

  // Queues a notification as if a watch source had produced it.
  void Notify(model::Notification notification);

  runtime::EventLoop& Loop() {
    return loop_;
  }

  store::EventStore& Store() {
    return *store_;
  }

  correlate::PendingDisappearanceRegistry& Registry() {
    return registry_;
  }

  bool StartupComplete() const {
    return reconciled_.has_value();
  }

  // Deletes recorded by the startup reconciler, once it ran.
  std::optional<std::size_t> ReconciledDeletes() const {
    return reconciled_;
  }

 private:
  void OnScanComplete(std::size_t discovered);
  void Shutdown();

  Options                      options_;
  std::shared_ptr<util::Clock> clock_;

  runtime::EventLoop                      loop_;
  correlate::PendingDisappearanceRegistry registry_;
  measure::MeasurementCalculator          calculator_;
  watch::ExclusionFilter                  filter_;

  std::unique_ptr<store::EventStore>         store_;
  std::unique_ptr<classify::EventClassifier> classifier_;
  std::unique_ptr<scan::InitialScanner>      scanner_;
  std::unique_ptr<watch::InotifyWatcher>     watcher_;

  std::optional<std::size_t> reconciled_;
  bool                       shut_down_ = false;
};

} // namespace trailwatch::core
