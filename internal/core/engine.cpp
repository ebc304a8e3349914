#include "engine.hpp"

#include "internal/observability/logging.hpp"

namespace trailwatch::core {

using observability::IntField;

Engine::Engine(Options options, std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock)
    : options_(std::move(options)),
      clock_(std::move(clock)),
      loop_(clock_),
      registry_(options_.classifier.move_threshold),
      filter_(options_.exclude_patterns) {
  store_      = std::make_unique<store::EventStore>(std::move(repository));
  classifier_ = std::make_unique<classify::EventClassifier>(options_.classifier, loop_, registry_, *store_, calculator_);
  scanner_    = std::make_unique<scan::InitialScanner>(options_.scan, filter_, loop_, [this](const model::Notification& notification) {
    classifier_->OnNotification(notification);
  });

  if (options_.watch) {
    watch::InotifyWatcher::Options watch_options;
    watch_options.roots  = options_.scan.roots;
    watch_options.limits = options_.scan.limits;
    watcher_             = std::make_unique<watch::InotifyWatcher>(std::move(watch_options), filter_,
                                                                   [this](model::Notification notification) { Notify(std::move(notification)); });
  }
}

Engine::~Engine() {
  if (watcher_) {
    watcher_->Stop();
  }
  Shutdown();
}

void Engine::Start() {
  store_->Initialize();

  if (watcher_) {
    watcher_->Start();
  }

  loop_.Post([this] {
    scanner_->Start([this](std::size_t discovered) { OnScanComplete(discovered); });
  });
}

void Engine::OnScanComplete(std::size_t discovered) {
  reconcile::StartupReconciler reconciler(*store_, *clock_, options_.reconcile_window);
  reconciled_ = reconciler.Run();

  TRAILWATCH_LOG_INFO("startup complete; live monitoring", {IntField("discovered", static_cast<int64_t>(discovered)),
                                                            IntField("reconciled_deletes", static_cast<int64_t>(*reconciled_))});
}

void Engine::Notify(model::Notification notification) {
  loop_.Post([this, notification = std::move(notification)] { classifier_->OnNotification(notification); });
}

void Engine::Run() {
  loop_.Run();
  Shutdown();
}

void Engine::Stop() {
  if (watcher_) {
    watcher_->Stop();
  }
  loop_.Stop();
}

void Engine::Shutdown() {
  if (shut_down_) {
    return;
  }
  shut_down_ = true;

  scanner_->Cancel();
  classifier_->Shutdown();
}

} // namespace trailwatch::core
