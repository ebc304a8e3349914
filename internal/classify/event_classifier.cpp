#include "event_classifier.hpp"

#include <cerrno>
#include <cstring>
#include <optional>
#include <stdexcept>

#include "appearance_strategies.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/file_stat.hpp"

namespace trailwatch::classify {

using observability::IntField;
using observability::StringField;

namespace {

struct StatOutcome {
  uint64_t inode      = 0;
  uint64_t size       = 0;
  bool     found      = false;
  bool     is_regular = false;
};

StatOutcome StatForClassification(const std::string& path) {
  int  err  = 0;
  auto stat = util::StatPath(path, &err);
  if (!stat) {
    TRAILWATCH_LOG_WARN("stat failed; recording inode 0", {StringField("path", path), StringField("error", std::strerror(err))});
    return {};
  }
  return StatOutcome{stat->inode, stat->size, true, stat->is_regular};
}

} // namespace

EventClassifier::EventClassifier(Options options, runtime::EventLoop& loop, correlate::PendingDisappearanceRegistry& registry,
                                 store::EventStore& store, const measure::MeasurementCalculator& calculator)
    : EventClassifier(options, loop, registry, store, calculator,
                      DefaultAppearanceStrategies(StrategyDependencies{registry, store, calculator, options.move_threshold,
                                                                       options.restore_time_limit})) {
}

EventClassifier::EventClassifier(Options options, runtime::EventLoop& loop, correlate::PendingDisappearanceRegistry& registry,
                                 store::EventStore& store, const measure::MeasurementCalculator& calculator,
                                 std::vector<std::unique_ptr<AppearanceStrategy>> strategies)
    : options_(options),
      loop_(loop),
      registry_(registry),
      store_(store),
      calculator_(calculator),
      strategies_(std::move(strategies)) {
  if (options_.classification_delay >= options_.move_threshold) {
    throw std::invalid_argument("classification delay must be shorter than the move threshold");
  }
  if (strategies_.empty()) {
    throw std::invalid_argument("classifier requires at least one appearance strategy");
  }
}

EventClassifier::~EventClassifier() {
  Shutdown();
}

runtime::EventLoop::TaskId EventClassifier::Schedule(util::Millis delay, std::function<void()> task) {
  // the id is only known after scheduling; the wrapper reads it back
  auto id_slot = std::make_shared<runtime::EventLoop::TaskId>(0);
  const auto id = loop_.PostDelayed(delay, [this, id_slot, task = std::move(task)] {
    timers_.erase(*id_slot);
    task();
  });
  *id_slot = id;
  timers_.insert(id);
  return id;
}

void EventClassifier::OnNotification(const model::Notification& notification) {
  if (stopped_) {
    return;
  }

  TRAILWATCH_LOG_DEBUG("notification", {StringField("kind", model::ToString(notification.kind)), StringField("path", notification.path)});

  switch (notification.kind) {
    case model::NotificationKind::kChanged:
      HandleChanged(notification.path);
      return;
    case model::NotificationKind::kDisappeared:
      HandleDisappeared(notification.path);
      return;
    case model::NotificationKind::kAppeared:
      HandleAppeared(notification.path);
      return;
    case model::NotificationKind::kDiscovered:
      HandleDiscovered(notification.path);
      return;
  }
}

void EventClassifier::HandleChanged(const std::string& path) {
  // a change racing its own creation is recorded after the create
  if (auto pending = pending_appearances_.find(path); pending != pending_appearances_.end()) {
    pending->second = true;
    TRAILWATCH_LOG_DEBUG("change held until appearance is classified", {StringField("path", path)});
    return;
  }

  const auto stat = StatForClassification(path);
  store_.Record(model::EventType::kModify, path, loop_.Clock().Now(), calculator_.Measure(path, stat.inode));
}

void EventClassifier::HandleDisappeared(const std::string& path) {
  const auto now = loop_.Clock().Now();

  std::optional<db::model::EventRow> latest;
  try {
    latest = store_.LatestForPath(path);
  } catch (const std::exception& e) {
    TRAILWATCH_LOG_ERROR("disappearance dropped; history unavailable", {StringField("path", path), StringField("error", e.what())});
    return;
  }

  if (!latest) {
    RecordDelete(path, 0);
    return;
  }

  // without an inode nothing can ever match; resolve right away
  if (latest->inode == 0) {
    RecordDelete(path, 0);
    return;
  }

  if (auto displaced = registry_.Register(latest->inode, path, now)) {
    TRAILWATCH_LOG_DEBUG("pending disappearance displaced",
                         {StringField("path", displaced->path), IntField("inode", static_cast<int64_t>(displaced->inode))});
    RecordDelete(displaced->path, displaced->inode);
  }

  Schedule(options_.move_threshold, [this] { ExpireDisappearances(); });
}

void EventClassifier::HandleAppeared(const std::string& path) {
  if (!pending_appearances_.emplace(path, false).second) {
    TRAILWATCH_LOG_DEBUG("appearance already pending", {StringField("path", path)});
    return;
  }
  Schedule(options_.classification_delay, [this, path] { ClassifyAppearance(path); });
}

void EventClassifier::ClassifyAppearance(const std::string& path) {
  if (stopped_) {
    return;
  }

  bool change_held = false;
  if (auto pending = pending_appearances_.find(path); pending != pending_appearances_.end()) {
    change_held = pending->second;
    pending_appearances_.erase(pending);
  }

  const auto stat = StatForClassification(path);
  if (stat.found && !stat.is_regular) {
    TRAILWATCH_LOG_DEBUG("appearance is not a regular file; ignored", {StringField("path", path)});
    return;
  }

  const AppearanceContext context{path, stat.inode, stat.size, loop_.Clock().Now()};

  try {
    for (auto& strategy : strategies_) {
      auto classification = strategy->Classify(context);
      if (!classification) {
        continue;
      }

      TRAILWATCH_LOG_DEBUG("appearance classified", {StringField("path", path), StringField("strategy", strategy->Name()),
                                                     StringField("type", model::ToCode(classification->type))});
      store_.Record(classification->type, path, context.now, classification->measurement);
      break;
    }
  } catch (const std::exception& e) {
    TRAILWATCH_LOG_ERROR("appearance dropped", {StringField("path", path), StringField("error", e.what())});
  }

  if (change_held) {
    HandleChanged(path);
  }
}

void EventClassifier::HandleDiscovered(const std::string& path) {
  const auto stat = StatForClassification(path);

  if (store_.IsTrackedActive(stat.inode)) {
    std::optional<db::model::EventRow> latest;
    try {
      latest = store_.LatestForPath(path);
    } catch (const std::exception& e) {
      TRAILWATCH_LOG_ERROR("discovery dropped; history unavailable", {StringField("path", path), StringField("error", e.what())});
      return;
    }

    // an active inode last seen under another name was renamed while unwatched
    if (latest && latest->inode == stat.inode && latest->type != model::EventType::kDelete) {
      TRAILWATCH_LOG_DEBUG("already tracked; discovery superseded", {StringField("path", path)});
      return;
    }
  }

  store_.Record(model::EventType::kFind, path, loop_.Clock().Now(), calculator_.Measure(path, stat.inode));
}

void EventClassifier::ExpireDisappearances() {
  if (stopped_) {
    return;
  }
  for (const auto& entry : registry_.TakeExpired(loop_.Clock().Now())) {
    RecordDelete(entry.path, entry.inode);
  }
}

void EventClassifier::RecordDelete(const std::string& path, uint64_t inode) {
  measure::Measurement measurement;
  measurement.inode = inode;
  store_.Record(model::EventType::kDelete, path, loop_.Clock().Now(), measurement);
}

void EventClassifier::Shutdown() {
  if (stopped_) {
    return;
  }
  stopped_ = true;

  for (const auto id : timers_) {
    loop_.Cancel(id);
  }
  timers_.clear();
  pending_appearances_.clear();

  const auto dropped = registry_.Size();
  registry_.Clear();
  if (dropped > 0) {
    TRAILWATCH_LOG_INFO("pending disappearances dropped on shutdown", {IntField("count", static_cast<int64_t>(dropped))});
  }
}

} // namespace trailwatch::classify
