#include "appearance_strategies.hpp"

#include "internal/observability/logging.hpp"

namespace trailwatch::classify {

using observability::IntField;
using observability::StringField;

MoveByPendingDisappearance::MoveByPendingDisappearance(correlate::PendingDisappearanceRegistry& registry,
                                                       const measure::MeasurementCalculator&    calculator)
    : registry_(registry), calculator_(calculator) {
}

std::optional<Classification> MoveByPendingDisappearance::Classify(const AppearanceContext& context) {
  if (context.inode == 0) {
    return std::nullopt;
  }

  auto pending = registry_.Consume(context.inode, context.now);
  if (!pending) {
    return std::nullopt;
  }

  TRAILWATCH_LOG_DEBUG("move matched pending disappearance",
                       {StringField("from", pending->path), StringField("to", context.path),
                        IntField("inode", static_cast<int64_t>(context.inode))});
  return Classification{model::EventType::kMove, calculator_.Measure(context.path, context.inode)};
}

RestoreAfterDelete::RestoreAfterDelete(store::EventStore& store, util::Millis restore_limit)
    : store_(store), restore_limit_(restore_limit) {
}

std::optional<Classification> RestoreAfterDelete::Classify(const AppearanceContext& context) {
  auto latest = store_.LatestForPath(context.path);
  if (!latest || latest->type != model::EventType::kDelete) {
    return std::nullopt;
  }

  const auto deleted_at = util::FromUnixMillis(latest->timestamp_ms);
  if (context.now - deleted_at > restore_limit_) {
    return std::nullopt;
  }

  measure::Measurement measurement;
  measurement.inode       = context.inode;
  measurement.file_size   = context.size;
  measurement.line_count  = 0;
  measurement.block_count = 0;
  return Classification{model::EventType::kRestore, measurement};
}

MoveBySharedInode::MoveBySharedInode(store::EventStore& store, const measure::MeasurementCalculator& calculator,
                                     util::Millis window)
    : store_(store), calculator_(calculator), window_(window) {
}

std::optional<Classification> MoveBySharedInode::Classify(const AppearanceContext& context) {
  if (context.inode == 0) {
    return std::nullopt;
  }

  for (const auto& row : store_.WithInodeSince(context.inode, context.now - window_)) {
    if (row.type == model::EventType::kCreate && row.file_path != context.path) {
      TRAILWATCH_LOG_DEBUG("move matched recent create",
                           {StringField("from", row.file_path), StringField("to", context.path),
                            IntField("inode", static_cast<int64_t>(context.inode))});
      return Classification{model::EventType::kMove, calculator_.Measure(context.path, context.inode)};
    }
  }
  return std::nullopt;
}

CreateFallback::CreateFallback(const measure::MeasurementCalculator& calculator) : calculator_(calculator) {
}

std::optional<Classification> CreateFallback::Classify(const AppearanceContext& context) {
  return Classification{model::EventType::kCreate, calculator_.Measure(context.path, context.inode)};
}

std::vector<std::unique_ptr<AppearanceStrategy>> DefaultAppearanceStrategies(const StrategyDependencies& deps) {
  std::vector<std::unique_ptr<AppearanceStrategy>> strategies;
  strategies.push_back(std::make_unique<MoveByPendingDisappearance>(deps.registry, deps.calculator));
  strategies.push_back(std::make_unique<RestoreAfterDelete>(deps.store, deps.restore_limit));
  strategies.push_back(std::make_unique<MoveBySharedInode>(deps.store, deps.calculator, deps.move_threshold));
  strategies.push_back(std::make_unique<CreateFallback>(deps.calculator));
  return strategies;
}

} // namespace trailwatch::classify
