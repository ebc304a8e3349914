#pragma once

#include <memory>
#include <vector>

#include "appearance_strategy.hpp"
#include "internal/correlate/pending_disappearance_registry.hpp"
#include "internal/store/event_store.hpp"

namespace trailwatch::classify {

// A disappearance of the same inode is still pending: move.
class MoveByPendingDisappearance final : public AppearanceStrategy {
 public:
  MoveByPendingDisappearance(correlate::PendingDisappearanceRegistry& registry, const measure::MeasurementCalculator& calculator);

  const char* Name() const override {
    return "pending-disappearance";
  }

  std::optional<Classification> Classify(const AppearanceContext& context) override;

 private:
  correlate::PendingDisappearanceRegistry& registry_;
  const measure::MeasurementCalculator&    calculator_;
};

// Same path was deleted no longer than restore_limit ago: restore.
// Line and block counts are recorded as zero.
class RestoreAfterDelete final : public AppearanceStrategy {
 public:
  RestoreAfterDelete(store::EventStore& store, util::Millis restore_limit);

  const char* Name() const override {
    return "restore-after-delete";
  }

  std::optional<Classification> Classify(const AppearanceContext& context) override;

 private:
  store::EventStore& store_;
  util::Millis       restore_limit_;
};

// A create for the same inode at another path was recorded within the
// move threshold: move.
class MoveBySharedInode final : public AppearanceStrategy {
 public:
  MoveBySharedInode(store::EventStore& store, const measure::MeasurementCalculator& calculator, util::Millis window);

  const char* Name() const override {
    return "shared-inode";
  }

  std::optional<Classification> Classify(const AppearanceContext& context) override;

 private:
  store::EventStore&                    store_;
  const measure::MeasurementCalculator& calculator_;
  util::Millis                          window_;
};

// Always matches: create.
class CreateFallback final : public AppearanceStrategy {
 public:
  explicit CreateFallback(const measure::MeasurementCalculator& calculator);

  const char* Name() const override {
    return "create";
  }

  std::optional<Classification> Classify(const AppearanceContext& context) override;

 private:
  const measure::MeasurementCalculator& calculator_;
};

struct StrategyDependencies {
  correlate::PendingDisappearanceRegistry& registry;
  store::EventStore&                       store;
  const measure::MeasurementCalculator&    calculator;

  util::Millis move_threshold;
  util::Millis restore_limit;
};

// Precedence: pending disappearance, restore, shared inode, create.
std::vector<std::unique_ptr<AppearanceStrategy>> DefaultAppearanceStrategies(const StrategyDependencies& deps);

} // namespace trailwatch::classify
