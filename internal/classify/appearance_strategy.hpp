#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/measure/measurement_calculator.hpp"
#include "internal/model/event_type.hpp"
#include "internal/util/time.hpp"

namespace trailwatch::classify {

// What the classifier knows about an appearance once the delay elapsed.
struct AppearanceContext {
  std::string     path;
  uint64_t        inode = 0; // 0 when stat failed
  uint64_t        size  = 0;
  util::TimePoint now;
};

struct Classification {
  model::EventType     type;
  measure::Measurement measurement;
};

/*
  One rule of appearance detection. Rules are tried in order and the
  first one returning a classification wins; nullopt means "not mine".

  A rule may consume correlator state when it matches, never when it
  declines.
*/
class AppearanceStrategy {
 public:
  virtual ~AppearanceStrategy() = default;

  virtual const char* Name() const = 0;

  virtual std::optional<Classification> Classify(const AppearanceContext& context) = 0;
};

} // namespace trailwatch::classify
