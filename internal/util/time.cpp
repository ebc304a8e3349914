#include "time.hpp"

namespace trailwatch::util {

TimePoint SystemClock::Now() const {
  return SystemClockType::now();
}

ManualClock::ManualClock(TimePoint start) : now_(start) {
}

TimePoint ManualClock::DefaultStart() {
  // 2024-01-01T00:00:00Z, far enough from zero that window arithmetic never underflows
  return FromUnixMillis(1704067200000ULL);
}

TimePoint ManualClock::Now() const {
  std::lock_guard lock(mutex_);
  return now_;
}

void ManualClock::Advance(Millis delta) {
  std::lock_guard lock(mutex_);
  now_ += delta;
}

void ManualClock::Set(TimePoint now) {
  std::lock_guard lock(mutex_);
  now_ = now;
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(uint64_t ms) {
  return TimePoint{} + std::chrono::duration_cast<TimePoint::duration>(std::chrono::milliseconds(ms));
}

} // namespace trailwatch::util
