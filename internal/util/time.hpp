#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>

namespace trailwatch::util {

/*
  Time utilities: single place to control clock source.

  Everything that compares timestamps (move window, restore window, timer
  deadlines) reads time through a Clock so tests can drive it manually.
*/

using SystemClockType = std::chrono::system_clock;
using TimePoint       = SystemClockType::time_point;
using Millis          = std::chrono::milliseconds;

class Clock {
 public:
  virtual ~Clock() = default;

  virtual TimePoint Now() const = 0;
};

class SystemClock final : public Clock {
 public:
  TimePoint Now() const override;
};

// Virtual clock; only moves when told to.
class ManualClock final : public Clock {
 public:
  explicit ManualClock(TimePoint start = DefaultStart());

  static TimePoint DefaultStart();

  TimePoint Now() const override;

  void Advance(Millis delta);
  void Set(TimePoint now);

 private:
  mutable std::mutex mutex_;
  TimePoint          now_;
};

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

} // namespace trailwatch::util
