#pragma once

#include <cstdint>
#include <optional>
#include <queue>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/util/time.hpp"

namespace trailwatch::correlate {

struct PendingDisappearance {
  uint64_t        inode = 0;
  std::string     path;
  util::TimePoint registered_at;
  util::TimePoint deadline;

  // distinguishes a re-registration of the same inode from the entry a
  // heap slot was pushed for
  uint64_t ticket = 0;
};

/*
  In-memory registry of disappearances waiting to be matched by an
  appearance of the same inode.

  Each entry is resolved exactly once:
    - Consume()      an appearance matched it (move)
    - TakeExpired()  nobody matched it before the deadline (delete)
    - Register()     a newer disappearance displaced it (delete)

  Not thread-safe; owned by the event loop thread.
*/
class PendingDisappearanceRegistry {
 public:
  explicit PendingDisappearanceRegistry(util::Millis threshold);

  // Returns the entry displaced by this registration, if any.
  std::optional<PendingDisappearance> Register(uint64_t inode, const std::string& path, util::TimePoint now);

  // Removes and returns the entry when now - registered_at < threshold.
  // A stale entry is left for TakeExpired().
  std::optional<PendingDisappearance> Consume(uint64_t inode, util::TimePoint now);

  // Removes and returns every entry with deadline <= now, oldest deadline first.
  std::vector<PendingDisappearance> TakeExpired(util::TimePoint now);

  bool Contains(uint64_t inode) const {
    return entries_.count(inode) > 0;
  }

  std::size_t Size() const {
    return entries_.size();
  }

  // Drops everything without resolving it.
  void Clear();

 private:
  struct HeapSlot {
    util::TimePoint deadline;
    uint64_t        ticket;
    uint64_t        inode;

    bool operator>(const HeapSlot& other) const {
      if (deadline != other.deadline) return deadline > other.deadline;
      return ticket > other.ticket;
    }
  };

  bool IsLive(const HeapSlot& slot) const;

  util::Millis threshold_;
  uint64_t     next_ticket_ = 1;

  std::unordered_map<uint64_t, PendingDisappearance>                          entries_;
  std::priority_queue<HeapSlot, std::vector<HeapSlot>, std::greater<HeapSlot>> deadlines_;
};

} // namespace trailwatch::correlate
