#pragma once

#include <cstdint>

#include "internal/store/event_store.hpp"
#include "internal/util/time.hpp"

namespace trailwatch::reconcile {

/*
  Catches up on deletions that happened while nothing was watching.

  Looks at the last `window` events, keeps the newest one per path, and
  records a delete for every path whose newest event is not a delete and
  which is no longer on disk. A path whose inode a newer row carries at
  another path (a move, or a file found there by the startup scan) is
  left alone; that row already accounts for it.
*/
class StartupReconciler {
 public:
  StartupReconciler(store::EventStore& store, util::Clock& clock, uint32_t window);

  // Returns the number of deletes recorded.
  std::size_t Run();

 private:
  store::EventStore& store_;
  util::Clock&       clock_;
  uint32_t           window_;
};

} // namespace trailwatch::reconcile
