#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/measure/measurement_calculator.hpp"
#include "internal/model/event_type.hpp"
#include "internal/util/time.hpp"

namespace trailwatch::store {

/*
  EventStore

  Write path of the engine. Every classified event goes through Record(),
  which in ONE write transaction:

    - finds or creates the File row for the measurement inode
    - sets files.is_active (0 for delete, 1 otherwise)
    - inserts the Event
    - inserts its Measurement

  A failure is logged and the event is dropped; nothing is retried and
  nothing propagates to the caller.

  Also the classifier's window onto recent history.
*/
class EventStore {
 public:
  explicit EventStore(std::shared_ptr<db::Repository> repository);

  // Seeds the event type catalog. A conflicting catalog is left as is.
  void Initialize();

  // Returns the new event id, nullopt when the write was dropped.
  std::optional<uint64_t> Record(model::EventType type, const std::string& path, util::TimePoint timestamp,
                                 const measure::Measurement& measurement);

  // nullopt when the path has no history. A failed read throws; callers
  // must not mistake it for "no history".
  std::optional<db::model::EventRow> LatestForPath(const std::string& path);

  std::vector<db::model::EventRow> WithInodeSince(uint64_t inode, util::TimePoint since);

  std::vector<db::model::EventRow> Recent(uint32_t limit);

  // True when a File row for inode exists and is active.
  bool IsTrackedActive(uint64_t inode);

  const std::shared_ptr<db::Repository>& Repository() const {
    return repository_;
  }

 private:
  uint64_t ResolveFileId(db::Transaction& tx, uint64_t inode, bool active);

  std::shared_ptr<db::Repository> repository_;
};

} // namespace trailwatch::store
