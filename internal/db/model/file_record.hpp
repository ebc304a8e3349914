#pragma once

#include <cstdint>

namespace trailwatch::db::model {

/*
  Tracked identity of a filesystem object.

  Rows are never deleted: a delete only clears is_active, so a later
  restore can still reach the history.
*/
struct FileRecord {
  uint64_t id        = 0;
  uint64_t inode     = 0;
  bool     is_active = true;
};

} // namespace trailwatch::db::model
