#pragma once

#include <cstdint>
#include <optional>

namespace trailwatch::db::model {

/*
  Point-in-time metrics, 1:1 with an event.

  line_count is NULL for binaries, block_count is NULL when the file type
  has no structural analysis.
*/
struct MeasurementRecord {
  uint64_t event_id  = 0;
  uint64_t inode     = 0;
  uint64_t file_size = 0;

  std::optional<int64_t> line_count;
  std::optional<int64_t> block_count;
};

} // namespace trailwatch::db::model
