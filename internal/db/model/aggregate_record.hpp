#pragma once

#include <cstdint>
#include <optional>

namespace trailwatch::db::model {

/*
  Per-file rollup maintained by the store on every measurement insert.
  Derived data: it can always be rebuilt from events + measurements.
*/
struct AggregateRecord {
  uint64_t file_id         = 0;
  uint64_t period_start    = 0;

  uint64_t total_events   = 0;
  uint64_t total_finds    = 0;
  uint64_t total_creates  = 0;
  uint64_t total_modifies = 0;
  uint64_t total_deletes  = 0;
  uint64_t total_moves    = 0;
  uint64_t total_restores = 0;

  uint64_t first_event_timestamp = 0;
  uint64_t last_event_timestamp  = 0;

  uint64_t first_size = 0;
  uint64_t max_size   = 0;
  uint64_t last_size  = 0;

  std::optional<int64_t> first_lines;
  std::optional<int64_t> max_lines;
  std::optional<int64_t> last_lines;

  std::optional<int64_t> first_blocks;
  std::optional<int64_t> max_blocks;
  std::optional<int64_t> last_blocks;

  int dominant_event_type = 0;
  int last_event_type_id  = 0;

  uint64_t last_updated = 0;
};

} // namespace trailwatch::db::model
