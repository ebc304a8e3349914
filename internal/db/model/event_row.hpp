#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/event_type.hpp"

namespace trailwatch::db::model {

// Event joined with its type and measurement. Read-side shape only.
struct EventRow {
  uint64_t id           = 0;
  uint64_t timestamp_ms = 0;

  trailwatch::model::EventType type = trailwatch::model::EventType::kCreate;
  std::string                  type_name;

  uint64_t    file_id = 0;
  std::string file_path;
  std::string file_name;
  std::string directory;

  // measurement inode, falling back to the file row's inode
  uint64_t inode     = 0;
  uint64_t file_size = 0;

  std::optional<int64_t> line_count;
  std::optional<int64_t> block_count;
};

} // namespace trailwatch::db::model
