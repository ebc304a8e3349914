#pragma once

#include <cstdint>
#include <string>

#include "internal/model/event_type.hpp"

namespace trailwatch::db::model {

/*
  Append-only event row. Never updated after insert.
*/
struct EventRecord {
  uint64_t id           = 0;
  uint64_t timestamp_ms = 0;

  trailwatch::model::EventType type = trailwatch::model::EventType::kCreate;

  uint64_t    file_id = 0;
  std::string file_path;
  std::string file_name;
  std::string directory;
};

} // namespace trailwatch::db::model
