#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/model/event_type.hpp"

namespace trailwatch::db::model {

/*
  Read-side filter for external readers.

  - types empty means all six types
  - keywords are AND-ed, each matched case-insensitively against
    file_name or directory
  - unique keeps only the latest row per (file_name, directory)
*/
struct EventQuery {
  std::vector<trailwatch::model::EventType> types;
  std::vector<std::string>                  keywords;

  bool unique = false;

  uint32_t limit  = 50;
  uint32_t offset = 0;
};

struct EventTypeRow {
  int         id = 0;
  std::string code;
  std::string name;
  std::string description;
};

struct GlobalStatistics {
  uint64_t total_events   = 0;
  uint64_t total_finds    = 0;
  uint64_t total_creates  = 0;
  uint64_t total_modifies = 0;
  uint64_t total_deletes  = 0;
  uint64_t total_moves    = 0;
  uint64_t total_restores = 0;

  uint64_t total_files  = 0;
  uint64_t active_files = 0;
};

} // namespace trailwatch::db::model
