#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace trailwatch::util {

struct FileStat {
  uint64_t inode      = 0;
  uint64_t size       = 0;
  bool     is_regular = false;
};

// stat(2) follows symlinks; nullopt when the path is gone
// or unreadable. errno_out receives the failure reason when given.
std::optional<FileStat> StatPath(const std::string& path, int* errno_out = nullptr);

struct PathParts {
  std::string directory;
  std::string file_name;
};

PathParts SplitPath(const std::string& path);

} // namespace trailwatch::util
