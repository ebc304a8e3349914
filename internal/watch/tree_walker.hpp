#pragma once

#include <cstdint>
#include <functional>
#include <string>

#include "exclusion_filter.hpp"

namespace trailwatch::watch {

struct WalkLimits {
  // Directory levels below a watch root that are entered; files directly
  // in the root are at level 0.
  uint32_t max_depth = 10;
};

using DirectoryVisitor = std::function<void(const std::string& path, uint32_t level)>;
using FileVisitor      = std::function<void(const std::string& path)>;

// Recursively visits `directory` (itself at `level`). Excluded entries
// and directories past max_depth are pruned. Unreadable directories are
// skipped with a warning. Returns the number of files visited.
std::size_t WalkTree(const std::string& directory, uint32_t level, const WalkLimits& limits, const ExclusionFilter& filter,
                     const DirectoryVisitor& on_directory, const FileVisitor& on_file);

// Absolute, lexically normal, without a trailing separator.
std::string NormalizeRoot(const std::string& path);

} // namespace trailwatch::watch
