#include "tree_walker.hpp"

#include <filesystem>
#include <system_error>

#include "internal/observability/logging.hpp"

namespace trailwatch::watch {

namespace fs = std::filesystem;

using observability::StringField;

std::size_t WalkTree(const std::string& directory, uint32_t level, const WalkLimits& limits, const ExclusionFilter& filter,
                     const DirectoryVisitor& on_directory, const FileVisitor& on_file) {
  std::size_t files = 0;

  std::error_code ec;
  fs::recursive_directory_iterator it(directory, fs::directory_options::skip_permission_denied, ec);
  if (ec) {
    TRAILWATCH_LOG_WARN("cannot read directory", {StringField("path", directory), StringField("error", ec.message())});
    return 0;
  }

  for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (ec) {
      TRAILWATCH_LOG_WARN("directory walk error", {StringField("path", directory), StringField("error", ec.message())});
      break;
    }

    const auto& entry = *it;
    const auto  path  = entry.path().string();

    std::error_code type_ec;
    if (entry.is_directory(type_ec) && !entry.is_symlink(type_ec)) {
      const auto child_level = level + static_cast<uint32_t>(it.depth()) + 1;
      if (child_level > limits.max_depth || filter.IsExcluded(path, true)) {
        it.disable_recursion_pending();
        continue;
      }
      if (on_directory) on_directory(path, child_level);
      continue;
    }

    if (!entry.is_regular_file(type_ec) || filter.IsExcluded(path)) {
      continue;
    }

    ++files;
    if (on_file) on_file(path);
  }
  return files;
}

std::string NormalizeRoot(const std::string& path) {
  std::error_code ec;
  auto            absolute = fs::absolute(path, ec);
  if (ec) {
    absolute = fs::path(path);
  }

  auto normal = absolute.lexically_normal().string();
  while (normal.size() > 1 && normal.back() == '/') {
    normal.pop_back();
  }
  return normal;
}

} // namespace trailwatch::watch
