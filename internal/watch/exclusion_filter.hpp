#pragma once

#include <regex>
#include <string>
#include <vector>

namespace trailwatch::watch {

// Glob-style exclusion patterns, matched against the full path.
//
//   **    any run of characters, including '/'
//   **/   zero or more leading directories
//   *     any run of characters except '/'
//   ?     one character except '/'
//
// Directories are also tested with a trailing '/', so "**/node_modules/**"
// prunes the directory itself.
class ExclusionFilter {
 public:
  ExclusionFilter() = default;
  explicit ExclusionFilter(const std::vector<std::string>& patterns);

  bool IsExcluded(const std::string& path, bool is_directory = false) const;

  std::size_t Size() const {
    return compiled_.size();
  }

  static std::string GlobToRegex(const std::string& glob);

 private:
  std::vector<std::regex> compiled_;
};

} // namespace trailwatch::watch
