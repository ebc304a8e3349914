#include "exclusion_filter.hpp"

#include <cstring>

#include "internal/util/errors.hpp"

namespace trailwatch::watch {

ExclusionFilter::ExclusionFilter(const std::vector<std::string>& patterns) {
  compiled_.reserve(patterns.size());
  for (const auto& pattern : patterns) {
    try {
      compiled_.emplace_back(GlobToRegex(pattern), std::regex::ECMAScript | std::regex::optimize);
    } catch (const std::regex_error& e) {
      throw util::InvalidConfig("invalid exclude pattern '" + pattern + "': " + e.what());
    }
  }
}

std::string ExclusionFilter::GlobToRegex(const std::string& glob) {
  std::string out;
  out.reserve(glob.size() * 2);

  for (std::size_t i = 0; i < glob.size(); ++i) {
    const char c = glob[i];
    if (c == '*') {
      if (i + 1 < glob.size() && glob[i + 1] == '*') {
        if (i + 2 < glob.size() && glob[i + 2] == '/') {
          out += "(.*/)?";
          i += 2;
        } else {
          out += ".*";
          i += 1;
        }
      } else {
        out += "[^/]*";
      }
    } else if (c == '?') {
      out += "[^/]";
    } else if (std::strchr(".^$+()[]{}|\\", c) != nullptr) {
      out += '\\';
      out += c;
    } else {
      out += c;
    }
  }
  return out;
}

bool ExclusionFilter::IsExcluded(const std::string& path, bool is_directory) const {
  for (const auto& re : compiled_) {
    if (std::regex_match(path, re)) return true;
    if (is_directory && std::regex_match(path + "/", re)) return true;
  }
  return false;
}

} // namespace trailwatch::watch
