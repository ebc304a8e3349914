#include "file_stat.hpp"

#include <sys/stat.h>

#include <cerrno>
#include <filesystem>

namespace trailwatch::util {

std::optional<FileStat> StatPath(const std::string& path, int* errno_out) {
  struct stat st {};
  if (::stat(path.c_str(), &st) != 0) {
    if (errno_out) *errno_out = errno;
    return std::nullopt;
  }

  FileStat out;
  out.inode      = static_cast<uint64_t>(st.st_ino);
  out.size       = static_cast<uint64_t>(st.st_size);
  out.is_regular = S_ISREG(st.st_mode);
  return out;
}

PathParts SplitPath(const std::string& path) {
  const std::filesystem::path p(path);
  return {p.parent_path().string(), p.filename().string()};
}

} // namespace trailwatch::util
