#pragma once

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"

namespace trailwatch::testing {

// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
 public:
  explicit TempDir(const std::string& prefix) {
    auto pattern = (std::filesystem::temp_directory_path() / (prefix + "_XXXXXX")).string();
    if (::mkdtemp(pattern.data()) == nullptr) {
      throw std::runtime_error("mkdtemp failed for " + pattern);
    }
    path_ = pattern;
  }

  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  TempDir(const TempDir&)            = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::filesystem::path& Path() const {
    return path_;
  }

  std::string File(const std::string& relative) const {
    return (path_ / relative).string();
  }

 private:
  std::filesystem::path path_;
};

inline void WriteFile(const std::string& path, const std::string& content) {
  std::filesystem::create_directories(std::filesystem::path(path).parent_path());
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << content;
}

// Schema-bootstrapped private in-memory database.
inline std::shared_ptr<db::sqlite::SqliteDB> MakeMemoryDB() {
  db::sqlite::SqliteDB::Options options;
  options.wal_mode = false;

  auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(":memory:", options);
  db::sqlite::BootstrapSchema(*sqlite_db);
  return sqlite_db;
}

inline std::shared_ptr<db::sqlite::SqliteRepository> MakeMemoryRepository() {
  return std::make_shared<db::sqlite::SqliteRepository>(MakeMemoryDB());
}

} // namespace trailwatch::testing
