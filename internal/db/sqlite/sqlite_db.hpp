#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <string>

namespace trailwatch::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.
*/
class SqliteDB {
 public:
  struct Options {
    uint32_t busy_timeout_ms = 5000;
    bool     wal_mode        = true;
    bool     read_only       = false;
  };

  explicit SqliteDB(std::string path);
  SqliteDB(std::string path, Options options);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/schema)
  void Exec(const std::string& sql);

  // Configure PRAGMAs (WAL, foreign keys, busy timeout)
  void Configure();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  Options     options_;
};

} // namespace trailwatch::db::sqlite
