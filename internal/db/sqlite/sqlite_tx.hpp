#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace trailwatch::db::sqlite {

/*
  SQLite transaction wrapper.

  Writers use BEGIN IMMEDIATE:
    - grabs write lock early
    - avoids deadlock-y behavior later
  Readers use BEGIN DEFERRED and never take the write lock.
*/
class SqliteTransaction final : public db::Transaction {
public:
  enum class Mode { kImmediate, kDeferred };

  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db, Mode mode = Mode::kImmediate);
  ~SqliteTransaction();

  sqlite3* Handle() const { return db_->Handle(); }

  void Commit() override;
  void Rollback() override;
  bool IsFinished() const override { return finished_; }
  bool IsReadOnly() const override { return mode_ == Mode::kDeferred; }

private:
  std::shared_ptr<SqliteDB> db_;
  Mode mode_;
  bool finished_ = false;
};

}
