#pragma once

namespace trailwatch::db {

/*
  Abstract transaction.

  One write transaction covers one recorded event: the file identity
  update, the event row and its measurement land together or not at all.

  - Changes are invisible to other connections until Commit()
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed
  - A read-only transaction rejects every write with ErrorCode::ReadOnly

  SQLite: BEGIN IMMEDIATE for writers, BEGIN DEFERRED for readers
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;

  virtual void Rollback() = 0;

  // true once Commit() or Rollback() ran
  virtual bool IsFinished() const = 0;

  virtual bool IsReadOnly() const = 0;
};

} // namespace trailwatch::db
