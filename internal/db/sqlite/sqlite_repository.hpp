#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace trailwatch::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;
  std::unique_ptr<Transaction> BeginRead() override;

  Result SeedEventTypes(Transaction&) override;
  std::vector<model::EventTypeRow> ListEventTypes(Transaction&) override;

  std::optional<model::FileRecord> FindFileByInode(Transaction&, uint64_t inode) override;
  Result InsertFile(Transaction&, model::FileRecord& record) override;
  Result SetFileActive(Transaction&, uint64_t file_id, bool active) override;

  Result InsertEvent(Transaction&, model::EventRecord& record) override;
  Result InsertMeasurement(Transaction&, const model::MeasurementRecord&) override;

  std::optional<model::EventRow> LatestEventForPath(Transaction&, const std::string& path) override;
  std::vector<model::EventRow> EventsWithInodeSince(Transaction&, uint64_t inode, uint64_t since_ms) override;
  std::vector<model::EventRow> RecentEvents(Transaction&, uint32_t limit) override;
  std::vector<model::EventRow> QueryEvents(Transaction&, const model::EventQuery& query) override;

  std::optional<model::AggregateRecord> GetAggregate(Transaction&, uint64_t file_id) override;
  model::GlobalStatistics GetGlobalStatistics(Transaction&) override;
  uint64_t CountEvents(Transaction&) override;
  uint64_t CountMeasurements(Transaction&) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result RequireWritable(const Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
