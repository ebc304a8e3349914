#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/aggregate_record.hpp"
#include "internal/db/model/event_query.hpp"
#include "internal/db/model/event_record.hpp"
#include "internal/db/model/event_row.hpp"
#include "internal/db/model/file_record.hpp"
#include "internal/db/model/measurement_record.hpp"

namespace trailwatch::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Events and measurements are append-only; there is no update or
    delete for either
  - Aggregates are maintained by the backend as a side effect of
    InsertMeasurement and are never written directly

  The DB is the source of truth for:
    event history
    file identity
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // Read-only transaction; must not take the write lock.
  virtual std::unique_ptr<Transaction> BeginRead() = 0;

  // ---------------------------------------------------------------------
  // Event type catalog
  // ---------------------------------------------------------------------

  // Returns Conflict (and writes nothing) when existing rows disagree
  // with the fixed catalog.
  virtual Result SeedEventTypes(Transaction&) = 0;

  virtual std::vector<model::EventTypeRow> ListEventTypes(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // File identity
  // ---------------------------------------------------------------------

  virtual std::optional<model::FileRecord> FindFileByInode(Transaction&, uint64_t inode) = 0;

  // Assigns record.id on success.
  virtual Result InsertFile(Transaction&, model::FileRecord& record) = 0;

  virtual Result SetFileActive(Transaction&, uint64_t file_id, bool active) = 0;

  // ---------------------------------------------------------------------
  // Event log
  // ---------------------------------------------------------------------

  // Assigns record.id on success.
  virtual Result InsertEvent(Transaction&, model::EventRecord& record) = 0;

  virtual Result InsertMeasurement(Transaction&, const model::MeasurementRecord&) = 0;

  // nullopt only when the path has no events. Throws std::runtime_error
  // when the history cannot be read.
  virtual std::optional<model::EventRow> LatestEventForPath(Transaction&, const std::string& path) = 0;

  virtual std::vector<model::EventRow> EventsWithInodeSince(Transaction&, uint64_t inode, uint64_t since_ms) = 0;

  // Newest first.
  virtual std::vector<model::EventRow> RecentEvents(Transaction&, uint32_t limit) = 0;

  virtual std::vector<model::EventRow> QueryEvents(Transaction&, const model::EventQuery& query) = 0;

  // ---------------------------------------------------------------------
  // Rollups / counters
  // ---------------------------------------------------------------------

  virtual std::optional<model::AggregateRecord> GetAggregate(Transaction&, uint64_t file_id) = 0;

  virtual model::GlobalStatistics GetGlobalStatistics(Transaction&) = 0;

  virtual uint64_t CountEvents(Transaction&) = 0;

  virtual uint64_t CountMeasurements(Transaction&) = 0;
};

} // namespace trailwatch::db
