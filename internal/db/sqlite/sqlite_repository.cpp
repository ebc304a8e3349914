#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <cctype>
#include <stdexcept>

namespace trailwatch::db::sqlite {

using trailwatch::db::ErrorCode;
using trailwatch::db::Result;
using trailwatch::model::EventType;

namespace {

struct StatementCloser {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementCloser>;

Statement Prepare(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) {
    sqlite3_finalize(st);
    return Statement{};
  }
  return Statement{st};
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

void BindOptI64(sqlite3_stmt* st, int idx, const std::optional<int64_t>& v) {
  if (v.has_value()) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(*v));
  } else {
    sqlite3_bind_null(st, idx);
  }
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

std::optional<int64_t> ColOptI64(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

// Column list shared by every EventRow reader; ReadEventRow depends on the order.
constexpr const char* kEventRowColumns =
    "e.id, e.timestamp, e.event_type_id, et.name, e.file_id, e.file_path, e.file_name, e.directory, "
    "COALESCE(m.inode, f.inode, 0), COALESCE(m.file_size, 0), m.line_count, m.block_count";

constexpr const char* kEventRowJoins =
    " FROM events e"
    " JOIN event_types et ON et.id = e.event_type_id"
    " JOIN files f ON f.id = e.file_id"
    " LEFT JOIN measurements m ON m.event_id = e.id";

model::EventRow ReadEventRow(sqlite3_stmt* st) {
  model::EventRow r;
  r.id           = ColU64(st, 0);
  r.timestamp_ms = ColU64(st, 1);
  r.type         = trailwatch::model::FromId(ColI32(st, 2)).value_or(EventType::kCreate);
  r.type_name    = ColText(st, 3);
  r.file_id      = ColU64(st, 4);
  r.file_path    = ColText(st, 5);
  r.file_name    = ColText(st, 6);
  r.directory    = ColText(st, 7);
  r.inode        = ColU64(st, 8);
  r.file_size    = ColU64(st, 9);
  r.line_count   = ColOptI64(st, 10);
  r.block_count  = ColOptI64(st, 11);
  return r;
}

std::vector<model::EventRow> ReadEventRows(sqlite3_stmt* st) {
  std::vector<model::EventRow> out;
  while (sqlite3_step(st) == SQLITE_ROW) {
    out.push_back(ReadEventRow(st));
  }
  return out;
}

std::string LikePattern(const std::string& keyword) {
  std::string pattern = "%";
  for (char c : keyword) {
    if (c == '%' || c == '_' || c == '\\') pattern.push_back('\\');
    pattern.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  pattern.push_back('%');
  return pattern;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_, SqliteTransaction::Mode::kImmediate);
}

std::unique_ptr<db::Transaction> SqliteRepository::BeginRead() {
  return std::make_unique<SqliteTransaction>(db_, SqliteTransaction::Mode::kDeferred);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::RequireWritable(const Transaction& t) {
  if (t.IsReadOnly()) return Result::Err(ErrorCode::ReadOnly, "write attempted in a read-only transaction");
  return Result::Ok();
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
    return Result::Ok();

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
    case SQLITE_FULL:
    case SQLITE_READONLY:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Event type catalog
// ------------------------------------------------------------------

Result SqliteRepository::SeedEventTypes(Transaction& t) {
  if (auto writable = RequireWritable(t); !writable) return writable;

  auto* db = TX(t).Handle();

  // Existing rows must agree with the catalog id-for-id. Anything else means
  // events already reference a different numbering; leave it alone.
  for (const auto& row : ListEventTypes(t)) {
    const auto by_id   = trailwatch::model::FromId(row.id);
    const auto by_code = trailwatch::model::FromCode(row.code);
    if (!by_id || !by_code || *by_id != *by_code) {
      return Result::Err(ErrorCode::Conflict,
                         "event type '" + row.code + "' has id " + std::to_string(row.id) + " which conflicts with the catalog");
    }
  }

  auto st = Prepare(db, "INSERT OR IGNORE INTO event_types(id,code,name,description) VALUES(?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  for (const auto& info : trailwatch::model::kEventTypeCatalog) {
    sqlite3_reset(st.get());
    sqlite3_clear_bindings(st.get());
    BindI32(st.get(), 1, trailwatch::model::ToId(info.type));
    BindText(st.get(), 2, std::string(info.code));
    BindText(st.get(), 3, std::string(info.name));
    BindText(st.get(), 4, std::string(info.description));

    auto result = Translate(db, sqlite3_step(st.get()));
    if (!result) return result;
  }

  return Result::Ok();
}

std::vector<model::EventTypeRow> SqliteRepository::ListEventTypes(Transaction& t) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, "SELECT id,code,name,description FROM event_types ORDER BY id;");
  if (!st) return {};

  std::vector<model::EventTypeRow> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    model::EventTypeRow r;
    r.id          = ColI32(st.get(), 0);
    r.code        = ColText(st.get(), 1);
    r.name        = ColText(st.get(), 2);
    r.description = ColText(st.get(), 3);
    out.push_back(std::move(r));
  }
  return out;
}

// ------------------------------------------------------------------
// Files
// ------------------------------------------------------------------

std::optional<model::FileRecord> SqliteRepository::FindFileByInode(Transaction& t, uint64_t inode) {
  auto* db = TX(t).Handle();

  // newest row wins if an inode was recycled into a second identity
  auto st = Prepare(db, "SELECT id,inode,is_active FROM files WHERE inode=? ORDER BY id DESC LIMIT 1;");
  if (!st) return std::nullopt;

  BindU64(st.get(), 1, inode);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;

  model::FileRecord r;
  r.id        = ColU64(st.get(), 0);
  r.inode     = ColU64(st.get(), 1);
  r.is_active = ColI32(st.get(), 2) != 0;
  return r;
}

Result SqliteRepository::InsertFile(Transaction& t, model::FileRecord& record) {
  if (auto writable = RequireWritable(t); !writable) return writable;

  auto* db = TX(t).Handle();

  auto st = Prepare(db, "INSERT INTO files(inode,is_active) VALUES(?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindU64(st.get(), 1, record.inode);
  BindI32(st.get(), 2, record.is_active ? 1 : 0);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (result) record.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
  return result;
}

Result SqliteRepository::SetFileActive(Transaction& t, uint64_t file_id, bool active) {
  if (auto writable = RequireWritable(t); !writable) return writable;

  auto* db = TX(t).Handle();

  auto st = Prepare(db, "UPDATE files SET is_active=? WHERE id=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindI32(st.get(), 1, active ? 1 : 0);
  BindU64(st.get(), 2, file_id);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (result && sqlite3_changes(db) == 0) {
    return Result::Err(ErrorCode::NotFound, "file " + std::to_string(file_id) + " not found");
  }
  return result;
}

// ------------------------------------------------------------------
// Events / measurements
// ------------------------------------------------------------------

Result SqliteRepository::InsertEvent(Transaction& t, model::EventRecord& record) {
  if (auto writable = RequireWritable(t); !writable) return writable;

  auto* db = TX(t).Handle();

  auto st = Prepare(db,
                    "INSERT INTO events(timestamp,event_type_id,file_id,file_path,file_name,directory) "
                    "VALUES(?,?,?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindU64(st.get(), 1, record.timestamp_ms);
  BindI32(st.get(), 2, trailwatch::model::ToId(record.type));
  BindU64(st.get(), 3, record.file_id);
  BindText(st.get(), 4, record.file_path);
  BindText(st.get(), 5, record.file_name);
  BindText(st.get(), 6, record.directory);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (result) record.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
  return result;
}

Result SqliteRepository::InsertMeasurement(Transaction& t, const model::MeasurementRecord& r) {
  if (auto writable = RequireWritable(t); !writable) return writable;

  auto* db = TX(t).Handle();

  auto st = Prepare(db,
                    "INSERT INTO measurements(event_id,inode,file_size,line_count,block_count) "
                    "VALUES(?,?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindU64(st.get(), 1, r.event_id);
  BindU64(st.get(), 2, r.inode);
  BindU64(st.get(), 3, r.file_size);
  BindOptI64(st.get(), 4, r.line_count);
  BindOptI64(st.get(), 5, r.block_count);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::EventRow> SqliteRepository::LatestEventForPath(Transaction& t, const std::string& path) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, std::string("SELECT ") + kEventRowColumns + kEventRowJoins +
                            " WHERE e.file_path=? ORDER BY e.timestamp DESC, e.id DESC LIMIT 1;");
  if (!st) throw std::runtime_error(std::string("latest event for path: ") + sqlite3_errmsg(db));

  BindText(st.get(), 1, path);
  const int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) throw std::runtime_error(std::string("latest event for path: ") + sqlite3_errmsg(db));
  return ReadEventRow(st.get());
}

std::vector<model::EventRow> SqliteRepository::EventsWithInodeSince(Transaction& t, uint64_t inode, uint64_t since_ms) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, std::string("SELECT ") + kEventRowColumns + kEventRowJoins +
                            " WHERE m.inode=? AND e.timestamp>=? ORDER BY e.timestamp DESC, e.id DESC;");
  if (!st) return {};

  BindU64(st.get(), 1, inode);
  BindU64(st.get(), 2, since_ms);
  return ReadEventRows(st.get());
}

std::vector<model::EventRow> SqliteRepository::RecentEvents(Transaction& t, uint32_t limit) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, std::string("SELECT ") + kEventRowColumns + kEventRowJoins +
                            " ORDER BY e.timestamp DESC, e.id DESC LIMIT ?;");
  if (!st) return {};

  BindU64(st.get(), 1, limit);
  return ReadEventRows(st.get());
}

std::vector<model::EventRow> SqliteRepository::QueryEvents(Transaction& t, const model::EventQuery& query) {
  auto* db = TX(t).Handle();

  std::string where = " WHERE 1=1";

  // all six selected is the same as no filter
  const bool filter_types = !query.types.empty() && query.types.size() < trailwatch::model::kEventTypeCatalog.size();
  if (filter_types) {
    where += " AND e.event_type_id IN (";
    for (size_t i = 0; i < query.types.size(); ++i) {
      where += i == 0 ? "?" : ",?";
    }
    where += ")";
  }

  std::vector<std::string> patterns;
  for (const auto& keyword : query.keywords) {
    if (keyword.empty()) continue;
    patterns.push_back(LikePattern(keyword));
    where += " AND (LOWER(e.file_name) LIKE ? ESCAPE '\\' OR LOWER(e.directory) LIKE ? ESCAPE '\\')";
  }

  // unique mode ranks over the whole log first, so each file shows its
  // current state; filters then apply to that latest row.
  std::string from = kEventRowJoins;
  if (query.unique) {
    from =
        " FROM (SELECT ev.*, ROW_NUMBER() OVER (PARTITION BY ev.file_name, ev.directory"
        " ORDER BY ev.timestamp DESC, ev.id DESC) AS rn FROM events ev) e"
        " JOIN event_types et ON et.id = e.event_type_id"
        " JOIN files f ON f.id = e.file_id"
        " LEFT JOIN measurements m ON m.event_id = e.id";
    where += " AND e.rn = 1";
  }

  auto st = Prepare(db, std::string("SELECT ") + kEventRowColumns + from + where +
                            " ORDER BY e.timestamp DESC, e.id DESC LIMIT ? OFFSET ?;");
  if (!st) return {};

  int idx = 1;
  if (filter_types) {
    for (auto type : query.types) {
      BindI32(st.get(), idx++, trailwatch::model::ToId(type));
    }
  }
  for (const auto& pattern : patterns) {
    BindText(st.get(), idx++, pattern);
    BindText(st.get(), idx++, pattern);
  }
  BindU64(st.get(), idx++, query.limit);
  BindU64(st.get(), idx++, query.offset);

  return ReadEventRows(st.get());
}

// ------------------------------------------------------------------
// Rollups / counters
// ------------------------------------------------------------------

std::optional<model::AggregateRecord> SqliteRepository::GetAggregate(Transaction& t, uint64_t file_id) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db,
                    "SELECT file_id,period_start,total_events,total_finds,total_creates,total_modifies,"
                    "total_deletes,total_moves,total_restores,first_event_timestamp,last_event_timestamp,"
                    "first_size,max_size,last_size,first_lines,max_lines,last_lines,"
                    "first_blocks,max_blocks,last_blocks,dominant_event_type,last_event_type_id,last_updated "
                    "FROM aggregates WHERE file_id=?;");
  if (!st) return std::nullopt;

  BindU64(st.get(), 1, file_id);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;

  auto* s = st.get();
  model::AggregateRecord r;
  r.file_id               = ColU64(s, 0);
  r.period_start          = ColU64(s, 1);
  r.total_events          = ColU64(s, 2);
  r.total_finds           = ColU64(s, 3);
  r.total_creates         = ColU64(s, 4);
  r.total_modifies        = ColU64(s, 5);
  r.total_deletes         = ColU64(s, 6);
  r.total_moves           = ColU64(s, 7);
  r.total_restores        = ColU64(s, 8);
  r.first_event_timestamp = ColU64(s, 9);
  r.last_event_timestamp  = ColU64(s, 10);
  r.first_size            = ColU64(s, 11);
  r.max_size              = ColU64(s, 12);
  r.last_size             = ColU64(s, 13);
  r.first_lines           = ColOptI64(s, 14);
  r.max_lines             = ColOptI64(s, 15);
  r.last_lines            = ColOptI64(s, 16);
  r.first_blocks          = ColOptI64(s, 17);
  r.max_blocks            = ColOptI64(s, 18);
  r.last_blocks           = ColOptI64(s, 19);
  r.dominant_event_type   = ColI32(s, 20);
  r.last_event_type_id    = ColI32(s, 21);
  r.last_updated          = ColU64(s, 22);
  return r;
}

model::GlobalStatistics SqliteRepository::GetGlobalStatistics(Transaction& t) {
  auto* db = TX(t).Handle();

  model::GlobalStatistics stats;

  auto st = Prepare(db,
                    "SELECT COALESCE(SUM(total_events),0),COALESCE(SUM(total_finds),0),COALESCE(SUM(total_creates),0),"
                    "COALESCE(SUM(total_modifies),0),COALESCE(SUM(total_deletes),0),COALESCE(SUM(total_moves),0),"
                    "COALESCE(SUM(total_restores),0) FROM aggregates;");
  if (st && sqlite3_step(st.get()) == SQLITE_ROW) {
    stats.total_events   = ColU64(st.get(), 0);
    stats.total_finds    = ColU64(st.get(), 1);
    stats.total_creates  = ColU64(st.get(), 2);
    stats.total_modifies = ColU64(st.get(), 3);
    stats.total_deletes  = ColU64(st.get(), 4);
    stats.total_moves    = ColU64(st.get(), 5);
    stats.total_restores = ColU64(st.get(), 6);
  }

  auto files = Prepare(db, "SELECT COUNT(*), COALESCE(SUM(is_active),0) FROM files;");
  if (files && sqlite3_step(files.get()) == SQLITE_ROW) {
    stats.total_files  = ColU64(files.get(), 0);
    stats.active_files = ColU64(files.get(), 1);
  }

  return stats;
}

uint64_t SqliteRepository::CountEvents(Transaction& t) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, "SELECT COUNT(*) FROM events;");
  if (!st || sqlite3_step(st.get()) != SQLITE_ROW) return 0;
  return ColU64(st.get(), 0);
}

uint64_t SqliteRepository::CountMeasurements(Transaction& t) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, "SELECT COUNT(*) FROM measurements;");
  if (!st || sqlite3_step(st.get()) != SQLITE_ROW) return 0;
  return ColU64(st.get(), 0);
}

} // namespace trailwatch::db::sqlite
