#include "internal/db/sqlite/sqlite_repository.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include "internal/db/sqlite/sqlite_schema.hpp"
#include "internal/util/file_stat.hpp"

namespace {

using trailwatch::db::ErrorCode;
using trailwatch::db::model::EventQuery;
using trailwatch::db::model::EventRecord;
using trailwatch::db::model::FileRecord;
using trailwatch::db::model::MeasurementRecord;
using trailwatch::db::sqlite::SqliteDB;
using trailwatch::db::sqlite::SqliteRepository;
using trailwatch::model::EventType;

struct Fixture {
  std::shared_ptr<SqliteDB>         db;
  std::shared_ptr<SqliteRepository> repo;
};

Fixture MakeFixture(bool seed = true) {
  SqliteDB::Options options;
  options.wal_mode = false;

  Fixture f;
  f.db = std::make_shared<SqliteDB>(":memory:", options);
  trailwatch::db::sqlite::BootstrapSchema(*f.db);
  f.repo = std::make_shared<SqliteRepository>(f.db);

  if (seed) {
    auto tx = f.repo->Begin();
    assert(f.repo->SeedEventTypes(*tx));
    tx->Commit();
  }
  return f;
}

uint64_t AddFile(SqliteRepository& repo, uint64_t inode, bool active = true) {
  auto       tx = repo.Begin();
  FileRecord file;
  file.inode     = inode;
  file.is_active = active;
  assert(repo.InsertFile(*tx, file));
  tx->Commit();
  assert(file.id != 0);
  return file.id;
}

uint64_t AddEvent(SqliteRepository& repo, uint64_t file_id, EventType type, const std::string& path, uint64_t ts, uint64_t inode,
                  uint64_t size, std::optional<int64_t> lines = 0, std::optional<int64_t> blocks = std::nullopt) {
  auto tx    = repo.Begin();
  auto parts = trailwatch::util::SplitPath(path);

  EventRecord event;
  event.timestamp_ms = ts;
  event.type         = type;
  event.file_id      = file_id;
  event.file_path    = path;
  event.file_name    = parts.file_name;
  event.directory    = parts.directory;
  assert(repo.InsertEvent(*tx, event));

  MeasurementRecord m;
  m.event_id    = event.id;
  m.inode       = inode;
  m.file_size   = size;
  m.line_count  = lines;
  m.block_count = blocks;
  assert(repo.InsertMeasurement(*tx, m));

  tx->Commit();
  return event.id;
}

void TestSeedIsIdempotent() {
  auto f = MakeFixture();

  auto tx = f.repo->Begin();
  assert(f.repo->SeedEventTypes(*tx));
  auto types = f.repo->ListEventTypes(*tx);
  tx->Commit();

  assert(types.size() == 6);
  assert(types[0].id == 1 && types[0].code == "find");
  assert(types[3].id == 4 && types[3].code == "delete");
  assert(types[5].id == 6 && types[5].code == "restore");
}

void TestSeedConflictWritesNothing() {
  auto f = MakeFixture(/*seed=*/false);
  f.db->Exec("INSERT INTO event_types(id,code,name,description) VALUES(1,'create','Create','legacy numbering');");

  auto tx     = f.repo->Begin();
  auto result = f.repo->SeedEventTypes(*tx);
  assert(result.code == ErrorCode::Conflict);
  auto types = f.repo->ListEventTypes(*tx);
  tx->Rollback();

  assert(types.size() == 1);
  assert(types[0].code == "create");
}

void TestFileIdentityAndActiveFlag() {
  auto f  = MakeFixture();
  auto id = AddFile(*f.repo, 100);

  auto tx   = f.repo->Begin();
  auto file = f.repo->FindFileByInode(*tx, 100);
  assert(file && file->id == id && file->is_active);

  assert(f.repo->SetFileActive(*tx, id, false));
  file = f.repo->FindFileByInode(*tx, 100);
  assert(file && !file->is_active);

  assert(f.repo->SetFileActive(*tx, 9999, true).code == ErrorCode::NotFound);
  assert(!f.repo->FindFileByInode(*tx, 101));
  tx->Commit();
}

void TestReadTransactionRejectsWrites() {
  auto f = MakeFixture();

  auto tx = f.repo->BeginRead();
  assert(tx->IsReadOnly());

  FileRecord file;
  file.inode = 7;
  assert(f.repo->InsertFile(*tx, file).code == ErrorCode::ReadOnly);
  assert(f.repo->SeedEventTypes(*tx).code == ErrorCode::ReadOnly);
  tx->Commit();
  assert(tx->IsFinished());

  auto check = f.repo->BeginRead();
  assert(!f.repo->FindFileByInode(*check, 7));
  check->Commit();
}

void TestEventWithoutFileIsRejected() {
  auto f = MakeFixture();

  auto        tx = f.repo->Begin();
  EventRecord event;
  event.timestamp_ms = 1;
  event.type         = EventType::kCreate;
  event.file_id      = 424242;
  event.file_path    = "/w/ghost";
  event.file_name    = "ghost";
  event.directory    = "/w";
  assert(f.repo->InsertEvent(*tx, event).code == ErrorCode::ConstraintViolation);
}

void TestEventLogIsAppendOnly() {
  auto f    = MakeFixture();
  auto file = AddFile(*f.repo, 7);
  AddEvent(*f.repo, file, EventType::kCreate, "/w/a.txt", 1000, 7, 10);

  bool threw = false;
  try {
    f.db->Exec("UPDATE events SET file_path='/w/b.txt';");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    f.db->Exec("DELETE FROM measurements;");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestAggregateTracksHistory() {
  auto f    = MakeFixture();
  auto file = AddFile(*f.repo, 7);

  AddEvent(*f.repo, file, EventType::kCreate, "/w/a.md", 86400000 + 1000, 7, 10, 2, 1);
  AddEvent(*f.repo, file, EventType::kModify, "/w/a.md", 86400000 + 2000, 7, 30, 5, std::nullopt);
  AddEvent(*f.repo, file, EventType::kModify, "/w/a.md", 86400000 + 3000, 7, 20, 4, 3);

  auto tx  = f.repo->BeginRead();
  auto agg = f.repo->GetAggregate(*tx, file);
  tx->Commit();

  assert(agg);
  assert(agg->period_start == 86400000);
  assert(agg->total_events == 3);
  assert(agg->total_creates == 1);
  assert(agg->total_modifies == 2);
  assert(agg->total_deletes == 0);
  assert(agg->first_event_timestamp == 86400000 + 1000);
  assert(agg->last_event_timestamp == 86400000 + 3000);
  assert(agg->first_size == 10 && agg->max_size == 30 && agg->last_size == 20);
  assert(agg->first_lines == 2 && agg->max_lines == 5 && agg->last_lines == 4);
  assert(agg->first_blocks == 1 && agg->max_blocks == 3 && agg->last_blocks == 3);
  assert(agg->dominant_event_type == 3);
  assert(agg->last_event_type_id == 3);
  assert(agg->last_updated == 86400000 + 3000);
}

void TestAggregateIsIndependentOfInsertOrder() {
  auto f    = MakeFixture();
  auto file = AddFile(*f.repo, 8);

  // recorded out of timestamp order
  AddEvent(*f.repo, file, EventType::kDelete, "/w/b.txt", 5000, 8, 0);
  AddEvent(*f.repo, file, EventType::kCreate, "/w/b.txt", 1000, 8, 40, 3);

  auto tx  = f.repo->BeginRead();
  auto agg = f.repo->GetAggregate(*tx, file);
  tx->Commit();

  assert(agg);
  assert(agg->first_size == 40);
  assert(agg->last_size == 0);
  assert(agg->first_event_timestamp == 1000);
  assert(agg->last_event_timestamp == 5000);
  assert(agg->last_event_type_id == 4);
  // tie on count: the most recently inserted type wins
  assert(agg->dominant_event_type == 2);
}

void TestHistoryLookups() {
  auto f     = MakeFixture();
  auto file  = AddFile(*f.repo, 50);
  auto other = AddFile(*f.repo, 51);

  AddEvent(*f.repo, file, EventType::kCreate, "/w/x.txt", 1000, 50, 5);
  AddEvent(*f.repo, file, EventType::kModify, "/w/x.txt", 2000, 50, 6);
  AddEvent(*f.repo, other, EventType::kCreate, "/w/y.txt", 2500, 51, 7);

  auto tx = f.repo->BeginRead();

  auto latest = f.repo->LatestEventForPath(*tx, "/w/x.txt");
  assert(latest && latest->type == EventType::kModify);
  assert(latest->inode == 50 && latest->file_size == 6);
  assert(latest->type_name == "Modify");
  assert(latest->file_name == "x.txt" && latest->directory == "/w");
  assert(!f.repo->LatestEventForPath(*tx, "/w/none.txt"));

  auto by_inode = f.repo->EventsWithInodeSince(*tx, 50, 1500);
  assert(by_inode.size() == 1);
  assert(by_inode[0].type == EventType::kModify);

  auto recent = f.repo->RecentEvents(*tx, 2);
  assert(recent.size() == 2);
  assert(recent[0].file_path == "/w/y.txt");
  assert(recent[1].file_path == "/w/x.txt");

  assert(f.repo->CountEvents(*tx) == 3);
  assert(f.repo->CountMeasurements(*tx) == 3);
  tx->Commit();
}

void TestBinaryMeasurementKeepsNullLines() {
  auto f    = MakeFixture();
  auto file = AddFile(*f.repo, 60);
  AddEvent(*f.repo, file, EventType::kFind, "/w/img.png", 1000, 60, 2048, std::nullopt, std::nullopt);

  auto tx  = f.repo->BeginRead();
  auto row = f.repo->LatestEventForPath(*tx, "/w/img.png");
  tx->Commit();

  assert(row && !row->line_count && !row->block_count);
}

void TestQueryFiltersAndPaging() {
  auto f = MakeFixture();

  auto readme = AddFile(*f.repo, 1);
  auto main   = AddFile(*f.repo, 2);
  auto notes  = AddFile(*f.repo, 3);

  AddEvent(*f.repo, readme, EventType::kFind, "/Proj/docs/README.md", 1000, 1, 10);
  AddEvent(*f.repo, main, EventType::kCreate, "/Proj/src/main.ts", 2000, 2, 20);
  AddEvent(*f.repo, readme, EventType::kModify, "/Proj/docs/README.md", 3000, 1, 11);
  AddEvent(*f.repo, notes, EventType::kCreate, "/Proj/docs/100%_notes.txt", 4000, 3, 12);
  AddEvent(*f.repo, main, EventType::kModify, "/Proj/src/main.ts", 5000, 2, 21);

  auto tx = f.repo->BeginRead();

  // newest first, no filter
  EventQuery all;
  auto       rows = f.repo->QueryEvents(*tx, all);
  assert(rows.size() == 5);
  assert(rows[0].timestamp_ms == 5000);
  assert(rows[4].timestamp_ms == 1000);

  // all six types selected is the same as no filter
  EventQuery every_type;
  every_type.types = {EventType::kFind, EventType::kCreate, EventType::kModify, EventType::kDelete, EventType::kMove, EventType::kRestore};
  assert(f.repo->QueryEvents(*tx, every_type).size() == 5);

  EventQuery creates;
  creates.types = {EventType::kCreate};
  rows          = f.repo->QueryEvents(*tx, creates);
  assert(rows.size() == 2);
  for (const auto& row : rows) assert(row.type == EventType::kCreate);

  // keywords are AND-ed and case insensitive over name or directory
  EventQuery keywords;
  keywords.keywords = {"DOCS", "readme"};
  rows              = f.repo->QueryEvents(*tx, keywords);
  assert(rows.size() == 2);
  for (const auto& row : rows) assert(row.file_name == "README.md");

  // LIKE wildcards in keywords are literal
  EventQuery percent;
  percent.keywords = {"100%"};
  rows             = f.repo->QueryEvents(*tx, percent);
  assert(rows.size() == 1);
  assert(rows[0].file_name == "100%_notes.txt");

  EventQuery page;
  page.limit  = 2;
  page.offset = 1;
  rows        = f.repo->QueryEvents(*tx, page);
  assert(rows.size() == 2);
  assert(rows[0].timestamp_ms == 4000);
  assert(rows[1].timestamp_ms == 3000);

  tx->Commit();
}

void TestUniqueModeKeepsLatestPerFile() {
  auto f = MakeFixture();

  auto a = AddFile(*f.repo, 1);
  auto b = AddFile(*f.repo, 2);

  AddEvent(*f.repo, a, EventType::kCreate, "/w/a.txt", 1000, 1, 1);
  AddEvent(*f.repo, b, EventType::kCreate, "/w/b.txt", 2000, 2, 1);
  AddEvent(*f.repo, a, EventType::kModify, "/w/a.txt", 3000, 1, 2);

  auto tx = f.repo->BeginRead();

  EventQuery unique;
  unique.unique = true;
  auto rows     = f.repo->QueryEvents(*tx, unique);
  assert(rows.size() == 2);
  assert(rows[0].file_path == "/w/a.txt" && rows[0].type == EventType::kModify);
  assert(rows[1].file_path == "/w/b.txt");

  // the filter applies to each file's latest row, not to older history
  EventQuery unique_creates;
  unique_creates.unique = true;
  unique_creates.types  = {EventType::kCreate};
  rows                  = f.repo->QueryEvents(*tx, unique_creates);
  assert(rows.size() == 1);
  assert(rows[0].file_path == "/w/b.txt");

  tx->Commit();
}

void TestGlobalStatistics() {
  auto f = MakeFixture();

  auto a = AddFile(*f.repo, 1);
  auto b = AddFile(*f.repo, 2, /*active=*/false);

  AddEvent(*f.repo, a, EventType::kCreate, "/w/a", 1000, 1, 1);
  AddEvent(*f.repo, a, EventType::kModify, "/w/a", 2000, 1, 1);
  AddEvent(*f.repo, b, EventType::kDelete, "/w/b", 3000, 2, 0);

  auto tx    = f.repo->BeginRead();
  auto stats = f.repo->GetGlobalStatistics(*tx);
  tx->Commit();

  assert(stats.total_events == 3);
  assert(stats.total_creates == 1);
  assert(stats.total_modifies == 1);
  assert(stats.total_deletes == 1);
  assert(stats.total_files == 2);
  assert(stats.active_files == 1);
}

} // namespace

int main() {
  TestSeedIsIdempotent();
  TestSeedConflictWritesNothing();
  TestFileIdentityAndActiveFlag();
  TestReadTransactionRejectsWrites();
  TestEventWithoutFileIsRejected();
  TestEventLogIsAppendOnly();
  TestAggregateTracksHistory();
  TestAggregateIsIndependentOfInsertOrder();
  TestHistoryLookups();
  TestBinaryMeasurementKeepsNullLines();
  TestQueryFiltersAndPaging();
  TestUniqueModeKeepsLatestPerFile();
  TestGlobalStatistics();

  std::cout << "trailwatch_unit_sqlite_repository: pass\n";
  return 0;
}
