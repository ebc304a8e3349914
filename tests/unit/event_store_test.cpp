#include "internal/store/event_store.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#include "internal/util/time.hpp"

namespace {

using trailwatch::db::sqlite::SqliteDB;
using trailwatch::db::sqlite::SqliteRepository;
using trailwatch::measure::Measurement;
using trailwatch::model::EventType;
using trailwatch::store::EventStore;
using trailwatch::util::ManualClock;
using trailwatch::util::Millis;

struct Fixture {
  std::shared_ptr<SqliteDB>         db;
  std::shared_ptr<SqliteRepository> repo;
  std::unique_ptr<EventStore>       store;
};

Fixture MakeFixture() {
  SqliteDB::Options options;
  options.wal_mode = false;

  Fixture f;
  f.db = std::make_shared<SqliteDB>(":memory:", options);
  trailwatch::db::sqlite::BootstrapSchema(*f.db);
  f.repo  = std::make_shared<SqliteRepository>(f.db);
  f.store = std::make_unique<EventStore>(f.repo);
  f.store->Initialize();
  return f;
}

Measurement Text(uint64_t inode, uint64_t size, int64_t lines) {
  Measurement m;
  m.inode      = inode;
  m.file_size  = size;
  m.line_count = lines;
  return m;
}

void TestRecordCreatesAndReusesFileIdentity() {
  auto        f = MakeFixture();
  ManualClock clock;

  auto first = f.store->Record(EventType::kCreate, "/w/a.txt", clock.Now(), Text(77, 10, 2));
  clock.Advance(Millis(5));
  auto second = f.store->Record(EventType::kModify, "/w/a.txt", clock.Now(), Text(77, 12, 3));
  assert(first && second && *second > *first);

  auto tx    = f.repo->BeginRead();
  auto rows  = f.repo->RecentEvents(*tx, 10);
  auto stats = f.repo->GetGlobalStatistics(*tx);
  tx->Commit();

  assert(rows.size() == 2);
  assert(rows[0].file_id == rows[1].file_id);
  assert(rows[0].timestamp_ms == trailwatch::util::ToUnixMillis(clock.Now()));
  assert(rows[0].file_name == "a.txt" && rows[0].directory == "/w");
  assert(stats.total_files == 1);
  assert(stats.active_files == 1);
}

void TestDeleteDeactivatesAndLaterEventReactivates() {
  auto        f = MakeFixture();
  ManualClock clock;

  f.store->Record(EventType::kCreate, "/w/a.txt", clock.Now(), Text(5, 1, 1));
  assert(f.store->IsTrackedActive(5));

  Measurement gone;
  gone.inode = 5;
  f.store->Record(EventType::kDelete, "/w/a.txt", clock.Now(), gone);
  assert(!f.store->IsTrackedActive(5));

  f.store->Record(EventType::kRestore, "/w/a.txt", clock.Now(), Text(5, 1, 0));
  assert(f.store->IsTrackedActive(5));

  auto latest = f.store->LatestForPath("/w/a.txt");
  assert(latest && latest->type == EventType::kRestore);
}

void TestUnknownInodeNeverSharesIdentity() {
  auto        f = MakeFixture();
  ManualClock clock;

  Measurement unknown;
  f.store->Record(EventType::kDelete, "/w/x", clock.Now(), unknown);
  f.store->Record(EventType::kDelete, "/w/y", clock.Now(), unknown);

  auto tx   = f.repo->BeginRead();
  auto rows = f.repo->RecentEvents(*tx, 10);
  tx->Commit();

  assert(rows.size() == 2);
  assert(rows[0].file_id != rows[1].file_id);
  assert(!f.store->IsTrackedActive(0));
}

void TestBinaryMeasurementStoresNullLines() {
  auto        f = MakeFixture();
  ManualClock clock;

  Measurement binary;
  binary.inode     = 9;
  binary.file_size = 4096;
  binary.binary    = true;
  f.store->Record(EventType::kFind, "/w/img.png", clock.Now(), binary);

  auto row = f.store->LatestForPath("/w/img.png");
  assert(row);
  assert(row->file_size == 4096);
  assert(!row->line_count);
  assert(!row->block_count);
}

void TestWithInodeSinceHonorsWindow() {
  auto        f = MakeFixture();
  ManualClock clock;

  f.store->Record(EventType::kCreate, "/w/a", clock.Now(), Text(3, 1, 1));
  clock.Advance(Millis(150));
  f.store->Record(EventType::kModify, "/w/a", clock.Now(), Text(3, 2, 1));

  auto rows = f.store->WithInodeSince(3, clock.Now() - Millis(100));
  assert(rows.size() == 1);
  assert(rows[0].type == EventType::kModify);
}

void TestFailedWriteIsDroppedAtomically() {
  auto        f = MakeFixture();
  ManualClock clock;

  // measurement insert now fails; the event must not survive alone
  f.db->Exec("DROP TRIGGER trg_aggregates_on_measurement;");
  f.db->Exec("DROP TRIGGER trg_measurements_no_delete;");
  f.db->Exec("DROP TRIGGER trg_measurements_no_update;");
  f.db->Exec("DROP TABLE measurements;");

  auto id = f.store->Record(EventType::kCreate, "/w/a.txt", clock.Now(), Text(1, 1, 1));
  assert(!id);

  auto tx = f.repo->BeginRead();
  assert(f.repo->CountEvents(*tx) == 0);
  tx->Commit();
}

void TestUnreadableHistoryIsNotEmptyHistory() {
  auto        f = MakeFixture();
  ManualClock clock;
  f.store->Record(EventType::kCreate, "/w/a.txt", clock.Now(), Text(8, 1, 1));

  f.db->Exec("ALTER TABLE event_types RENAME TO event_types_offline;");
  bool threw = false;
  try {
    f.store->LatestForPath("/w/a.txt");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
  f.db->Exec("ALTER TABLE event_types_offline RENAME TO event_types;");

  assert(!f.store->LatestForPath("/w/never.txt"));
  auto latest = f.store->LatestForPath("/w/a.txt");
  assert(latest && latest->type == EventType::kCreate);
}

void TestSeedConflictIsLoggedNotThrown() {
  SqliteDB::Options options;
  options.wal_mode = false;

  auto db = std::make_shared<SqliteDB>(":memory:", options);
  trailwatch::db::sqlite::BootstrapSchema(*db);
  db->Exec("INSERT INTO event_types(id,code,name,description) VALUES(2,'find','Find','legacy');");

  auto       repo = std::make_shared<SqliteRepository>(db);
  EventStore store(repo);
  store.Initialize();

  auto tx    = repo->BeginRead();
  auto types = repo->ListEventTypes(*tx);
  tx->Commit();

  assert(types.size() == 1);
  assert(types[0].id == 2 && types[0].code == "find");
}

} // namespace

int main() {
  TestRecordCreatesAndReusesFileIdentity();
  TestDeleteDeactivatesAndLaterEventReactivates();
  TestUnknownInodeNeverSharesIdentity();
  TestBinaryMeasurementStoresNullLines();
  TestWithInodeSinceHonorsWindow();
  TestFailedWriteIsDroppedAtomically();
  TestUnreadableHistoryIsNotEmptyHistory();
  TestSeedConflictIsLoggedNotThrown();

  std::cout << "trailwatch_unit_event_store: pass\n";
  return 0;
}
