#include "internal/core/engine.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/util/file_stat.hpp"
#include "tests/support/test_support.hpp"

namespace {

namespace fs = std::filesystem;

using trailwatch::core::Engine;
using trailwatch::db::model::GlobalStatistics;
using trailwatch::measure::Measurement;
using trailwatch::model::EventType;
using trailwatch::model::NotificationKind;
using trailwatch::testing::TempDir;
using trailwatch::testing::WriteFile;
using trailwatch::util::ManualClock;
using trailwatch::util::Millis;

// far above anything a fresh temp file gets
constexpr uint64_t kVanishedInode = 0x7ffffff0ULL;

struct Scenario {
  TempDir                                    dir{"trailwatch_engine"};
  trailwatch::runtime::config::RuntimeConfig config;

  Scenario() {
    config = trailwatch::config::ConfigLoader::Defaults();
    config.mutable_monitoring()->clear_watch_paths();
    config.mutable_monitoring()->add_watch_paths(Tree());
    config.mutable_database()->mutable_sqlite()->set_path(dir.File("state/activity.db"));
  }

  std::string Tree() const {
    return dir.File("tree");
  }

  std::string Path(const std::string& relative) const {
    return dir.File("tree/" + relative);
  }

  std::unique_ptr<Engine> MakeEngine(std::shared_ptr<ManualClock> clock) {
    auto options  = trailwatch::factory::EngineOptions(config);
    options.watch = false;
    return std::make_unique<Engine>(options, trailwatch::factory::BuildRepository(config), std::move(clock));
  }
};

GlobalStatistics Stats(Engine& engine) {
  auto& repo = *engine.Store().Repository();
  auto  tx   = repo.BeginRead();
  auto  out  = repo.GetGlobalStatistics(*tx);
  assert(repo.CountEvents(*tx) == repo.CountMeasurements(*tx));
  tx->Commit();
  return out;
}

void TestFullLifecycleAcrossRestart() {
  Scenario s;
  WriteFile(s.Path("a.txt"), "one\n");
  WriteFile(s.Path("b.md"), "# title\n");
  WriteFile(s.Path("sub/c.py"), "def f():\n    pass\n");
  WriteFile(s.Path("node_modules/dep/index.js"), "x");
  WriteFile(s.Path("debug.log"), "x");

  auto clock = std::make_shared<ManualClock>();

  // history from an earlier run for a file removed while nothing watched
  {
    trailwatch::store::EventStore seed(trailwatch::factory::BuildRepository(s.config));
    seed.Initialize();
    Measurement m;
    m.inode = kVanishedInode;
    seed.Record(EventType::kCreate, s.Path("vanished.txt"), clock->Now(), m);
  }

  {
    auto engine = s.MakeEngine(clock);
    engine->Start();
    assert(!engine->StartupComplete());

    engine->Loop().RunReady();
    assert(engine->StartupComplete());
    assert(engine->ReconciledDeletes() && *engine->ReconciledDeletes() == 1);

    auto stats = Stats(*engine);
    assert(stats.total_finds == 3);
    assert(stats.total_deletes == 1);

    // live notifications
    clock->Advance(Millis(1000));
    WriteFile(s.Path("a.txt"), "one\ntwo\n");
    engine->Notify({NotificationKind::kChanged, s.Path("a.txt")});
    engine->Loop().RunReady();

    fs::rename(s.Path("a.txt"), s.Path("renamed.txt"));
    engine->Notify({NotificationKind::kDisappeared, s.Path("a.txt")});
    engine->Notify({NotificationKind::kAppeared, s.Path("renamed.txt")});
    engine->Loop().RunReady();
    clock->Advance(Millis(50));
    engine->Loop().RunReady();
    clock->Advance(Millis(100));
    engine->Loop().RunReady();

    fs::remove(s.Path("b.md"));
    engine->Notify({NotificationKind::kDisappeared, s.Path("b.md")});
    engine->Loop().RunReady();
    clock->Advance(Millis(100));
    engine->Loop().RunReady();

    stats = Stats(*engine);
    assert(stats.total_events == 7);
    assert(stats.total_modifies == 1);
    assert(stats.total_moves == 1);
    assert(stats.total_deletes == 2);
    assert(stats.total_files == 4);
    assert(stats.active_files == 2);
    assert(engine->Registry().Size() == 0);

    auto moved = engine->Store().LatestForPath(s.Path("renamed.txt"));
    assert(moved && moved->type == EventType::kMove);
    assert(moved->line_count && *moved->line_count == 3);
  }

  // restart: tracked files are not rediscovered and nothing is missing
  {
    clock->Advance(Millis(60000));
    auto engine = s.MakeEngine(clock);
    engine->Start();
    engine->Loop().RunReady();

    assert(engine->ReconciledDeletes() && *engine->ReconciledDeletes() == 0);
    auto stats = Stats(*engine);
    assert(stats.total_events == 7);
    assert(stats.active_files == 2);
  }
}

void TestOfflineDeletionIsReconciled() {
  Scenario s;
  WriteFile(s.Path("keep.txt"), "k");
  WriteFile(s.Path("lose.txt"), "l");

  auto clock = std::make_shared<ManualClock>();
  {
    auto engine = s.MakeEngine(clock);
    engine->Start();
    engine->Loop().RunReady();
    assert(*engine->ReconciledDeletes() == 0);
  }

  fs::remove(s.Path("lose.txt"));
  clock->Advance(Millis(1000));

  auto engine = s.MakeEngine(clock);
  engine->Start();
  engine->Loop().RunReady();
  assert(*engine->ReconciledDeletes() == 1);

  auto latest = engine->Store().LatestForPath(s.Path("lose.txt"));
  assert(latest && latest->type == EventType::kDelete);
  assert(latest->inode != 0);

  auto kept = engine->Store().LatestForPath(s.Path("keep.txt"));
  assert(kept && kept->type == EventType::kFind);
}

void TestOfflineRenameKeepsHistory() {
  Scenario s;
  WriteFile(s.Path("a.txt"), "content\n");

  auto clock = std::make_shared<ManualClock>();
  {
    auto engine = s.MakeEngine(clock);
    engine->Start();
    engine->Loop().RunReady();
    assert(Stats(*engine).total_finds == 1);
  }

  fs::rename(s.Path("a.txt"), s.Path("b.txt"));
  clock->Advance(Millis(1000));

  auto engine = s.MakeEngine(clock);
  engine->Start();
  engine->Loop().RunReady();
  assert(*engine->ReconciledDeletes() == 0);

  auto renamed = engine->Store().LatestForPath(s.Path("b.txt"));
  assert(renamed && renamed->type == EventType::kFind);
  assert(renamed->inode == trailwatch::util::StatPath(s.Path("b.txt"))->inode);

  auto old_name = engine->Store().LatestForPath(s.Path("a.txt"));
  assert(old_name && old_name->type == EventType::kFind);
  assert(old_name->file_id == renamed->file_id);

  auto stats = Stats(*engine);
  assert(stats.total_events == 2);
  assert(stats.total_deletes == 0);
  assert(stats.total_files == 1);
  assert(stats.active_files == 1);
}

void TestWrittenFileRecordsCreateBeforeModify() {
  Scenario s;
  fs::create_directories(s.Tree());

  auto clock  = std::make_shared<ManualClock>();
  auto engine = s.MakeEngine(clock);
  engine->Start();
  engine->Loop().RunReady();

  // the watcher reports creation and the closing write back to back
  WriteFile(s.Path("new.txt"), "fresh\n");
  engine->Notify({NotificationKind::kAppeared, s.Path("new.txt")});
  engine->Notify({NotificationKind::kChanged, s.Path("new.txt")});
  engine->Loop().RunReady();
  clock->Advance(Millis(50));
  engine->Loop().RunReady();

  auto& repo = *engine->Store().Repository();
  auto  tx   = repo.BeginRead();
  auto  rows = repo.RecentEvents(*tx, 10);
  tx->Commit();

  assert(rows.size() == 2);
  assert(rows[1].type == EventType::kCreate);
  assert(rows[0].type == EventType::kModify);
}

void TestStopEndsRun() {
  Scenario s;
  fs::create_directories(s.Tree());

  auto engine = s.MakeEngine(std::make_shared<ManualClock>());
  engine->Start();
  engine->Loop().Post([&engine] { engine->Stop(); });
  engine->Run();
  assert(engine->StartupComplete());
}

} // namespace

int main() {
  TestFullLifecycleAcrossRestart();
  TestOfflineDeletionIsReconciled();
  TestOfflineRenameKeepsHistory();
  TestWrittenFileRecordsCreateBeforeModify();
  TestStopEndsRun();

  std::cout << "trailwatch_integration_engine_scenario: pass\n";
  return 0;
}
