#include "factory.hpp"

#include <filesystem>
#include <string>
#include <system_error>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace trailwatch::factory {

using observability::StringField;
using trailwatch::runtime::config::RuntimeConfig;

namespace {

void EnsureParentDirectory(const std::string& db_path) {
  const auto parent = std::filesystem::path(db_path).parent_path();
  if (parent.empty()) {
    return;
  }

  std::error_code ec;
  std::filesystem::create_directories(parent, ec);
  if (ec) {
    throw util::StoreUnavailable("cannot create database directory " + parent.string() + ": " + ec.message());
  }
}

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const RuntimeConfig& config, bool read_only) {
  const auto& sqlite = config.database().sqlite();

  db::sqlite::SqliteDB::Options options;
  options.busy_timeout_ms = sqlite.busy_timeout_ms();
  options.wal_mode        = sqlite.wal_mode();
  options.read_only       = read_only;

  if (!read_only) {
    EnsureParentDirectory(sqlite.path());
  }

  auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(sqlite.path(), options);
  if (!read_only) {
    db::sqlite::BootstrapSchema(*sqlite_db);
  }

  TRAILWATCH_LOG_INFO("store opened", {StringField("path", sqlite.path()), observability::BoolField("read_only", read_only)});
  return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
}

core::Engine::Options EngineOptions(const RuntimeConfig& config) {
  const auto& monitoring = config.monitoring();
  const auto& classifier = config.classifier();
  const auto& scan       = config.scan();

  core::Engine::Options options;

  options.classifier.move_threshold       = util::Millis(classifier.move_threshold_ms());
  options.classifier.restore_time_limit   = util::Millis(classifier.restore_time_limit_ms());
  options.classifier.classification_delay = util::Millis(classifier.classification_delay_ms());

  options.scan.roots.assign(monitoring.watch_paths().begin(), monitoring.watch_paths().end());
  options.scan.limits.max_depth = monitoring.max_depth();
  options.scan.batch_size       = scan.batch_size();
  options.scan.batch_pause      = util::Millis(scan.batch_pause_ms());

  options.exclude_patterns.assign(monitoring.exclude_patterns().begin(), monitoring.exclude_patterns().end());
  options.reconcile_window = scan.reconcile_window();
  options.watch            = true;
  return options;
}

std::unique_ptr<core::Engine> Build(const RuntimeConfig& config) {
  auto repository = BuildRepository(config);
  return std::make_unique<core::Engine>(EngineOptions(config), std::move(repository), std::make_shared<util::SystemClock>());
}

} // namespace trailwatch::factory
