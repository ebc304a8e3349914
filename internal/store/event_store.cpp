#include "event_store.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/file_stat.hpp"

namespace trailwatch::store {

using observability::IntField;
using observability::StringField;

namespace {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  throw std::runtime_error(message + " (" + db::ToString(result.code) + ")");
}

} // namespace

EventStore::EventStore(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
  if (!repository_) {
    throw std::invalid_argument("event store requires a repository");
  }
}

void EventStore::Initialize() {
  auto tx     = repository_->Begin();
  auto result = repository_->SeedEventTypes(*tx);
  if (result.code == db::ErrorCode::Conflict) {
    TRAILWATCH_LOG_WARN("event type catalog conflicts with existing rows; keeping existing ids",
                        {StringField("detail", result.message)});
    tx->Rollback();
    return;
  }
  ThrowIfDbError(result, "seed event types");
  tx->Commit();
}

uint64_t EventStore::ResolveFileId(db::Transaction& tx, uint64_t inode, bool active) {
  // inode 0 means "unknown"; it never identifies an existing file
  if (inode != 0) {
    if (auto existing = repository_->FindFileByInode(tx, inode)) {
      if (existing->is_active != active) {
        ThrowIfDbError(repository_->SetFileActive(tx, existing->id, active), "set file active");
      }
      return existing->id;
    }
  }

  db::model::FileRecord file;
  file.inode     = inode;
  file.is_active = active;
  ThrowIfDbError(repository_->InsertFile(tx, file), "insert file");
  return file.id;
}

std::optional<uint64_t> EventStore::Record(model::EventType type, const std::string& path, util::TimePoint timestamp,
                                           const measure::Measurement& measurement) {
  try {
    auto tx = repository_->Begin();

    const bool active = type != model::EventType::kDelete;
    const auto parts  = util::SplitPath(path);

    db::model::EventRecord event;
    event.timestamp_ms = util::ToUnixMillis(timestamp);
    event.type         = type;
    event.file_id      = ResolveFileId(*tx, measurement.inode, active);
    event.file_path    = path;
    event.file_name    = parts.file_name;
    event.directory    = parts.directory;
    ThrowIfDbError(repository_->InsertEvent(*tx, event), "insert event");

    db::model::MeasurementRecord row;
    row.event_id  = event.id;
    row.inode     = measurement.inode;
    row.file_size = measurement.file_size;
    if (!measurement.binary) {
      row.line_count = measurement.line_count;
    }
    row.block_count = measurement.block_count;
    ThrowIfDbError(repository_->InsertMeasurement(*tx, row), "insert measurement");

    tx->Commit();

    TRAILWATCH_LOG_DEBUG("event recorded", {StringField("type", model::ToCode(type)), StringField("path", path),
                                            IntField("event_id", static_cast<int64_t>(event.id)),
                                            IntField("inode", static_cast<int64_t>(measurement.inode))});
    return event.id;
  } catch (const std::exception& e) {
    TRAILWATCH_LOG_ERROR("event dropped", {StringField("type", model::ToCode(type)), StringField("path", path),
                                           StringField("error", e.what())});
    return std::nullopt;
  }
}

std::optional<db::model::EventRow> EventStore::LatestForPath(const std::string& path) {
  auto tx  = repository_->BeginRead();
  auto row = repository_->LatestEventForPath(*tx, path);
  tx->Commit();
  return row;
}

std::vector<db::model::EventRow> EventStore::WithInodeSince(uint64_t inode, util::TimePoint since) {
  try {
    auto tx   = repository_->BeginRead();
    auto rows = repository_->EventsWithInodeSince(*tx, inode, util::ToUnixMillis(since));
    tx->Commit();
    return rows;
  } catch (const std::exception& e) {
    TRAILWATCH_LOG_ERROR("inode history lookup failed",
                         {IntField("inode", static_cast<int64_t>(inode)), StringField("error", e.what())});
    return {};
  }
}

std::vector<db::model::EventRow> EventStore::Recent(uint32_t limit) {
  try {
    auto tx   = repository_->BeginRead();
    auto rows = repository_->RecentEvents(*tx, limit);
    tx->Commit();
    return rows;
  } catch (const std::exception& e) {
    TRAILWATCH_LOG_ERROR("recent events lookup failed", {StringField("error", e.what())});
    return {};
  }
}

bool EventStore::IsTrackedActive(uint64_t inode) {
  if (inode == 0) {
    return false;
  }
  try {
    auto tx   = repository_->BeginRead();
    auto file = repository_->FindFileByInode(*tx, inode);
    tx->Commit();
    return file && file->is_active;
  } catch (const std::exception& e) {
    TRAILWATCH_LOG_ERROR("file lookup failed",
                         {IntField("inode", static_cast<int64_t>(inode)), StringField("error", e.what())});
    return false;
  }
}

} // namespace trailwatch::store
