#include "startup_reconciler.hpp"

#include <filesystem>
#include <system_error>
#include <unordered_set>

#include "internal/observability/logging.hpp"

namespace trailwatch::reconcile {

using observability::IntField;
using observability::StringField;

StartupReconciler::StartupReconciler(store::EventStore& store, util::Clock& clock, uint32_t window)
    : store_(store), clock_(clock), window_(window) {
}

std::size_t StartupReconciler::Run() {
  const auto recent = store_.Recent(window_);

  std::unordered_set<std::string> seen;
  std::unordered_set<uint64_t>    claimed_inodes;
  std::size_t                     recorded = 0;

  // newest first: the first row per path is its latest state
  for (const auto& row : recent) {
    if (!seen.insert(row.file_path).second) {
      continue;
    }
    if (row.type == model::EventType::kDelete) {
      continue;
    }
    if (row.inode != 0 && claimed_inodes.count(row.inode) > 0) {
      // a newer move or discovery carried this inode to another path
      TRAILWATCH_LOG_DEBUG("inode lives on at a newer path; skipped", {StringField("path", row.file_path)});
      continue;
    }

    std::error_code ec;
    const bool      present = std::filesystem::exists(row.file_path, ec);
    if (row.inode != 0 && ((present && !ec) || row.type == model::EventType::kMove)) {
      claimed_inodes.insert(row.inode);
    }
    if (present && !ec) {
      continue;
    }

    if (ec) {
      TRAILWATCH_LOG_WARN("existence check failed; treating as deleted",
                          {StringField("path", row.file_path), StringField("error", ec.message())});
    }
    if (row.inode == 0) {
      TRAILWATCH_LOG_WARN("missing file has no recorded inode", {StringField("path", row.file_path)});
    }

    measure::Measurement measurement;
    measurement.inode = row.inode;
    if (store_.Record(model::EventType::kDelete, row.file_path, clock_.Now(), measurement)) {
      ++recorded;
    }
  }

  TRAILWATCH_LOG_INFO("startup reconciliation complete",
                      {IntField("examined", static_cast<int64_t>(seen.size())), IntField("deletes", static_cast<int64_t>(recorded))});
  return recorded;
}

} // namespace trailwatch::reconcile
