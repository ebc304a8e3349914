#include "initial_scanner.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace trailwatch::scan {

using observability::IntField;
using observability::StringField;

InitialScanner::InitialScanner(Options options, const watch::ExclusionFilter& filter, runtime::EventLoop& loop, Sink sink)
    : options_(std::move(options)), filter_(filter), loop_(loop), sink_(std::move(sink)) {
  if (options_.batch_size == 0) {
    throw std::invalid_argument("scan batch size must be positive");
  }
  if (!sink_) {
    throw std::invalid_argument("scanner requires a sink");
  }
}

InitialScanner::~InitialScanner() {
  Cancel();
}

void InitialScanner::Start(OnComplete on_complete) {
  on_complete_ = std::move(on_complete);
  done_        = false;
  delivered_   = 0;
  queue_.clear();

  for (const auto& configured : options_.roots) {
    const auto root  = watch::NormalizeRoot(configured);
    const auto found = watch::WalkTree(root, 0, options_.limits, filter_, nullptr,
                                       [this](const std::string& path) { queue_.push_back(path); });
    TRAILWATCH_LOG_INFO("initial scan root walked", {StringField("root", root), IntField("files", static_cast<int64_t>(found))});
  }

  DrainBatch();
}

void InitialScanner::DrainBatch() {
  next_batch_.reset();

  for (uint32_t i = 0; i < options_.batch_size && !queue_.empty(); ++i) {
    model::Notification notification{model::NotificationKind::kDiscovered, std::move(queue_.front())};
    queue_.pop_front();
    sink_(notification);
    ++delivered_;
  }

  if (!queue_.empty()) {
    next_batch_ = loop_.PostDelayed(options_.batch_pause, [this] { DrainBatch(); });
    return;
  }

  done_ = true;
  TRAILWATCH_LOG_INFO("initial scan complete", {IntField("discovered", static_cast<int64_t>(delivered_))});
  if (on_complete_) {
    auto callback = std::move(on_complete_);
    on_complete_  = nullptr;
    callback(delivered_);
  }
}

void InitialScanner::Cancel() {
  if (next_batch_) {
    loop_.Cancel(*next_batch_);
    next_batch_.reset();
  }
  queue_.clear();
  on_complete_ = nullptr;
}

} // namespace trailwatch::scan
