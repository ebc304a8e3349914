#include "pending_disappearance_registry.hpp"

#include <stdexcept>

namespace trailwatch::correlate {

PendingDisappearanceRegistry::PendingDisappearanceRegistry(util::Millis threshold) : threshold_(threshold) {
  if (threshold_.count() <= 0) {
    throw std::invalid_argument("move threshold must be positive");
  }
}

bool PendingDisappearanceRegistry::IsLive(const HeapSlot& slot) const {
  auto it = entries_.find(slot.inode);
  return it != entries_.end() && it->second.ticket == slot.ticket;
}

std::optional<PendingDisappearance> PendingDisappearanceRegistry::Register(uint64_t inode, const std::string& path,
                                                                           util::TimePoint now) {
  std::optional<PendingDisappearance> displaced;

  auto it = entries_.find(inode);
  if (it != entries_.end()) {
    displaced = std::move(it->second);
    entries_.erase(it);
  }

  PendingDisappearance entry;
  entry.inode         = inode;
  entry.path          = path;
  entry.registered_at = now;
  entry.deadline      = now + threshold_;
  entry.ticket        = next_ticket_++;

  deadlines_.push(HeapSlot{entry.deadline, entry.ticket, inode});
  entries_.emplace(inode, std::move(entry));

  return displaced;
}

std::optional<PendingDisappearance> PendingDisappearanceRegistry::Consume(uint64_t inode, util::TimePoint now) {
  auto it = entries_.find(inode);
  if (it == entries_.end()) {
    return std::nullopt;
  }

  if (now - it->second.registered_at >= threshold_) {
    return std::nullopt;
  }

  PendingDisappearance entry = std::move(it->second);
  entries_.erase(it);
  return entry;
}

std::vector<PendingDisappearance> PendingDisappearanceRegistry::TakeExpired(util::TimePoint now) {
  std::vector<PendingDisappearance> expired;

  while (!deadlines_.empty() && deadlines_.top().deadline <= now) {
    const auto slot = deadlines_.top();
    deadlines_.pop();

    if (!IsLive(slot)) continue;

    auto it = entries_.find(slot.inode);
    expired.push_back(std::move(it->second));
    entries_.erase(it);
  }
  return expired;
}

void PendingDisappearanceRegistry::Clear() {
  entries_.clear();
  deadlines_ = {};
}

} // namespace trailwatch::correlate
