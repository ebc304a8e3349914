#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace trailwatch::model {

/*
  Raw signal from a notification source. No ordering or atomicity is
  implied across paths; a move arrives as an independent disappeared and
  appeared pair in either order.

  kDiscovered is only produced by the initial tree scan.
*/
enum class NotificationKind : std::uint8_t {
  kAppeared,
  kChanged,
  kDisappeared,
  kDiscovered,
};

struct Notification {
  NotificationKind kind;
  std::string      path;
};

constexpr std::string_view ToString(NotificationKind kind) {
  switch (kind) {
    case NotificationKind::kAppeared:
      return "appeared";
    case NotificationKind::kChanged:
      return "changed";
    case NotificationKind::kDisappeared:
      return "disappeared";
    case NotificationKind::kDiscovered:
      return "discovered";
  }
  return "unknown";
}

} // namespace trailwatch::model
