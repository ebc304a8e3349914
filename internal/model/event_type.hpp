#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace trailwatch::model {

// Ids are persisted in events.event_type_id and must never change.
enum class EventType : std::uint8_t {
  kFind    = 1,
  kCreate  = 2,
  kModify  = 3,
  kDelete  = 4,
  kMove    = 5,
  kRestore = 6,
};

struct EventTypeInfo {
  EventType        type;
  std::string_view code;
  std::string_view name;
  std::string_view description;
};

inline constexpr std::array<EventTypeInfo, 6> kEventTypeCatalog = {{
    {EventType::kFind, "find", "Find", "Initial file discovery"},
    {EventType::kCreate, "create", "Create", "File creation"},
    {EventType::kModify, "modify", "Modify", "File modification"},
    {EventType::kDelete, "delete", "Delete", "File deletion"},
    {EventType::kMove, "move", "Move", "File move/rename"},
    {EventType::kRestore, "restore", "Restore", "File restoration after deletion"},
}};

constexpr int ToId(EventType type) {
  return static_cast<int>(type);
}

constexpr std::optional<EventType> FromId(int id) {
  if (id < ToId(EventType::kFind) || id > ToId(EventType::kRestore)) {
    return std::nullopt;
  }
  return static_cast<EventType>(id);
}

constexpr std::string_view ToCode(EventType type) {
  return kEventTypeCatalog[ToId(type) - 1].code;
}

constexpr std::string_view ToName(EventType type) {
  return kEventTypeCatalog[ToId(type) - 1].name;
}

constexpr std::optional<EventType> FromCode(std::string_view code) {
  for (const auto& info : kEventTypeCatalog) {
    if (info.code == code) {
      return info.type;
    }
  }
  return std::nullopt;
}

} // namespace trailwatch::model
