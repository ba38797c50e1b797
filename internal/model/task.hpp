#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace orchestra::model {

// Numeric order is scheduling order: larger values are served first.
enum class TaskPriority : std::uint8_t {
  kLow      = 1,
  kNormal   = 2,
  kHigh     = 3,
  kCritical = 4,
};

enum class TaskStatus : std::uint8_t {
  kPending    = 1,
  kAssigned   = 2,
  kInProgress = 3,
  kCompleted  = 4,
  kFailed     = 5,
};

constexpr std::string_view ToString(TaskPriority priority) {
  switch (priority) {
    case TaskPriority::kLow:
      return "low";
    case TaskPriority::kNormal:
      return "normal";
    case TaskPriority::kHigh:
      return "high";
    case TaskPriority::kCritical:
      return "critical";
    default:
      return "unknown";
  }
}

constexpr std::string_view ToString(TaskStatus status) {
  switch (status) {
    case TaskStatus::kPending:
      return "pending";
    case TaskStatus::kAssigned:
      return "assigned";
    case TaskStatus::kInProgress:
      return "in_progress";
    case TaskStatus::kCompleted:
      return "completed";
    case TaskStatus::kFailed:
      return "failed";
    default:
      return "unknown";
  }
}

constexpr bool IsKnown(TaskPriority priority) {
  return priority >= TaskPriority::kLow && priority <= TaskPriority::kCritical;
}

constexpr bool IsKnown(TaskStatus status) {
  return status >= TaskStatus::kPending && status <= TaskStatus::kFailed;
}

struct Task {
  std::string id;
  std::string command;
  std::string resource_context;

  TaskPriority priority = TaskPriority::kNormal;
  TaskStatus   status   = TaskStatus::kPending;

  // Empty until the task is assigned.
  std::string worker_id;

  std::chrono::system_clock::time_point                created_at{};
  std::optional<std::chrono::system_clock::time_point> started_at;
  std::optional<std::chrono::system_clock::time_point> completed_at;

  std::string result;

  // Enqueue order; breaks created_at ties within a priority band.
  std::uint64_t sequence = 0;
};

} // namespace orchestra::model
