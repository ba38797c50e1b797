#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace orchestra::model {

enum class WorkerStatus : std::uint8_t {
  kIdle    = 1,
  kBusy    = 2,
  kError   = 3,
  kOffline = 4,
};

constexpr std::string_view ToString(WorkerStatus status) {
  switch (status) {
    case WorkerStatus::kIdle:
      return "idle";
    case WorkerStatus::kBusy:
      return "busy";
    case WorkerStatus::kError:
      return "error";
    case WorkerStatus::kOffline:
      return "offline";
    default:
      return "unknown";
  }
}

constexpr bool IsKnown(WorkerStatus status) {
  return status >= WorkerStatus::kIdle && status <= WorkerStatus::kOffline;
}

struct Worker {
  std::string id;
  std::string name;
  std::string kind;
  std::string resource_context;

  WorkerStatus status = WorkerStatus::kIdle;

  std::chrono::system_clock::time_point last_activity{};

  // Empty when the worker holds no task.
  std::string current_task_ref;

  // Discovery session the worker was derived from, if any.
  std::string session_ref;
};

} // namespace orchestra::model
