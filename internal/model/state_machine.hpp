#pragma once

#include "internal/model/task.hpp"

namespace orchestra::model {

constexpr bool IsTerminal(TaskStatus status) {
  return status == TaskStatus::kCompleted || status == TaskStatus::kFailed;
}

// Only the assignment sweep moves a task out of Pending.
constexpr bool CanAssign(TaskStatus status) {
  return status == TaskStatus::kPending;
}

/*
  Transitions a worker may report for its own task.

  Assigned    -> InProgress | Completed | Failed
  InProgress  -> InProgress (re-report) | Completed | Failed

  Pending and Assigned are never valid targets, and terminal tasks are
  immutable.
*/
constexpr bool CanTransition(TaskStatus from, TaskStatus to) {
  if (!IsKnown(from) || !IsKnown(to)) {
    return false;
  }
  if (IsTerminal(from)) {
    return false;
  }
  if (to == TaskStatus::kPending || to == TaskStatus::kAssigned) {
    return false;
  }
  if (from == TaskStatus::kPending) {
    return false;
  }

  return static_cast<std::uint8_t>(to) >= static_cast<std::uint8_t>(from);
}

} // namespace orchestra::model
