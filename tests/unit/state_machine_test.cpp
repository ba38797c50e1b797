#include "internal/model/state_machine.hpp"

#include <cassert>
#include <iostream>

namespace {

using orchestra::model::CanAssign;
using orchestra::model::CanTransition;
using orchestra::model::IsTerminal;
using orchestra::model::TaskStatus;

void TestForwardTransitionsAreAllowed() {
  static_assert(CanTransition(TaskStatus::kAssigned, TaskStatus::kInProgress));
  static_assert(CanTransition(TaskStatus::kAssigned, TaskStatus::kCompleted));
  static_assert(CanTransition(TaskStatus::kAssigned, TaskStatus::kFailed));
  static_assert(CanTransition(TaskStatus::kInProgress, TaskStatus::kCompleted));
  static_assert(CanTransition(TaskStatus::kInProgress, TaskStatus::kFailed));
  static_assert(CanTransition(TaskStatus::kInProgress, TaskStatus::kInProgress));
}

void TestBackwardAndTerminalTransitionsAreRejected() {
  assert(!CanTransition(TaskStatus::kInProgress, TaskStatus::kAssigned));
  assert(!CanTransition(TaskStatus::kInProgress, TaskStatus::kPending));
  assert(!CanTransition(TaskStatus::kAssigned, TaskStatus::kPending));
  assert(!CanTransition(TaskStatus::kCompleted, TaskStatus::kFailed));
  assert(!CanTransition(TaskStatus::kFailed, TaskStatus::kCompleted));
  assert(!CanTransition(TaskStatus::kCompleted, TaskStatus::kCompleted));
}

void TestPendingOnlyLeavesThroughAssignment() {
  assert(!CanTransition(TaskStatus::kPending, TaskStatus::kAssigned));
  assert(!CanTransition(TaskStatus::kPending, TaskStatus::kInProgress));
  assert(!CanTransition(TaskStatus::kPending, TaskStatus::kCompleted));

  assert(CanAssign(TaskStatus::kPending));
  assert(!CanAssign(TaskStatus::kAssigned));
  assert(!CanAssign(TaskStatus::kFailed));
}

void TestUnknownStatusesAreRejected() {
  const auto bogus = static_cast<TaskStatus>(42);
  assert(!CanTransition(bogus, TaskStatus::kCompleted));
  assert(!CanTransition(TaskStatus::kAssigned, bogus));
  assert(!CanTransition(TaskStatus::kAssigned, static_cast<TaskStatus>(0)));
}

void TestTerminalStates() {
  assert(IsTerminal(TaskStatus::kCompleted));
  assert(IsTerminal(TaskStatus::kFailed));
  assert(!IsTerminal(TaskStatus::kInProgress));
}

} // namespace

int main() {
  TestForwardTransitionsAreAllowed();
  TestBackwardAndTerminalTransitionsAreRejected();
  TestPendingOnlyLeavesThroughAssignment();
  TestUnknownStatusesAreRejected();
  TestTerminalStates();

  std::cout << "orchestra_unit_state_machine: pass\n";
  return 0;
}
