#pragma once

#include <cstddef>

#include "internal/model/snapshot.hpp"

namespace orchestra::core {

/*
  What the reconciliation loop needs from the assignment engine.
*/
class Dispatcher {
 public:
  virtual ~Dispatcher() = default;

  virtual model::Snapshot GetSnapshot() const = 0;

  // Runs one assignment sweep. Returns the number of tasks assigned.
  virtual std::size_t TriggerAssignment() = 0;
};

} // namespace orchestra::core
