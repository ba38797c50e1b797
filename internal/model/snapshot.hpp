#pragma once

#include <chrono>
#include <vector>

#include "internal/model/task.hpp"
#include "internal/model/worker.hpp"

namespace orchestra::model {

/*
  Point-in-time copy of engine state.

  Tasks are in queue order (priority desc, created_at asc).
  Workers are sorted by id.
*/
struct Snapshot {
  std::vector<Worker> workers;
  std::vector<Task>   tasks;

  std::chrono::system_clock::time_point taken_at{};
};

} // namespace orchestra::model
