#pragma once

#include <cstdint>
#include <string>

#include "internal/model/task.hpp"

namespace orchestra::db::model {

/*
  Persistent task row.

  - Times are unix milliseconds; 0 means "not set".
  - sequence preserves enqueue order across restarts.
*/

struct TaskRecord {
  std::string id;
  std::string command;
  std::string resource_context;

  orchestra::model::TaskPriority priority = orchestra::model::TaskPriority::kNormal;
  orchestra::model::TaskStatus   status   = orchestra::model::TaskStatus::kPending;

  std::string worker_id;

  uint64_t created_at_ms   = 0;
  uint64_t started_at_ms   = 0;
  uint64_t completed_at_ms = 0;

  std::string result;

  uint64_t sequence = 0;
};

}
