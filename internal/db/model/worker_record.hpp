#pragma once

#include <cstdint>
#include <string>

#include "internal/model/worker.hpp"

namespace orchestra::db::model {

/*
  Persistent worker row.

  Times are unix milliseconds.
*/

struct WorkerRecord {
  std::string id;
  std::string name;
  std::string kind;
  std::string resource_context;

  orchestra::model::WorkerStatus status = orchestra::model::WorkerStatus::kIdle;

  uint64_t last_activity_ms = 0;

  std::string current_task_ref;
  std::string session_ref;
};

}
