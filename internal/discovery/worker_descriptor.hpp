#pragma once

#include <chrono>
#include <string>

namespace orchestra::discovery {

// One worker as reported by a discovery provider.
struct WorkerDescriptor {
  std::string id;
  std::string name;
  std::string kind;
  std::string resource_context;
  std::string session_ref;

  std::chrono::system_clock::time_point last_activity{};

  // The executor wrote output recently (e.g. an assistant turn in the
  // session log).
  bool recent_executor_activity = false;
};

} // namespace orchestra::discovery
