#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <vector>

#include "internal/discovery/worker_descriptor.hpp"
#include "internal/model/worker.hpp"

namespace orchestra::registry {
class WorkerRegistry;
}

namespace orchestra::discovery {

struct ReconcileStats {
  std::size_t discovered = 0;
  std::size_t registered = 0;
  std::size_t skipped    = 0;  // empty ids
  std::size_t duplicates = 0;  // later descriptor replaced an earlier one
  std::size_t busy       = 0;
};

/*
  Replaces the registry contents with a discovered worker set.

  Status policy: Busy when the executor was active within activity_window
  of now, Idle otherwise. Discovery never yields Error or Offline.

  Merge is a full replace: workers missing from the batch are dropped even
  if a task still references them.
*/
class DiscoveryReconciler {
 public:
  using NowFn = std::function<std::chrono::system_clock::time_point()>;

  DiscoveryReconciler(std::shared_ptr<registry::WorkerRegistry> registry, std::chrono::milliseconds activity_window, NowFn now = {});

  ReconcileStats ReconcileAll(const std::vector<WorkerDescriptor>& descriptors);

  model::WorkerStatus Classify(const WorkerDescriptor& descriptor, std::chrono::system_clock::time_point now) const;

 private:
  std::shared_ptr<registry::WorkerRegistry> registry_;
  std::chrono::milliseconds                 activity_window_;
  NowFn                                     now_;
};

} // namespace orchestra::discovery
