#include "discovery_reconciler.hpp"

#include <stdexcept>
#include <unordered_map>

#include "internal/observability/logging.hpp"
#include "internal/registry/worker_registry.hpp"
#include "internal/util/time.hpp"

namespace orchestra::discovery {

using observability::IntField;
using observability::StringField;

DiscoveryReconciler::DiscoveryReconciler(std::shared_ptr<registry::WorkerRegistry> registry, std::chrono::milliseconds activity_window, NowFn now)
    : registry_(std::move(registry)), activity_window_(activity_window), now_(std::move(now)) {
  if (!registry_) {
    throw std::invalid_argument("discovery reconciler requires a worker registry");
  }
  if (!now_) {
    now_ = [] { return util::Now(); };
  }
}

model::WorkerStatus DiscoveryReconciler::Classify(const WorkerDescriptor& descriptor, std::chrono::system_clock::time_point now) const {
  if (!descriptor.recent_executor_activity) {
    return model::WorkerStatus::kIdle;
  }

  // A timestamp slightly in the future (clock skew) counts as recent.
  const auto age = now - descriptor.last_activity;
  if (age <= activity_window_) {
    return model::WorkerStatus::kBusy;
  }
  return model::WorkerStatus::kIdle;
}

ReconcileStats DiscoveryReconciler::ReconcileAll(const std::vector<WorkerDescriptor>& descriptors) {
  ReconcileStats stats;
  stats.discovered = descriptors.size();

  const auto now = now_();

  std::vector<model::Worker>                   workers;
  std::unordered_map<std::string, std::size_t> position;
  workers.reserve(descriptors.size());

  for (const auto& descriptor : descriptors) {
    if (descriptor.id.empty()) {
      ++stats.skipped;
      ORCHESTRA_LOG_WARN("Skipping discovered worker without id",
                         {StringField("resource_context", descriptor.resource_context), StringField("session", descriptor.session_ref)});
      continue;
    }

    model::Worker worker;
    worker.id               = descriptor.id;
    worker.name             = descriptor.name;
    worker.kind             = descriptor.kind;
    worker.resource_context = descriptor.resource_context;
    worker.session_ref      = descriptor.session_ref;
    worker.last_activity    = descriptor.last_activity;
    worker.status           = Classify(descriptor, now);

    if (auto it = position.find(worker.id); it != position.end()) {
      ++stats.duplicates;
      workers[it->second] = std::move(worker);
      continue;
    }
    position.emplace(worker.id, workers.size());
    workers.push_back(std::move(worker));
  }

  for (const auto& worker : workers) {
    if (worker.status == model::WorkerStatus::kBusy) ++stats.busy;
  }
  stats.registered = workers.size();

  registry_->ReplaceAll(workers);

  ORCHESTRA_LOG_INFO("Discovered workers reconciled", {IntField("discovered", static_cast<int64_t>(stats.discovered)),
                                                       IntField("registered", static_cast<int64_t>(stats.registered)),
                                                       IntField("busy", static_cast<int64_t>(stats.busy)),
                                                       IntField("skipped", static_cast<int64_t>(stats.skipped))});
  return stats;
}

} // namespace orchestra::discovery
