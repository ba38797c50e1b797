#include "discovery_poller.hpp"

#include <stdexcept>
#include <vector>

#include "internal/discovery/discovery_provider.hpp"
#include "internal/observability/logging.hpp"

namespace orchestra::discovery {

using observability::IntField;
using observability::StringField;

DiscoveryPoller::DiscoveryPoller(std::shared_ptr<DiscoveryProvider> provider, std::shared_ptr<DiscoveryReconciler> reconciler,
                                 std::chrono::milliseconds interval, AppliedFn on_applied)
    : provider_(std::move(provider)), reconciler_(std::move(reconciler)), interval_(interval), on_applied_(std::move(on_applied)) {
  if (!provider_ || !reconciler_) {
    throw std::invalid_argument("discovery poller requires a provider and a reconciler");
  }
  if (interval_.count() <= 0) {
    throw std::invalid_argument("discovery refresh interval must be positive");
  }
}

DiscoveryPoller::~DiscoveryPoller() {
  Stop();
}

void DiscoveryPoller::Start() {
  if (running_.exchange(true)) {
    return;
  }
  thread_ = std::jthread([this](std::stop_token stop) { Run(stop); });
  ORCHESTRA_LOG_INFO("Discovery poller started", {IntField("interval_ms", interval_.count())});
}

void DiscoveryPoller::Stop() {
  if (!thread_.joinable()) {
    return;
  }
  thread_.request_stop();
  wait_cv_.notify_all();
  thread_.join();
  running_ = false;
  ORCHESTRA_LOG_INFO("Discovery poller stopped");
}

ReconcileStats DiscoveryPoller::RefreshNow() {
  std::lock_guard lock(refresh_mutex_);

  // Slow I/O; no registry or engine lock is held here.
  const std::vector<WorkerDescriptor> descriptors = provider_->DiscoverAll();

  auto stats = reconciler_->ReconcileAll(descriptors);
  if (on_applied_) {
    on_applied_(stats);
  }
  return stats;
}

void DiscoveryPoller::Run(std::stop_token stop) {
  while (!stop.stop_requested()) {
    try {
      RefreshNow();
    } catch (const std::exception& e) {
      ORCHESTRA_LOG_ERROR("Worker discovery failed", {StringField("error", e.what())});
    }

    std::unique_lock lock(wait_mutex_);
    wait_cv_.wait_for(lock, stop, interval_, [] { return false; });
  }
}

} // namespace orchestra::discovery
