#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <stop_token>
#include <thread>

#include "internal/discovery/discovery_reconciler.hpp"

namespace orchestra::discovery {

class DiscoveryProvider;

/*
  Periodically pulls descriptors from a provider and applies them.

  The provider runs with no registry or engine lock held; only the
  ReconcileAll step touches the registry. refresh_mutex_ keeps a manual
  RefreshNow() from interleaving with a background pass.
*/
class DiscoveryPoller {
 public:
  using AppliedFn = std::function<void(const ReconcileStats&)>;

  DiscoveryPoller(std::shared_ptr<DiscoveryProvider> provider, std::shared_ptr<DiscoveryReconciler> reconciler, std::chrono::milliseconds interval,
                  AppliedFn on_applied = {});
  ~DiscoveryPoller();

  DiscoveryPoller(const DiscoveryPoller&)            = delete;
  DiscoveryPoller& operator=(const DiscoveryPoller&) = delete;

  // Runs a first pass on the background thread immediately.
  void Start();
  void Stop();

  // One synchronous pass. Provider failures propagate.
  ReconcileStats RefreshNow();

 private:
  void Run(std::stop_token stop);

  std::shared_ptr<DiscoveryProvider>   provider_;
  std::shared_ptr<DiscoveryReconciler> reconciler_;
  std::chrono::milliseconds            interval_;
  AppliedFn                            on_applied_;

  std::mutex refresh_mutex_;

  std::mutex                  wait_mutex_;
  std::condition_variable_any wait_cv_;
  std::jthread                thread_;
  std::atomic<bool>           running_{false};
};

} // namespace orchestra::discovery
