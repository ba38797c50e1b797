#include "internal/discovery/discovery_reconciler.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/registry/worker_registry.hpp"

namespace {

using namespace std::chrono_literals;

using orchestra::discovery::DiscoveryReconciler;
using orchestra::discovery::WorkerDescriptor;
using orchestra::model::Worker;
using orchestra::model::WorkerStatus;
using orchestra::registry::WorkerRegistry;

const auto kNow = std::chrono::system_clock::time_point{} + std::chrono::hours(24 * 365 * 50);

WorkerDescriptor Descriptor(const std::string& id, std::chrono::seconds age, bool recent_activity) {
  WorkerDescriptor descriptor;
  descriptor.id                       = id;
  descriptor.name                     = "claude-code - repo (" + id + ")";
  descriptor.kind                     = "claude-code";
  descriptor.resource_context         = "/src/repo";
  descriptor.session_ref              = id + "-session";
  descriptor.last_activity            = kNow - age;
  descriptor.recent_executor_activity = recent_activity;
  return descriptor;
}

DiscoveryReconciler MakeReconciler(const std::shared_ptr<WorkerRegistry>& registry) {
  return DiscoveryReconciler(registry, 120s, [] { return kNow; });
}

void TestClassifyUsesActivityWindow() {
  auto registry   = std::make_shared<WorkerRegistry>();
  auto reconciler = MakeReconciler(registry);

  assert(reconciler.Classify(Descriptor("a", 10s, true), kNow) == WorkerStatus::kBusy);
  assert(reconciler.Classify(Descriptor("b", 120s, true), kNow) == WorkerStatus::kBusy);
  assert(reconciler.Classify(Descriptor("c", 121s, true), kNow) == WorkerStatus::kIdle);
  assert(reconciler.Classify(Descriptor("d", 1s, false), kNow) == WorkerStatus::kIdle);
}

void TestReconcileReplacesRegistryContents() {
  auto registry = std::make_shared<WorkerRegistry>();

  Worker stale;
  stale.id     = "stale";
  stale.status = WorkerStatus::kError;
  registry->Register(stale);

  auto reconciler = MakeReconciler(registry);
  auto stats      = reconciler.ReconcileAll({Descriptor("busy", 5s, true), Descriptor("idle", 600s, true)});

  assert(stats.discovered == 2);
  assert(stats.registered == 2);
  assert(stats.busy == 1);
  assert(stats.skipped == 0);

  assert(!registry->Get("stale").has_value());
  auto busy = registry->Get("busy");
  assert(busy->status == WorkerStatus::kBusy);
  assert(busy->session_ref == "busy-session");
  assert(busy->last_activity == kNow - 5s);
  assert(registry->Get("idle")->status == WorkerStatus::kIdle);
}

void TestEmptyIdsAreSkippedAndLastDuplicateWins() {
  auto registry   = std::make_shared<WorkerRegistry>();
  auto reconciler = MakeReconciler(registry);

  auto first  = Descriptor("dup", 5s, true);
  auto second = Descriptor("dup", 5s, false);
  second.resource_context = "/src/other";

  auto stats = reconciler.ReconcileAll({Descriptor("", 1s, true), first, second});
  assert(stats.discovered == 3);
  assert(stats.skipped == 1);
  assert(stats.duplicates == 1);
  assert(stats.registered == 1);
  assert(stats.busy == 0);

  auto stored = registry->Get("dup");
  assert(stored->resource_context == "/src/other");
  assert(stored->status == WorkerStatus::kIdle);
}

void TestEmptyBatchClearsRegistry() {
  auto registry = std::make_shared<WorkerRegistry>();
  auto reconciler = MakeReconciler(registry);

  reconciler.ReconcileAll({Descriptor("a", 1s, false)});
  assert(registry->Size() == 1);

  auto stats = reconciler.ReconcileAll({});
  assert(stats.registered == 0);
  assert(registry->Size() == 0);
}

} // namespace

int main() {
  TestClassifyUsesActivityWindow();
  TestReconcileReplacesRegistryContents();
  TestEmptyIdsAreSkippedAndLastDuplicateWins();
  TestEmptyBatchClearsRegistry();

  std::cout << "orchestra_unit_discovery_reconciler: pass\n";
  return 0;
}
