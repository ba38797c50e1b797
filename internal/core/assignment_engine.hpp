#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "internal/core/dispatcher.hpp"
#include "internal/model/snapshot.hpp"
#include "internal/model/task.hpp"
#include "internal/model/worker.hpp"

namespace orchestra::registry {
class WorkerRegistry;
}

namespace orchestra::core {

class SnapshotStore;

/*
  Owns the task queue and matches Pending tasks to Idle workers.

  Concurrency model:
  - Enqueue, the sweep, UpdateTaskStatus and the Idle -> Busy flip of the
    chosen worker all run under assign_mutex_. A worker is therefore never
    handed two tasks, whichever path triggered the match.
  - Lock order is engine -> registry. The registry never calls back.
  - Mutated task ids are collected in dirty_. Persist() runs after the
    engine lock is released and writes only those tasks plus the worker
    set. Lock order there is persist -> engine -> registry.

  Queue order is (priority desc, created_at asc, sequence asc) and is
  recomputed on each sweep.
*/
class AssignmentEngine final : public Dispatcher {
 public:
  AssignmentEngine(std::shared_ptr<registry::WorkerRegistry> registry, std::shared_ptr<SnapshotStore> store = nullptr);

  // Never fails. Returns the new task id.
  std::string Enqueue(std::string command, std::string resource_context, model::TaskPriority priority);

  // Idle workers only: the oldest-active context match, else the oldest
  // Idle worker anywhere.
  std::optional<model::Worker> FindBestWorker(const std::string& resource_context) const;

  std::size_t AssignUnassignedTasks();
  std::size_t TriggerAssignment() override;

  // False for unknown tasks and for transitions the task state machine
  // rejects. Never touches the worker.
  bool UpdateTaskStatus(const std::string& task_id, model::TaskStatus status, const std::string& result = {});

  std::optional<model::Task> GetTask(const std::string& task_id) const;

  // Oldest Assigned task held by the worker, in queue order.
  std::optional<model::Task> NextTaskForWorker(const std::string& worker_id) const;

  model::Snapshot GetSnapshot() const override;

  // Restores tasks and workers from the store. Call before serving.
  void Hydrate();

  // Writes the worker set and any task changes not yet saved. Used after
  // worker mutations that bypass the engine (registration, discovery).
  void SaveSnapshot();

 private:
  std::vector<std::size_t> PendingInQueueOrderLocked() const;

  bool        TryAssignLocked(model::Task& task);
  std::size_t AssignUnassignedLocked();

  model::Snapshot SnapshotLocked() const;
  void            Persist();

  std::shared_ptr<registry::WorkerRegistry> registry_;
  std::shared_ptr<SnapshotStore>            store_;

  mutable std::mutex                           assign_mutex_;
  std::vector<model::Task>                     tasks_;  // enqueue order
  std::unordered_map<std::string, std::size_t> index_;
  std::unordered_set<std::string>              dirty_;  // task ids changed since the last save
  std::uint64_t                                next_sequence_ = 1;

  std::mutex persist_mutex_;
};

} // namespace orchestra::core
