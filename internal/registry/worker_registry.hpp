#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/model/worker.hpp"

namespace orchestra::registry {

/*
  Concurrency-safe store of workers keyed by id.

  Every operation runs under one mutex, so a status flip is visible to the
  next reader. Results are copies; callers never hold references into the
  map. The registry does not police status transitions.
*/
class WorkerRegistry {
 public:
  std::optional<model::Worker> Get(const std::string& id) const;

  // Sorted by id.
  std::vector<model::Worker> GetAll() const;

  // Upsert. Fails only for an empty id.
  bool Register(const model::Worker& worker);

  // Fails for an unknown id. A non-empty current_task_ref replaces the
  // previous one; an empty one keeps it.
  bool UpdateStatus(const std::string& id, model::WorkerStatus status, const std::string& current_task_ref = {});

  // UpdateStatus that only applies while the worker is still in `expected`.
  // The assignment sweep uses it to flip Idle -> Busy without clobbering a
  // status the worker reported in between.
  bool CompareAndUpdateStatus(const std::string& id, model::WorkerStatus expected, model::WorkerStatus status,
                              const std::string& current_task_ref = {});

  // Idle or Busy workers, optionally restricted to one resource context.
  std::vector<model::Worker> FindAvailable(const std::string& resource_context) const;

  void ClearAll();

  // Full replace. The new map is built before the lock is taken, so
  // readers see either the old set or the new one, never an empty registry.
  void ReplaceAll(const std::vector<model::Worker>& workers);

  std::size_t Size() const;

 private:
  using WorkerMap = std::unordered_map<std::string, model::Worker>;

  mutable std::mutex mutex_;
  WorkerMap          workers_;
};

} // namespace orchestra::registry
