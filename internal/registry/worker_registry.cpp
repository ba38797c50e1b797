#include "worker_registry.hpp"

#include <algorithm>

#include "internal/util/path_utils.hpp"
#include "internal/util/time.hpp"

namespace orchestra::registry {

namespace {

bool IsAvailable(model::WorkerStatus status) {
  return status == model::WorkerStatus::kIdle || status == model::WorkerStatus::kBusy;
}

void SortById(std::vector<model::Worker>& workers) {
  std::sort(workers.begin(), workers.end(), [](const model::Worker& a, const model::Worker& b) { return a.id < b.id; });
}

} // namespace

std::optional<model::Worker> WorkerRegistry::Get(const std::string& id) const {
  std::lock_guard lock(mutex_);
  auto            it = workers_.find(id);
  if (it == workers_.end()) return std::nullopt;
  return it->second;
}

std::vector<model::Worker> WorkerRegistry::GetAll() const {
  std::vector<model::Worker> out;
  {
    std::lock_guard lock(mutex_);
    out.reserve(workers_.size());
    for (const auto& [_, worker] : workers_) {
      out.push_back(worker);
    }
  }
  SortById(out);
  return out;
}

bool WorkerRegistry::Register(const model::Worker& worker) {
  if (worker.id.empty()) {
    return false;
  }

  std::lock_guard lock(mutex_);
  workers_[worker.id] = worker;
  return true;
}

bool WorkerRegistry::UpdateStatus(const std::string& id, model::WorkerStatus status, const std::string& current_task_ref) {
  std::lock_guard lock(mutex_);
  auto            it = workers_.find(id);
  if (it == workers_.end()) {
    return false;
  }

  auto& worker         = it->second;
  worker.status        = status;
  worker.last_activity = util::Now();
  if (!current_task_ref.empty()) {
    worker.current_task_ref = current_task_ref;
  }
  return true;
}

bool WorkerRegistry::CompareAndUpdateStatus(const std::string& id, model::WorkerStatus expected, model::WorkerStatus status,
                                            const std::string& current_task_ref) {
  std::lock_guard lock(mutex_);
  auto            it = workers_.find(id);
  if (it == workers_.end() || it->second.status != expected) {
    return false;
  }

  auto& worker         = it->second;
  worker.status        = status;
  worker.last_activity = util::Now();
  if (!current_task_ref.empty()) {
    worker.current_task_ref = current_task_ref;
  }
  return true;
}

std::vector<model::Worker> WorkerRegistry::FindAvailable(const std::string& resource_context) const {
  std::vector<model::Worker> out;
  {
    std::lock_guard lock(mutex_);
    for (const auto& [_, worker] : workers_) {
      if (!IsAvailable(worker.status)) continue;
      if (!resource_context.empty() && !util::SameResourceContext(worker.resource_context, resource_context)) continue;
      out.push_back(worker);
    }
  }
  SortById(out);
  return out;
}

void WorkerRegistry::ClearAll() {
  std::lock_guard lock(mutex_);
  workers_.clear();
}

void WorkerRegistry::ReplaceAll(const std::vector<model::Worker>& workers) {
  WorkerMap replacement;
  replacement.reserve(workers.size());
  for (const auto& worker : workers) {
    if (worker.id.empty()) continue;
    replacement[worker.id] = worker;
  }

  std::lock_guard lock(mutex_);
  workers_.swap(replacement);
}

std::size_t WorkerRegistry::Size() const {
  std::lock_guard lock(mutex_);
  return workers_.size();
}

} // namespace orchestra::registry
