#include "assignment_engine.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/core/snapshot_store.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/registry/worker_registry.hpp"
#include "internal/util/path_utils.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace orchestra::core {

using observability::BoolField;
using observability::IntField;
using observability::StringField;

namespace {

// Oldest last_activity first; id breaks ties so the choice is deterministic.
bool ActiveLongerAgo(const model::Worker& a, const model::Worker& b) {
  if (a.last_activity != b.last_activity) return a.last_activity < b.last_activity;
  return a.id < b.id;
}

bool ServedBefore(const model::Task& a, const model::Task& b) {
  if (a.priority != b.priority) return a.priority > b.priority;
  if (a.created_at != b.created_at) return a.created_at < b.created_at;
  return a.sequence < b.sequence;
}

} // namespace

AssignmentEngine::AssignmentEngine(std::shared_ptr<registry::WorkerRegistry> registry, std::shared_ptr<SnapshotStore> store)
    : registry_(std::move(registry)), store_(std::move(store)) {
  if (!registry_) {
    throw std::invalid_argument("assignment engine requires a worker registry");
  }
}

std::string AssignmentEngine::Enqueue(std::string command, std::string resource_context, model::TaskPriority priority) {
  std::string task_id;
  std::size_t assigned = 0;
  {
    std::lock_guard lock(assign_mutex_);

    model::Task task;
    task.id               = util::GenerateUUIDString();
    task.command          = std::move(command);
    task.resource_context = std::move(resource_context);
    task.priority         = model::IsKnown(priority) ? priority : model::TaskPriority::kNormal;
    task.status           = model::TaskStatus::kPending;
    task.created_at       = util::Now();
    task.sequence         = next_sequence_++;
    task_id               = task.id;

    index_[task.id] = tasks_.size();
    dirty_.insert(task.id);
    tasks_.push_back(std::move(task));

    ORCHESTRA_LOG_INFO("Task enqueued", {StringField("task_id", task_id), StringField("priority", model::ToString(tasks_.back().priority)),
                                         StringField("resource_context", tasks_.back().resource_context)});

    if (TryAssignLocked(tasks_.back())) {
      ++assigned;
    }
    // Always sweep: older Pending tasks get another chance against the
    // worker set as it is now.
    assigned += AssignUnassignedLocked();
  }

  if (assigned > 0) {
    ORCHESTRA_LOG_DEBUG("Enqueue sweep assigned tasks", {IntField("assigned", static_cast<int64_t>(assigned))});
  }
  Persist();
  return task_id;
}

std::optional<model::Worker> AssignmentEngine::FindBestWorker(const std::string& resource_context) const {
  std::optional<model::Worker> affine;
  std::optional<model::Worker> fallback;

  for (auto& worker : registry_->FindAvailable({})) {
    if (worker.status != model::WorkerStatus::kIdle) continue;

    if (util::SameResourceContext(worker.resource_context, resource_context)) {
      if (!affine || ActiveLongerAgo(worker, *affine)) affine = worker;
    }
    if (!fallback || ActiveLongerAgo(worker, *fallback)) fallback = std::move(worker);
  }

  return affine ? affine : fallback;
}

std::size_t AssignmentEngine::AssignUnassignedTasks() {
  std::size_t assigned = 0;
  {
    std::lock_guard lock(assign_mutex_);
    assigned = AssignUnassignedLocked();
  }

  if (assigned > 0) {
    Persist();
  }
  return assigned;
}

std::size_t AssignmentEngine::TriggerAssignment() {
  return AssignUnassignedTasks();
}

bool AssignmentEngine::UpdateTaskStatus(const std::string& task_id, model::TaskStatus status, const std::string& result) {
  {
    std::lock_guard lock(assign_mutex_);

    auto it = index_.find(task_id);
    if (it == index_.end()) {
      ORCHESTRA_LOG_WARN("Task status update for unknown task", {StringField("task_id", task_id)});
      return false;
    }

    auto& task = tasks_[it->second];
    if (!model::CanTransition(task.status, status)) {
      ORCHESTRA_LOG_WARN("Task status transition rejected",
                         {StringField("task_id", task_id), StringField("from", model::ToString(task.status)), StringField("to", model::ToString(status))});
      return false;
    }
    if (task.status == status && result.empty()) {
      return true;
    }

    task.status = status;
    if (!result.empty()) {
      task.result = result;
    }
    if (model::IsTerminal(status)) {
      task.completed_at = util::Now();
    }

    ORCHESTRA_LOG_INFO("Task status updated", {StringField("task_id", task_id), StringField("status", model::ToString(status)),
                                               StringField("worker_id", task.worker_id)});
    dirty_.insert(task_id);
  }

  Persist();
  return true;
}

std::optional<model::Task> AssignmentEngine::GetTask(const std::string& task_id) const {
  std::lock_guard lock(assign_mutex_);
  auto            it = index_.find(task_id);
  if (it == index_.end()) return std::nullopt;
  return tasks_[it->second];
}

std::optional<model::Task> AssignmentEngine::NextTaskForWorker(const std::string& worker_id) const {
  if (worker_id.empty()) return std::nullopt;

  std::lock_guard             lock(assign_mutex_);
  std::optional<model::Task> next;
  for (const auto& task : tasks_) {
    if (task.status != model::TaskStatus::kAssigned || task.worker_id != worker_id) continue;
    if (!next || ServedBefore(task, *next)) next = task;
  }
  return next;
}

model::Snapshot AssignmentEngine::GetSnapshot() const {
  std::lock_guard lock(assign_mutex_);
  return SnapshotLocked();
}

void AssignmentEngine::Hydrate() {
  if (!store_) {
    return;
  }

  auto snapshot = store_->Load();

  std::lock_guard lock(assign_mutex_);
  tasks_ = std::move(snapshot.tasks);
  std::sort(tasks_.begin(), tasks_.end(), [](const model::Task& a, const model::Task& b) { return a.sequence < b.sequence; });

  index_.clear();
  dirty_.clear();
  next_sequence_ = 1;
  for (std::size_t i = 0; i < tasks_.size(); ++i) {
    index_[tasks_[i].id] = i;
    next_sequence_       = std::max(next_sequence_, tasks_[i].sequence + 1);
  }
  registry_->ReplaceAll(snapshot.workers);

  ORCHESTRA_LOG_INFO("Engine state restored", {IntField("tasks", static_cast<int64_t>(tasks_.size())),
                                               IntField("workers", static_cast<int64_t>(snapshot.workers.size()))});
}

void AssignmentEngine::SaveSnapshot() {
  Persist();
}

std::vector<std::size_t> AssignmentEngine::PendingInQueueOrderLocked() const {
  std::vector<std::size_t> pending;
  for (std::size_t i = 0; i < tasks_.size(); ++i) {
    if (model::CanAssign(tasks_[i].status)) pending.push_back(i);
  }
  std::stable_sort(pending.begin(), pending.end(), [this](std::size_t a, std::size_t b) { return ServedBefore(tasks_[a], tasks_[b]); });
  return pending;
}

bool AssignmentEngine::TryAssignLocked(model::Task& task) {
  if (!model::CanAssign(task.status)) {
    return false;
  }

  auto worker = FindBestWorker(task.resource_context);
  if (!worker) {
    return false;
  }

  // The flip is conditional: a worker that reported a new status since
  // FindBestWorker read it keeps that status and the task stays Pending.
  if (!registry_->CompareAndUpdateStatus(worker->id, model::WorkerStatus::kIdle, model::WorkerStatus::kBusy, task.id)) {
    ORCHESTRA_LOG_DEBUG("Worker changed before assignment", {StringField("worker_id", worker->id), StringField("task_id", task.id)});
    return false;
  }

  task.status     = model::TaskStatus::kAssigned;
  task.worker_id  = worker->id;
  task.started_at = util::Now();
  dirty_.insert(task.id);

  ORCHESTRA_LOG_INFO("Task assigned", {StringField("task_id", task.id), StringField("worker_id", worker->id),
                                       BoolField("context_match", util::SameResourceContext(worker->resource_context, task.resource_context))});
  return true;
}

std::size_t AssignmentEngine::AssignUnassignedLocked() {
  std::size_t assigned = 0;
  for (auto idx : PendingInQueueOrderLocked()) {
    if (TryAssignLocked(tasks_[idx])) {
      ++assigned;
    }
  }
  return assigned;
}

model::Snapshot AssignmentEngine::SnapshotLocked() const {
  model::Snapshot snapshot;
  snapshot.taken_at = util::Now();
  snapshot.workers  = registry_->GetAll();
  snapshot.tasks    = tasks_;
  std::stable_sort(snapshot.tasks.begin(), snapshot.tasks.end(), ServedBefore);
  return snapshot;
}

void AssignmentEngine::Persist() {
  if (!store_) {
    return;
  }

  // Saves are serialized and each one drains the dirty set under the
  // engine lock, so a later save always carries the newest row state.
  std::lock_guard            persist_lock(persist_mutex_);
  std::vector<model::Task>   changed;
  std::vector<model::Worker> workers;
  {
    std::lock_guard lock(assign_mutex_);
    changed.reserve(dirty_.size());
    for (const auto& id : dirty_) {
      changed.push_back(tasks_[index_.at(id)]);
    }
    dirty_.clear();
    workers = registry_->GetAll();
  }

  try {
    store_->Save(workers, changed);
  } catch (const std::exception& e) {
    ORCHESTRA_LOG_ERROR("Snapshot save failed", {StringField("error", e.what()), IntField("pending_tasks", static_cast<int64_t>(changed.size()))});

    // Retried with the next save.
    std::lock_guard lock(assign_mutex_);
    for (const auto& task : changed) {
      dirty_.insert(task.id);
    }
  }
}

} // namespace orchestra::core
