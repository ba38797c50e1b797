#include "snapshot_store.hpp"

#include <stdexcept>
#include <vector>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace orchestra::core {

namespace {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::ConstraintViolation:
      throw util::InvalidState(message);
    case db::ErrorCode::Conflict:
    case db::ErrorCode::Busy:
    case db::ErrorCode::IOError:
      throw util::Unavailable(message);
    default:
      throw std::runtime_error(message);
  }
}

uint64_t OptionalMillis(const std::optional<util::TimePoint>& tp) {
  return tp ? util::ToUnixMillis(*tp) : 0;
}

std::optional<util::TimePoint> OptionalTime(uint64_t ms) {
  if (ms == 0) return std::nullopt;
  return util::FromUnixMillis(ms);
}

} // namespace

db::model::WorkerRecord ToWorkerRecord(const model::Worker& worker) {
  db::model::WorkerRecord record;
  record.id               = worker.id;
  record.name             = worker.name;
  record.kind             = worker.kind;
  record.resource_context = worker.resource_context;
  record.status           = worker.status;
  record.last_activity_ms = util::ToUnixMillis(worker.last_activity);
  record.current_task_ref = worker.current_task_ref;
  record.session_ref      = worker.session_ref;
  return record;
}

model::Worker FromWorkerRecord(const db::model::WorkerRecord& record) {
  model::Worker worker;
  worker.id               = record.id;
  worker.name             = record.name;
  worker.kind             = record.kind;
  worker.resource_context = record.resource_context;
  worker.status           = model::IsKnown(record.status) ? record.status : model::WorkerStatus::kOffline;
  worker.last_activity    = util::FromUnixMillis(record.last_activity_ms);
  worker.current_task_ref = record.current_task_ref;
  worker.session_ref      = record.session_ref;
  return worker;
}

db::model::TaskRecord ToTaskRecord(const model::Task& task) {
  db::model::TaskRecord record;
  record.id               = task.id;
  record.command          = task.command;
  record.resource_context = task.resource_context;
  record.priority         = task.priority;
  record.status           = task.status;
  record.worker_id        = task.worker_id;
  record.created_at_ms    = util::ToUnixMillis(task.created_at);
  record.started_at_ms    = OptionalMillis(task.started_at);
  record.completed_at_ms  = OptionalMillis(task.completed_at);
  record.result           = task.result;
  record.sequence         = task.sequence;
  return record;
}

model::Task FromTaskRecord(const db::model::TaskRecord& record) {
  if (!model::IsKnown(record.status) || !model::IsKnown(record.priority)) {
    throw util::InvalidState("task " + record.id + " has an unknown status or priority");
  }

  model::Task task;
  task.id               = record.id;
  task.command          = record.command;
  task.resource_context = record.resource_context;
  task.priority         = record.priority;
  task.status           = record.status;
  task.worker_id        = record.worker_id;
  task.created_at       = util::FromUnixMillis(record.created_at_ms);
  task.started_at       = OptionalTime(record.started_at_ms);
  task.completed_at     = OptionalTime(record.completed_at_ms);
  task.result           = record.result;
  task.sequence         = record.sequence;
  return task;
}

SnapshotStore::SnapshotStore(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
  if (!repository_) {
    throw std::invalid_argument("snapshot store requires a repository");
  }
}

void SnapshotStore::Save(const std::vector<model::Worker>& workers, const std::vector<model::Task>& tasks) {
  std::vector<db::model::WorkerRecord> worker_records;
  worker_records.reserve(workers.size());
  for (const auto& worker : workers) {
    worker_records.push_back(ToWorkerRecord(worker));
  }

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->ReplaceWorkers(*tx, worker_records), "save workers");
  for (const auto& task : tasks) {
    ThrowIfDbError(repository_->UpsertTask(*tx, ToTaskRecord(task)), "save task " + task.id);
  }
  tx->Commit();
}

model::Snapshot SnapshotStore::Load() {
  auto tx          = repository_->Begin();
  auto worker_rows = repository_->ListWorkers(*tx);
  auto task_rows   = repository_->ListTasks(*tx);
  tx->Commit();

  model::Snapshot snapshot;
  snapshot.taken_at = util::Now();
  snapshot.workers.reserve(worker_rows.size());
  for (const auto& row : worker_rows) {
    snapshot.workers.push_back(FromWorkerRecord(row));
  }
  snapshot.tasks.reserve(task_rows.size());
  for (const auto& row : task_rows) {
    snapshot.tasks.push_back(FromTaskRecord(row));
  }
  return snapshot;
}

} // namespace orchestra::core
