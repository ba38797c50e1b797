#include "pg_repository.hpp"

namespace orchestra::db::postgres {

namespace {

model::WorkerRecord ReadWorker(const pqxx::row& row) {
  model::WorkerRecord r;
  r.id               = row[0].c_str();
  r.name             = row[1].c_str();
  r.kind             = row[2].c_str();
  r.resource_context = row[3].c_str();
  r.status           = static_cast<orchestra::model::WorkerStatus>(row[4].as<int>());
  r.last_activity_ms = row[5].as<uint64_t>();
  r.current_task_ref = row[6].c_str();
  r.session_ref      = row[7].c_str();
  return r;
}

model::TaskRecord ReadTask(const pqxx::row& row) {
  model::TaskRecord r;
  r.id               = row[0].c_str();
  r.command          = row[1].c_str();
  r.resource_context = row[2].c_str();
  r.priority         = static_cast<orchestra::model::TaskPriority>(row[3].as<int>());
  r.status           = static_cast<orchestra::model::TaskStatus>(row[4].as<int>());
  r.worker_id        = row[5].c_str();
  r.created_at_ms    = row[6].as<uint64_t>();
  r.started_at_ms    = row[7].as<uint64_t>();
  r.completed_at_ms  = row[8].as<uint64_t>();
  r.result           = row[9].c_str();
  r.sequence         = row[10].as<uint64_t>();
  return r;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::Conflict, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

Result PgRepository::ReplaceWorkers(Transaction& t, const std::vector<model::WorkerRecord>& records) {
  try {
    auto& work = TX(t).Work();
    work.exec_prepared("delete_workers");
    for (const auto& r : records) {
      work.exec_prepared("insert_worker", r.id, r.name, r.kind, r.resource_context, static_cast<int>(r.status), r.last_activity_ms,
                         r.current_task_ref, r.session_ref);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::WorkerRecord> PgRepository::ListWorkers(Transaction& t) {
  auto res = TX(t).Work().exec_prepared("list_workers");

  std::vector<model::WorkerRecord> records;
  records.reserve(res.size());
  for (const auto& row : res) {
    records.push_back(ReadWorker(row));
  }
  return records;
}

Result PgRepository::UpsertTask(Transaction& t, const model::TaskRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_task", r.id, r.command, r.resource_context, static_cast<int>(r.priority), static_cast<int>(r.status),
                               r.worker_id, r.created_at_ms, r.started_at_ms, r.completed_at_ms, r.result, r.sequence);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::TaskRecord> PgRepository::GetTask(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_task", id);
  if (res.empty()) return std::nullopt;
  return ReadTask(res[0]);
}

std::vector<model::TaskRecord> PgRepository::ListTasks(Transaction& t) {
  auto res = TX(t).Work().exec_prepared("list_tasks");

  std::vector<model::TaskRecord> records;
  records.reserve(res.size());
  for (const auto& row : res) {
    records.push_back(ReadTask(row));
  }
  return records;
}

} // namespace orchestra::db::postgres
