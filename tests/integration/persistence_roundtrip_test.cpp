#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/core/assignment_engine.hpp"
#include "internal/core/snapshot_store.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/registry/worker_registry.hpp"

#if ORCHESTRA_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace {

using orchestra::core::AssignmentEngine;
using orchestra::core::SnapshotStore;
using orchestra::db::Repository;
using orchestra::model::TaskPriority;
using orchestra::model::TaskStatus;
using orchestra::model::Worker;
using orchestra::model::WorkerStatus;
using orchestra::registry::WorkerRegistry;

class UnreachableRepository final : public Repository {
 public:
  std::unique_ptr<orchestra::db::Transaction> Begin() override {
    throw std::runtime_error("database unreachable");
  }

  orchestra::db::Result ReplaceWorkers(orchestra::db::Transaction&, const std::vector<orchestra::db::model::WorkerRecord>&) override {
    return orchestra::db::Result::Err(orchestra::db::ErrorCode::IOError);
  }

  std::vector<orchestra::db::model::WorkerRecord> ListWorkers(orchestra::db::Transaction&) override {
    return {};
  }

  orchestra::db::Result UpsertTask(orchestra::db::Transaction&, const orchestra::db::model::TaskRecord&) override {
    return orchestra::db::Result::Err(orchestra::db::ErrorCode::IOError);
  }

  std::optional<orchestra::db::model::TaskRecord> GetTask(orchestra::db::Transaction&, const std::string&) override {
    return std::nullopt;
  }

  std::vector<orchestra::db::model::TaskRecord> ListTasks(orchestra::db::Transaction&) override {
    return {};
  }
};

// Forwards to a memory repository and counts task writes.
class CountingRepository final : public Repository {
 public:
  std::unique_ptr<orchestra::db::Transaction> Begin() override {
    return inner.Begin();
  }

  orchestra::db::Result ReplaceWorkers(orchestra::db::Transaction& tx, const std::vector<orchestra::db::model::WorkerRecord>& records) override {
    return inner.ReplaceWorkers(tx, records);
  }

  std::vector<orchestra::db::model::WorkerRecord> ListWorkers(orchestra::db::Transaction& tx) override {
    return inner.ListWorkers(tx);
  }

  orchestra::db::Result UpsertTask(orchestra::db::Transaction& tx, const orchestra::db::model::TaskRecord& record) override {
    if (fail_writes) {
      return orchestra::db::Result::Err(orchestra::db::ErrorCode::IOError, "disk full");
    }
    ++task_writes;
    return inner.UpsertTask(tx, record);
  }

  std::optional<orchestra::db::model::TaskRecord> GetTask(orchestra::db::Transaction& tx, const std::string& id) override {
    return inner.GetTask(tx, id);
  }

  std::vector<orchestra::db::model::TaskRecord> ListTasks(orchestra::db::Transaction& tx) override {
    return inner.ListTasks(tx);
  }

  orchestra::db::memory::MemoryRepository inner;
  int                                     task_writes = 0;
  bool                                    fail_writes = false;
};

Worker IdleWorker(const std::string& id, const std::string& context) {
  Worker worker;
  worker.id               = id;
  worker.name             = id;
  worker.kind             = "test";
  worker.resource_context = context;
  worker.session_ref      = id + "-session";
  worker.last_activity    = std::chrono::system_clock::now() - std::chrono::minutes(1);
  return worker;
}

// Writes state through one engine, restores it into a fresh one.
void VerifyRoundTrip(const std::function<std::shared_ptr<Repository>()>& open) {
  std::string assigned_id;
  std::string pending_id;
  std::string done_id;
  {
    auto registry = std::make_shared<WorkerRegistry>();
    auto engine   = std::make_shared<AssignmentEngine>(registry, std::make_shared<SnapshotStore>(open()));

    registry->Register(IdleWorker("w1", "/src/repo"));
    engine->SaveSnapshot();

    done_id = engine->Enqueue("first", "/src/repo", TaskPriority::kHigh);
    assert(engine->UpdateTaskStatus(done_id, TaskStatus::kCompleted, "ok"));

    registry->UpdateStatus("w1", WorkerStatus::kIdle);
    assigned_id = engine->Enqueue("second", "/src/repo", TaskPriority::kNormal);
    pending_id  = engine->Enqueue("third", "/src/other", TaskPriority::kCritical);
  }

  auto registry = std::make_shared<WorkerRegistry>();
  auto engine   = std::make_shared<AssignmentEngine>(registry, std::make_shared<SnapshotStore>(open()));
  engine->Hydrate();

  auto done = engine->GetTask(done_id);
  assert(done.has_value());
  assert(done->status == TaskStatus::kCompleted);
  assert(done->result == "ok");
  assert(done->completed_at.has_value());

  auto assigned = engine->GetTask(assigned_id);
  assert(assigned->status == TaskStatus::kAssigned);
  assert(assigned->worker_id == "w1");
  assert(assigned->started_at.has_value());

  auto pending = engine->GetTask(pending_id);
  assert(pending->status == TaskStatus::kPending);
  assert(pending->priority == TaskPriority::kCritical);

  auto worker = registry->Get("w1");
  assert(worker.has_value());
  assert(worker->status == WorkerStatus::kBusy);
  assert(worker->current_task_ref == assigned_id);
  assert(worker->session_ref == "w1-session");

  // Restored queue keeps its order and new tasks land behind it.
  const auto fresh    = engine->Enqueue("fourth", "/src/other", TaskPriority::kCritical);
  const auto snapshot = engine->GetSnapshot();
  assert(snapshot.tasks.size() == 4);
  assert(snapshot.tasks[0].id == pending_id);
  assert(snapshot.tasks[1].id == fresh);
  assert(engine->GetTask(fresh)->sequence > engine->GetTask(pending_id)->sequence);
}

void TestMemoryRoundTrip() {
  auto repository = std::make_shared<orchestra::db::memory::MemoryRepository>();
  VerifyRoundTrip([repository] { return repository; });
}

#if ORCHESTRA_DB_SQLITE
void TestSqliteRoundTrip() {
  const auto stamp   = std::chrono::steady_clock::now().time_since_epoch().count();
  const auto db_path = (std::filesystem::temp_directory_path() / ("orchestra_roundtrip_" + std::to_string(stamp) + ".db")).string();

  VerifyRoundTrip([db_path]() -> std::shared_ptr<Repository> {
    auto db = std::make_shared<orchestra::db::sqlite::SqliteDB>(db_path);
    db->BootstrapSchema();
    return std::make_shared<orchestra::db::sqlite::SqliteRepository>(std::move(db));
  });

  std::filesystem::remove(db_path);
  std::filesystem::remove(db_path + "-wal");
  std::filesystem::remove(db_path + "-shm");
}
#endif

void TestSaveFailureDoesNotFailCaller() {
  auto registry = std::make_shared<WorkerRegistry>();
  auto engine   = std::make_shared<AssignmentEngine>(registry, std::make_shared<SnapshotStore>(std::make_shared<UnreachableRepository>()));

  registry->Register(IdleWorker("w1", "/src/repo"));
  const auto id = engine->Enqueue("build", "/src/repo", TaskPriority::kNormal);
  assert(engine->GetTask(id)->status == TaskStatus::kAssigned);
  assert(engine->UpdateTaskStatus(id, TaskStatus::kInProgress));
  engine->SaveSnapshot();
}

void TestSaveWritesOnlyChangedTasks() {
  auto repository = std::make_shared<CountingRepository>();
  auto registry   = std::make_shared<WorkerRegistry>();
  auto engine     = std::make_shared<AssignmentEngine>(registry, std::make_shared<SnapshotStore>(repository));

  std::vector<std::string> ids;
  for (int i = 0; i < 20; ++i) {
    ids.push_back(engine->Enqueue("job-" + std::to_string(i), "/src/repo", TaskPriority::kNormal));
  }
  // One write per enqueue, not one per task ever queued.
  assert(repository->task_writes == 20);

  registry->Register(IdleWorker("w1", "/src/repo"));
  engine->SaveSnapshot();
  assert(repository->task_writes == 20);

  assert(engine->TriggerAssignment() == 1);
  assert(repository->task_writes == 21);

  assert(engine->UpdateTaskStatus(ids.front(), TaskStatus::kCompleted, "ok"));
  assert(repository->task_writes == 22);

  // Rejected updates write nothing.
  assert(!engine->UpdateTaskStatus(ids.front(), TaskStatus::kInProgress));
  assert(repository->task_writes == 22);

  auto tx     = repository->Begin();
  auto stored = repository->ListTasks(*tx);
  assert(stored.size() == 20);
  assert(stored.front().id == ids.front());
  assert(stored.front().status == TaskStatus::kCompleted);
  assert(repository->ListWorkers(*tx).size() == 1);
  tx->Commit();
}

void TestFailedSaveIsRetriedWithNextSave() {
  auto repository = std::make_shared<CountingRepository>();
  auto registry   = std::make_shared<WorkerRegistry>();
  auto engine     = std::make_shared<AssignmentEngine>(registry, std::make_shared<SnapshotStore>(repository));

  repository->fail_writes = true;
  const auto first        = engine->Enqueue("first", "/src/repo", TaskPriority::kNormal);
  repository->fail_writes = false;

  const auto second = engine->Enqueue("second", "/src/repo", TaskPriority::kNormal);

  auto tx = repository->Begin();
  assert(repository->GetTask(*tx, first).has_value());
  assert(repository->GetTask(*tx, second).has_value());
  tx->Commit();
}

} // namespace

int main() {
  TestMemoryRoundTrip();
#if ORCHESTRA_DB_SQLITE
  TestSqliteRoundTrip();
#endif
  TestSaveFailureDoesNotFailCaller();
  TestSaveWritesOnlyChangedTasks();
  TestFailedSaveIsRetriedWithNextSave();

  std::cout << "orchestra_integration_persistence: pass\n";
  return 0;
}
