#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/model/task_record.hpp"
#include "internal/db/model/worker_record.hpp"

#if ORCHESTRA_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if ORCHESTRA_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using orchestra::db::Repository;
using orchestra::db::memory::MemoryRepository;
using orchestra::db::model::TaskRecord;
using orchestra::db::model::WorkerRecord;
using orchestra::model::TaskPriority;
using orchestra::model::TaskStatus;
using orchestra::model::WorkerStatus;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

WorkerRecord MakeWorker(const std::string& id, const std::string& context, WorkerStatus status) {
  WorkerRecord record;
  record.id               = id;
  record.name             = "worker " + id;
  record.kind             = "claude-code";
  record.resource_context = context;
  record.status           = status;
  record.last_activity_ms = NowMs();
  record.session_ref      = id + "-session";
  return record;
}

TaskRecord MakeTask(const std::string& id, uint64_t sequence, TaskPriority priority) {
  TaskRecord record;
  record.id               = id;
  record.command          = "build " + id;
  record.resource_context = "/src/repo";
  record.priority         = priority;
  record.status           = TaskStatus::kPending;
  record.created_at_ms    = NowMs();
  record.sequence         = sequence;
  return record;
}

void VerifyWorkerReplace(Repository& repo, const std::string& prefix) {
  {
    auto tx = repo.Begin();
    assert(repo.ReplaceWorkers(*tx, {MakeWorker(prefix + "-b", "/src/b", WorkerStatus::kBusy), MakeWorker(prefix + "-a", "/src/a", WorkerStatus::kIdle)}));
    tx->Commit();
  }

  {
    auto tx      = repo.Begin();
    auto workers = repo.ListWorkers(*tx);
    assert(workers.size() == 2);
    assert(workers[0].id == prefix + "-a");
    assert(workers[1].id == prefix + "-b");
    assert(workers[1].status == WorkerStatus::kBusy);
    assert(workers[1].session_ref == prefix + "-b-session");
    tx->Commit();
  }

  // Replace drops workers missing from the new set.
  {
    auto tx      = repo.Begin();
    auto updated = MakeWorker(prefix + "-c", "/src/c", WorkerStatus::kError);
    updated.current_task_ref = "task-1";
    assert(repo.ReplaceWorkers(*tx, {updated}));
    tx->Commit();
  }

  auto tx      = repo.Begin();
  auto workers = repo.ListWorkers(*tx);
  assert(workers.size() == 1);
  assert(workers[0].id == prefix + "-c");
  assert(workers[0].status == WorkerStatus::kError);
  assert(workers[0].current_task_ref == "task-1");
  tx->Commit();
}

void VerifyTaskUpsertAndOrder(Repository& repo, const std::string& prefix) {
  {
    auto tx = repo.Begin();
    assert(repo.UpsertTask(*tx, MakeTask(prefix + "-2", 2, TaskPriority::kCritical)));
    assert(repo.UpsertTask(*tx, MakeTask(prefix + "-1", 1, TaskPriority::kLow)));
    tx->Commit();
  }

  {
    auto tx   = repo.Begin();
    auto task = repo.GetTask(*tx, prefix + "-1");
    assert(task.has_value());
    assert(task->priority == TaskPriority::kLow);
    assert(task->status == TaskStatus::kPending);
    assert(task->worker_id.empty());

    task->status          = TaskStatus::kCompleted;
    task->worker_id       = "w1";
    task->started_at_ms   = task->created_at_ms + 5;
    task->completed_at_ms = task->created_at_ms + 10;
    task->result          = "ok";
    assert(repo.UpsertTask(*tx, *task));
    tx->Commit();
  }

  auto tx = repo.Begin();

  std::vector<TaskRecord> tasks;
  for (auto& task : repo.ListTasks(*tx)) {
    if (task.id.rfind(prefix, 0) == 0) tasks.push_back(std::move(task));
  }
  assert(tasks.size() == 2);
  assert(tasks[0].id == prefix + "-1");
  assert(tasks[1].id == prefix + "-2");
  assert(tasks[0].status == TaskStatus::kCompleted);
  assert(tasks[0].worker_id == "w1");
  assert(tasks[0].result == "ok");
  assert(tasks[0].completed_at_ms == tasks[0].created_at_ms + 10);
  assert(!repo.GetTask(*tx, prefix + "-missing").has_value());
  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& id) {
  {
    auto tx = repo.Begin();
    assert(repo.UpsertTask(*tx, MakeTask(id, 99, TaskPriority::kNormal)));
    tx->Rollback();
  }

  {
    // Destruction without commit rolls back as well.
    auto tx = repo.Begin();
    assert(repo.UpsertTask(*tx, MakeTask(id + "-dropped", 100, TaskPriority::kNormal)));
  }

  auto check_tx = repo.Begin();
  assert(!repo.GetTask(*check_tx, id).has_value());
  assert(!repo.GetTask(*check_tx, id + "-dropped").has_value());
  check_tx->Commit();
}

void VerifyReadYourWrites(Repository& repo, const std::string& id) {
  auto tx = repo.Begin();
  assert(repo.UpsertTask(*tx, MakeTask(id, 7, TaskPriority::kHigh)));
  auto inside = repo.GetTask(*tx, id);
  assert(inside.has_value());
  assert(inside->priority == TaskPriority::kHigh);
  tx->Rollback();
}

void VerifyBatchInOneTransaction(Repository& repo, const std::string& prefix) {
  {
    auto tx = repo.Begin();
    for (int i = 0; i < 50; ++i) {
      assert(repo.UpsertTask(*tx, MakeTask(prefix + "-" + std::to_string(i), 2000 + i, TaskPriority::kNormal)));
    }
    // Last write in the transaction wins.
    auto again   = MakeTask(prefix + "-0", 2000, TaskPriority::kNormal);
    again.status = TaskStatus::kFailed;
    again.result = "retried";
    assert(repo.UpsertTask(*tx, again));
    assert(repo.ReplaceWorkers(*tx, {MakeWorker(prefix + "-w1", "/src/a", WorkerStatus::kIdle), MakeWorker(prefix + "-w2", "/src/b", WorkerStatus::kBusy)}));
    tx->Commit();
  }

  auto tx = repo.Begin();

  std::size_t stored = 0;
  for (const auto& task : repo.ListTasks(*tx)) {
    if (task.id.rfind(prefix + "-", 0) == 0) ++stored;
  }
  assert(stored == 50);

  auto first = repo.GetTask(*tx, prefix + "-0");
  assert(first.has_value());
  assert(first->status == TaskStatus::kFailed);
  assert(first->result == "retried");
  assert(repo.ListWorkers(*tx).size() == 2);
  tx->Commit();
}

void VerifyRestartPersistence(BackendFactory& backend, const std::string& id) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx = repo->Begin();
    assert(repo->UpsertTask(*tx, MakeTask(id, 1000, TaskPriority::kHigh)));
    assert(repo->ReplaceWorkers(*tx, {MakeWorker(id + "-worker", "/src/restart", WorkerStatus::kOffline)}));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx   = repo->Begin();
  auto task = repo->GetTask(*tx, id);
  assert(task.has_value());
  assert(task->sequence == 1000);

  auto workers = repo->ListWorkers(*tx);
  assert(workers.size() == 1);
  assert(workers[0].status == WorkerStatus::kOffline);
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if ORCHESTRA_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("orchestra_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() -> std::shared_ptr<Repository> {
    auto db = std::make_shared<orchestra::db::sqlite::SqliteDB>(db_path);
    db->BootstrapSchema();
    return std::make_shared<orchestra::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
  };
}
#endif

#if ORCHESTRA_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("ORCHESTRA_TEST_POSTGRES_URI");
  if (!uri || std::string(uri).empty()) {
    throw std::runtime_error("ORCHESTRA_TEST_POSTGRES_URI is not set");
  }

  const std::string conninfo = uri;
  auto make_repo = [conninfo]() -> std::shared_ptr<Repository> {
    auto pool = std::make_shared<orchestra::db::postgres::PgPool>(conninfo);
    pool->BootstrapSchema();
    return std::make_shared<orchestra::db::postgres::PgRepository>(std::move(pool));
  };

  return BackendFactory{
      .name             = "postgres",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = []() {},
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  // Unique prefix so a shared postgres database does not collide between runs.
  const auto prefix = backend.name + "-" + std::to_string(NowMs());

  {
    auto repo = backend.make_repository();
    VerifyWorkerReplace(*repo, prefix + "-workers");
  }
  {
    auto repo = backend.make_repository();
    VerifyTaskUpsertAndOrder(*repo, prefix + "-task");
    VerifyRollbackBehavior(*repo, prefix + "-rollback");
    VerifyReadYourWrites(*repo, prefix + "-ryw");
    VerifyBatchInOneTransaction(*repo, prefix + "-batch");
  }

  backend.cleanup();
  VerifyRestartPersistence(backend, prefix + "-restart");
  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if ORCHESTRA_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if ORCHESTRA_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "orchestra_integration_repository_parity: pass\n";
  return 0;
}
