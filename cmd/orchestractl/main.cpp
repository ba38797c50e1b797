#include <google/protobuf/util/time_util.h>
#include <grpcpp/grpcpp.h>

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "orchestra/v1.hpp"

using namespace orchestra::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  orchestractl <addr> enqueue <command> [resource_context] [priority=low|normal|high|critical]\n"
            << "  orchestractl <addr> snapshot\n"
            << "  orchestractl <addr> register <id> <resource_context> [name] [kind]\n"
            << "  orchestractl <addr> worker-status <id> <status=idle|busy|error|offline> [task_ref]\n"
            << "  orchestractl <addr> task-status <task_id> <status=in_progress|completed|failed> [result]\n"
            << "  orchestractl <addr> next-task <worker_id>\n"
            << "  orchestractl <addr> assign\n"
            << "  orchestractl <addr> clear-workers\n"
            << "  orchestractl <addr> refresh\n"
            << "  orchestractl <addr> repositories [--refresh]\n"
            << "  orchestractl <addr> history <worker_id|--session session_ref> [max_entries]\n";
}

static std::optional<TaskPriority> ParsePriority(const std::string& value) {
  if (value == "low") return TASK_PRIORITY_LOW;
  if (value == "normal") return TASK_PRIORITY_NORMAL;
  if (value == "high") return TASK_PRIORITY_HIGH;
  if (value == "critical") return TASK_PRIORITY_CRITICAL;
  return std::nullopt;
}

static std::optional<WorkerStatus> ParseWorkerStatus(const std::string& value) {
  if (value == "idle") return WORKER_STATUS_IDLE;
  if (value == "busy") return WORKER_STATUS_BUSY;
  if (value == "error") return WORKER_STATUS_ERROR;
  if (value == "offline") return WORKER_STATUS_OFFLINE;
  return std::nullopt;
}

static std::optional<TaskStatus> ParseTaskStatus(const std::string& value) {
  if (value == "in_progress") return TASK_STATUS_IN_PROGRESS;
  if (value == "completed") return TASK_STATUS_COMPLETED;
  if (value == "failed") return TASK_STATUS_FAILED;
  return std::nullopt;
}

static void PrintTask(const Task& task) {
  std::cout << task.id() << " status=" << TaskStatus_Name(task.status()) << " priority=" << TaskPriority_Name(task.priority())
            << " worker=" << (task.worker_id().empty() ? "-" : task.worker_id()) << " context=" << task.resource_context()
            << " command=" << task.command() << "\n";
}

static void PrintWorker(const Worker& worker) {
  std::cout << worker.id() << " status=" << WorkerStatus_Name(worker.status()) << " context=" << worker.resource_context()
            << " task=" << (worker.current_task_ref().empty() ? "-" : worker.current_task_ref()) << " name=" << worker.name() << "\n";
}

static void PrintRepository(const RepositorySummary& repo) {
  std::cout << repo.name() << " path=" << repo.path() << " workers=" << repo.worker_ids_size() << " idle=" << repo.idle_count()
            << " busy=" << repo.busy_count() << " error=" << repo.error_count() << " offline=" << repo.offline_count() << "\n";
}

static void PrintHistoryEntry(const WorkerHistoryEntry& entry) {
  std::cout << google::protobuf::util::TimeUtil::ToString(entry.timestamp()) << " [" << entry.type() << "] " << entry.content() << "\n";
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_message() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = OrchestratorService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "enqueue") {
    if (argc < 4) return 1;

    EnqueueRequest req;
    req.set_command(argv[3]);
    if (argc >= 5) req.set_resource_context(argv[4]);
    req.set_priority(TASK_PRIORITY_NORMAL);
    if (argc >= 6) {
      auto parsed = ParsePriority(argv[5]);
      if (!parsed) {
        std::cerr << "unsupported priority: " << argv[5] << "\n";
        return 1;
      }
      req.set_priority(*parsed);
    }

    EnqueueResponse resp;
    auto            status = stub->Enqueue(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintTask(resp.task());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "snapshot") {
    GetSnapshotResponse resp;
    auto                status = stub->GetSnapshot(&ctx, GetSnapshotRequest{}, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "workers (" << resp.workers_size() << ")\n";
    for (const auto& worker : resp.workers()) PrintWorker(worker);
    std::cout << "tasks (" << resp.tasks_size() << ")\n";
    for (const auto& task : resp.tasks()) PrintTask(task);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "register") {
    if (argc < 5) return 1;

    RegisterWorkerRequest req;
    auto*                 worker = req.mutable_worker();
    worker->set_id(argv[3]);
    worker->set_resource_context(argv[4]);
    worker->set_name(argc >= 6 ? argv[5] : argv[3]);
    worker->set_kind(argc >= 7 ? argv[6] : "manual");
    worker->set_status(WORKER_STATUS_IDLE);

    RegisterWorkerResponse resp;
    auto                   status = stub->RegisterWorker(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << (resp.accepted() ? "registered\n" : "rejected\n");
    return resp.accepted() ? 0 : 3;
  }

  // ------------------------------------------------------------

  if (cmd == "worker-status") {
    if (argc < 5) return 1;

    auto parsed = ParseWorkerStatus(argv[4]);
    if (!parsed) {
      std::cerr << "unsupported worker status: " << argv[4] << "\n";
      return 1;
    }

    UpdateWorkerStatusRequest req;
    req.set_worker_id(argv[3]);
    req.set_status(*parsed);
    if (argc >= 6) req.set_current_task_ref(argv[5]);

    UpdateWorkerStatusResponse resp;
    auto                       status = stub->UpdateWorkerStatus(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << (resp.accepted() ? "updated\n" : "rejected\n");
    return resp.accepted() ? 0 : 3;
  }

  // ------------------------------------------------------------

  if (cmd == "task-status") {
    if (argc < 5) return 1;

    auto parsed = ParseTaskStatus(argv[4]);
    if (!parsed) {
      std::cerr << "unsupported task status: " << argv[4] << "\n";
      return 1;
    }

    UpdateTaskStatusRequest req;
    req.set_task_id(argv[3]);
    req.set_status(*parsed);
    if (argc >= 6) req.set_result(argv[5]);

    UpdateTaskStatusResponse resp;
    auto                     status = stub->UpdateTaskStatus(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << (resp.accepted() ? "updated\n" : "rejected\n");
    return resp.accepted() ? 0 : 3;
  }

  // ------------------------------------------------------------

  if (cmd == "next-task") {
    if (argc < 4) return 1;

    GetNextTaskRequest req;
    req.set_worker_id(argv[3]);

    GetNextTaskResponse resp;
    auto                status = stub->GetNextTask(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    if (!resp.found()) {
      std::cout << "no task\n";
      return 0;
    }
    PrintTask(resp.task());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "assign") {
    TriggerAssignmentResponse resp;
    auto                      status = stub->TriggerAssignment(&ctx, TriggerAssignmentRequest{}, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "assigned=" << resp.assigned() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "clear-workers") {
    ClearWorkersResponse resp;
    auto                 status = stub->ClearWorkers(&ctx, ClearWorkersRequest{}, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "cleared\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "refresh") {
    RefreshWorkersResponse resp;
    auto                   status = stub->RefreshWorkers(&ctx, RefreshWorkersRequest{}, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "discovered=" << resp.discovered() << " registered=" << resp.registered() << " skipped=" << resp.skipped()
              << " busy=" << resp.busy() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "repositories") {
    ListRepositoriesRequest req;
    req.set_refresh(argc >= 4 && std::string(argv[3]) == "--refresh");

    ListRepositoriesResponse resp;
    auto                     status = stub->ListRepositories(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& repo : resp.repositories()) PrintRepository(repo);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "history") {
    GetWorkerHistoryRequest req;
    int                     next = 3;
    if (argc >= 5 && std::string(argv[3]) == "--session") {
      req.set_session_ref(argv[4]);
      next = 5;
    } else if (argc >= 4) {
      req.set_worker_id(argv[3]);
      next = 4;
    } else {
      Usage();
      return 1;
    }
    if (argc > next) {
      char*      end = nullptr;
      const auto max = std::strtoul(argv[next], &end, 10);
      if (end == argv[next] || *end != '\0') {
        Usage();
        return 1;
      }
      req.set_max_entries(static_cast<std::uint32_t>(max));
    }

    GetWorkerHistoryResponse resp;
    auto                     status = stub->GetWorkerHistory(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& entry : resp.entries()) PrintHistoryEntry(entry);
    return 0;
  }

  Usage();
  return 1;
}
