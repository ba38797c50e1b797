#include "orchestrator_service.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include "internal/core/assignment_engine.hpp"
#include "internal/core/repository_grouping.hpp"
#include "internal/discovery/discovery_poller.hpp"
#include "internal/discovery/session_directory_provider.hpp"
#include "internal/observability/logging.hpp"
#include "internal/registry/worker_registry.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace orchestra::service {

using namespace orchestra::v1;
using orchestra::observability::StringField;

namespace {

constexpr std::size_t kMaxHistoryEntries = 1000;

template <typename Fn>
auto ObserveRpc(std::string_view route, Fn&& fn) {
  try {
    return fn();
  } catch (const std::exception& ex) {
    ORCHESTRA_LOG_ERROR("RPC failed", {StringField("route", route), StringField("error", ex.what())});
    throw;
  }
}

// -- proto -> model ---------------------------------------------------------

model::TaskPriority ToModel(TaskPriority priority) {
  if (priority == TASK_PRIORITY_UNSPECIFIED) {
    return model::TaskPriority::kNormal;
  }
  const auto converted = static_cast<model::TaskPriority>(priority);
  if (!model::IsKnown(converted)) {
    throw util::InvalidArgument("unknown task priority: " + std::to_string(priority));
  }
  return converted;
}

model::WorkerStatus ToModel(WorkerStatus status) {
  const auto converted = static_cast<model::WorkerStatus>(status);
  if (!model::IsKnown(converted)) {
    throw util::InvalidArgument("unknown worker status: " + std::to_string(status));
  }
  return converted;
}

model::Worker ToModel(const Worker& worker) {
  model::Worker out;
  out.id               = worker.id();
  out.name             = worker.name();
  out.kind             = worker.kind();
  out.resource_context = worker.resource_context();
  out.status           = worker.status() == WORKER_STATUS_UNSPECIFIED ? model::WorkerStatus::kIdle : ToModel(worker.status());
  out.last_activity    = worker.has_last_activity() ? util::FromProto(worker.last_activity()) : util::Now();
  out.current_task_ref = worker.current_task_ref();
  out.session_ref      = worker.session_ref();
  return out;
}

// -- model -> proto ---------------------------------------------------------

Worker ToProto(const model::Worker& worker) {
  Worker out;
  out.set_id(worker.id);
  out.set_name(worker.name);
  out.set_kind(worker.kind);
  out.set_resource_context(worker.resource_context);
  out.set_status(static_cast<WorkerStatus>(worker.status));
  *out.mutable_last_activity() = util::ToProto(worker.last_activity);
  out.set_current_task_ref(worker.current_task_ref);
  out.set_session_ref(worker.session_ref);
  return out;
}

Task ToProto(const model::Task& task) {
  Task out;
  out.set_id(task.id);
  out.set_command(task.command);
  out.set_resource_context(task.resource_context);
  out.set_priority(static_cast<TaskPriority>(task.priority));
  out.set_status(static_cast<TaskStatus>(task.status));
  out.set_worker_id(task.worker_id);
  *out.mutable_created_at() = util::ToProto(task.created_at);
  if (task.started_at) {
    *out.mutable_started_at() = util::ToProto(*task.started_at);
  }
  if (task.completed_at) {
    *out.mutable_completed_at() = util::ToProto(*task.completed_at);
  }
  out.set_result(task.result);
  return out;
}

RepositorySummary ToProto(const model::RepositorySummary& summary) {
  RepositorySummary out;
  out.set_name(summary.name);
  out.set_path(summary.path);
  for (const auto& id : summary.worker_ids) {
    out.add_worker_ids(id);
  }
  out.set_idle_count(summary.idle_count);
  out.set_busy_count(summary.busy_count);
  out.set_error_count(summary.error_count);
  out.set_offline_count(summary.offline_count);
  return out;
}

} // namespace

OrchestratorService::OrchestratorService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

EnqueueResponse OrchestratorService::Enqueue(const EnqueueRequest& req) {
  return ObserveRpc("OrchestratorService.Enqueue", [&] {
    const auto priority = ToModel(req.priority());

    EnqueueResponse resp;
    const auto task_id = ctx_.engine->Enqueue(req.command(), req.resource_context(), priority);
    resp.set_task_id(task_id);
    if (auto task = ctx_.engine->GetTask(task_id)) {
      *resp.mutable_task() = ToProto(*task);
    }
    return resp;
  });
}

GetSnapshotResponse OrchestratorService::GetSnapshot(const GetSnapshotRequest&) {
  return ObserveRpc("OrchestratorService.GetSnapshot", [&] {
    const auto snapshot = ctx_.engine->GetSnapshot();

    GetSnapshotResponse resp;
    for (const auto& worker : snapshot.workers) {
      *resp.add_workers() = ToProto(worker);
    }
    for (const auto& task : snapshot.tasks) {
      *resp.add_tasks() = ToProto(task);
    }
    for (const auto& summary : core::GroupByRepository(snapshot.workers)) {
      *resp.add_repositories() = ToProto(summary);
    }
    *resp.mutable_taken_at() = util::ToProto(snapshot.taken_at);
    return resp;
  });
}

RegisterWorkerResponse OrchestratorService::RegisterWorker(const RegisterWorkerRequest& req) {
  return ObserveRpc("OrchestratorService.RegisterWorker", [&] {
    const auto worker = ToModel(req.worker());

    RegisterWorkerResponse resp;
    resp.set_accepted(ctx_.registry->Register(worker));
    if (resp.accepted()) {
      ctx_.engine->SaveSnapshot();
    }
    return resp;
  });
}

UpdateWorkerStatusResponse OrchestratorService::UpdateWorkerStatus(const UpdateWorkerStatusRequest& req) {
  return ObserveRpc("OrchestratorService.UpdateWorkerStatus", [&] {
    const auto status = ToModel(req.status());

    UpdateWorkerStatusResponse resp;
    resp.set_accepted(ctx_.registry->UpdateStatus(req.worker_id(), status, req.current_task_ref()));
    if (resp.accepted()) {
      ctx_.engine->SaveSnapshot();
    }
    return resp;
  });
}

ClearWorkersResponse OrchestratorService::ClearWorkers(const ClearWorkersRequest&) {
  return ObserveRpc("OrchestratorService.ClearWorkers", [&] {
    ctx_.registry->ClearAll();
    ctx_.engine->SaveSnapshot();
    return ClearWorkersResponse{};
  });
}

RefreshWorkersResponse OrchestratorService::RefreshWorkers(const RefreshWorkersRequest&) {
  return ObserveRpc("OrchestratorService.RefreshWorkers", [&] {
    if (!ctx_.poller) {
      throw util::Unavailable("worker discovery is disabled");
    }

    const auto stats = ctx_.poller->RefreshNow();

    RefreshWorkersResponse resp;
    resp.set_discovered(static_cast<std::uint32_t>(stats.discovered));
    resp.set_registered(static_cast<std::uint32_t>(stats.registered));
    resp.set_skipped(static_cast<std::uint32_t>(stats.skipped));
    resp.set_busy(static_cast<std::uint32_t>(stats.busy));
    return resp;
  });
}

UpdateTaskStatusResponse OrchestratorService::UpdateTaskStatus(const UpdateTaskStatusRequest& req) {
  return ObserveRpc("OrchestratorService.UpdateTaskStatus", [&] {
    UpdateTaskStatusResponse resp;

    const auto status = static_cast<model::TaskStatus>(req.status());
    if (!model::IsKnown(status)) {
      resp.set_accepted(false);
      return resp;
    }

    resp.set_accepted(ctx_.engine->UpdateTaskStatus(req.task_id(), status, req.result()));
    return resp;
  });
}

TriggerAssignmentResponse OrchestratorService::TriggerAssignment(const TriggerAssignmentRequest&) {
  return ObserveRpc("OrchestratorService.TriggerAssignment", [&] {
    TriggerAssignmentResponse resp;
    resp.set_assigned(static_cast<std::uint32_t>(ctx_.engine->TriggerAssignment()));
    return resp;
  });
}

GetNextTaskResponse OrchestratorService::GetNextTask(const GetNextTaskRequest& req) {
  return ObserveRpc("OrchestratorService.GetNextTask", [&] {
    if (req.worker_id().empty()) {
      throw util::InvalidArgument("worker_id is required");
    }

    GetNextTaskResponse resp;
    if (auto task = ctx_.engine->NextTaskForWorker(req.worker_id())) {
      resp.set_found(true);
      *resp.mutable_task() = ToProto(*task);
    }
    return resp;
  });
}

ListRepositoriesResponse OrchestratorService::ListRepositories(const ListRepositoriesRequest& req) {
  return ObserveRpc("OrchestratorService.ListRepositories", [&] {
    if (req.refresh()) {
      if (!ctx_.poller) {
        throw util::Unavailable("worker discovery is disabled");
      }
      ctx_.poller->RefreshNow();
    }

    ListRepositoriesResponse resp;
    for (const auto& summary : core::GroupByRepository(ctx_.registry->GetAll())) {
      *resp.add_repositories() = ToProto(summary);
    }
    return resp;
  });
}

GetWorkerHistoryResponse OrchestratorService::GetWorkerHistory(const GetWorkerHistoryRequest& req) {
  return ObserveRpc("OrchestratorService.GetWorkerHistory", [&] {
    if (!ctx_.sessions) {
      throw util::Unavailable("worker discovery is disabled");
    }

    auto session_ref = req.session_ref();
    if (session_ref.empty()) {
      if (req.worker_id().empty()) {
        throw util::InvalidArgument("worker_id or session_ref is required");
      }
      auto worker = ctx_.registry->Get(req.worker_id());
      if (!worker) {
        throw util::NotFound("worker not found: " + req.worker_id());
      }
      if (worker->session_ref.empty()) {
        throw util::InvalidState("worker has no session: " + req.worker_id());
      }
      session_ref = worker->session_ref;
    }

    const std::size_t max_entries =
        req.max_entries() == 0 ? discovery::SessionDirectoryProvider::kDefaultHistoryEntries : std::min<std::size_t>(req.max_entries(), kMaxHistoryEntries);

    GetWorkerHistoryResponse resp;
    for (const auto& entry : ctx_.sessions->ReadHistory(session_ref, max_entries)) {
      auto* out = resp.add_entries();
      *out->mutable_timestamp() = util::ToProto(entry.timestamp);
      out->set_type(entry.type);
      out->set_content(entry.content);
    }
    return resp;
  });
}

} // namespace orchestra::service
