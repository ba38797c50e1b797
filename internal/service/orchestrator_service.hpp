#pragma once

#include "orchestra/v1.hpp"
#include "service_context.hpp"

namespace orchestra::service {

/*
  Transport-independent implementation of OrchestratorService.

  Expected failures (unknown ids, rejected transitions) come back as
  accepted=false. Malformed requests throw util::InvalidArgument.
*/
class OrchestratorService {
 public:
  explicit OrchestratorService(ServiceContext ctx);

  orchestra::v1::EnqueueResponse Enqueue(const orchestra::v1::EnqueueRequest& req);

  orchestra::v1::GetSnapshotResponse GetSnapshot(const orchestra::v1::GetSnapshotRequest& req);

  orchestra::v1::RegisterWorkerResponse RegisterWorker(const orchestra::v1::RegisterWorkerRequest& req);

  orchestra::v1::UpdateWorkerStatusResponse UpdateWorkerStatus(const orchestra::v1::UpdateWorkerStatusRequest& req);

  orchestra::v1::ClearWorkersResponse ClearWorkers(const orchestra::v1::ClearWorkersRequest& req);

  orchestra::v1::RefreshWorkersResponse RefreshWorkers(const orchestra::v1::RefreshWorkersRequest& req);

  orchestra::v1::UpdateTaskStatusResponse UpdateTaskStatus(const orchestra::v1::UpdateTaskStatusRequest& req);

  orchestra::v1::TriggerAssignmentResponse TriggerAssignment(const orchestra::v1::TriggerAssignmentRequest& req);

  orchestra::v1::GetNextTaskResponse GetNextTask(const orchestra::v1::GetNextTaskRequest& req);

  orchestra::v1::ListRepositoriesResponse ListRepositories(const orchestra::v1::ListRepositoriesRequest& req);

  orchestra::v1::GetWorkerHistoryResponse GetWorkerHistory(const orchestra::v1::GetWorkerHistoryRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace orchestra::service
