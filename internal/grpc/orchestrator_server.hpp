#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/service/orchestrator_service.hpp"
#include "orchestra/v1.hpp"

namespace orchestra::grpc {

class OrchestratorServer final : public orchestra::v1::OrchestratorService::Service {
 public:
  explicit OrchestratorServer(std::shared_ptr<orchestra::service::OrchestratorService> svc);

  ::grpc::Status Enqueue(::grpc::ServerContext*,
                         const orchestra::v1::EnqueueRequest*,
                         orchestra::v1::EnqueueResponse*) override;

  ::grpc::Status GetSnapshot(::grpc::ServerContext*,
                             const orchestra::v1::GetSnapshotRequest*,
                             orchestra::v1::GetSnapshotResponse*) override;

  ::grpc::Status RegisterWorker(::grpc::ServerContext*,
                                const orchestra::v1::RegisterWorkerRequest*,
                                orchestra::v1::RegisterWorkerResponse*) override;

  ::grpc::Status UpdateWorkerStatus(::grpc::ServerContext*,
                                    const orchestra::v1::UpdateWorkerStatusRequest*,
                                    orchestra::v1::UpdateWorkerStatusResponse*) override;

  ::grpc::Status ClearWorkers(::grpc::ServerContext*,
                              const orchestra::v1::ClearWorkersRequest*,
                              orchestra::v1::ClearWorkersResponse*) override;

  ::grpc::Status RefreshWorkers(::grpc::ServerContext*,
                                const orchestra::v1::RefreshWorkersRequest*,
                                orchestra::v1::RefreshWorkersResponse*) override;

  ::grpc::Status UpdateTaskStatus(::grpc::ServerContext*,
                                  const orchestra::v1::UpdateTaskStatusRequest*,
                                  orchestra::v1::UpdateTaskStatusResponse*) override;

  ::grpc::Status TriggerAssignment(::grpc::ServerContext*,
                                   const orchestra::v1::TriggerAssignmentRequest*,
                                   orchestra::v1::TriggerAssignmentResponse*) override;

  ::grpc::Status GetNextTask(::grpc::ServerContext*,
                             const orchestra::v1::GetNextTaskRequest*,
                             orchestra::v1::GetNextTaskResponse*) override;

  ::grpc::Status ListRepositories(::grpc::ServerContext*,
                                  const orchestra::v1::ListRepositoriesRequest*,
                                  orchestra::v1::ListRepositoriesResponse*) override;

  ::grpc::Status GetWorkerHistory(::grpc::ServerContext*,
                                  const orchestra::v1::GetWorkerHistoryRequest*,
                                  orchestra::v1::GetWorkerHistoryResponse*) override;

 private:
  std::shared_ptr<orchestra::service::OrchestratorService> service_;
};

} // namespace orchestra::grpc
