#include "orchestrator_server.hpp"

#include "grpc_error.hpp"

namespace orchestra::grpc {

OrchestratorServer::OrchestratorServer(std::shared_ptr<orchestra::service::OrchestratorService> svc)
    : service_(std::move(svc)) {}

::grpc::Status OrchestratorServer::Enqueue(::grpc::ServerContext*,
                                           const orchestra::v1::EnqueueRequest* req,
                                           orchestra::v1::EnqueueResponse* resp) {
  try {
    *resp = service_->Enqueue(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status OrchestratorServer::GetSnapshot(::grpc::ServerContext*,
                                               const orchestra::v1::GetSnapshotRequest* req,
                                               orchestra::v1::GetSnapshotResponse* resp) {
  try {
    *resp = service_->GetSnapshot(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status OrchestratorServer::RegisterWorker(::grpc::ServerContext*,
                                                  const orchestra::v1::RegisterWorkerRequest* req,
                                                  orchestra::v1::RegisterWorkerResponse* resp) {
  try {
    *resp = service_->RegisterWorker(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status OrchestratorServer::UpdateWorkerStatus(::grpc::ServerContext*,
                                                      const orchestra::v1::UpdateWorkerStatusRequest* req,
                                                      orchestra::v1::UpdateWorkerStatusResponse* resp) {
  try {
    *resp = service_->UpdateWorkerStatus(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status OrchestratorServer::ClearWorkers(::grpc::ServerContext*,
                                                const orchestra::v1::ClearWorkersRequest* req,
                                                orchestra::v1::ClearWorkersResponse* resp) {
  try {
    *resp = service_->ClearWorkers(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status OrchestratorServer::RefreshWorkers(::grpc::ServerContext*,
                                                  const orchestra::v1::RefreshWorkersRequest* req,
                                                  orchestra::v1::RefreshWorkersResponse* resp) {
  try {
    *resp = service_->RefreshWorkers(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status OrchestratorServer::UpdateTaskStatus(::grpc::ServerContext*,
                                                    const orchestra::v1::UpdateTaskStatusRequest* req,
                                                    orchestra::v1::UpdateTaskStatusResponse* resp) {
  try {
    *resp = service_->UpdateTaskStatus(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status OrchestratorServer::TriggerAssignment(::grpc::ServerContext*,
                                                     const orchestra::v1::TriggerAssignmentRequest* req,
                                                     orchestra::v1::TriggerAssignmentResponse* resp) {
  try {
    *resp = service_->TriggerAssignment(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status OrchestratorServer::GetNextTask(::grpc::ServerContext*,
                                               const orchestra::v1::GetNextTaskRequest* req,
                                               orchestra::v1::GetNextTaskResponse* resp) {
  try {
    *resp = service_->GetNextTask(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status OrchestratorServer::ListRepositories(::grpc::ServerContext*,
                                                    const orchestra::v1::ListRepositoriesRequest* req,
                                                    orchestra::v1::ListRepositoriesResponse* resp) {
  try {
    *resp = service_->ListRepositories(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status OrchestratorServer::GetWorkerHistory(::grpc::ServerContext*,
                                                    const orchestra::v1::GetWorkerHistoryRequest* req,
                                                    orchestra::v1::GetWorkerHistoryResponse* resp) {
  try {
    *resp = service_->GetWorkerHistory(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace orchestra::grpc
