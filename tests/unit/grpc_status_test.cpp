#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "internal/core/assignment_engine.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/orchestrator_server.hpp"
#include "internal/registry/worker_registry.hpp"
#include "internal/service/orchestrator_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/errors.hpp"
#include "orchestra/v1.hpp"

namespace {

orchestra::service::ServiceContext BuildServiceContext() {
  orchestra::service::ServiceContext ctx;
  ctx.registry = std::make_shared<orchestra::registry::WorkerRegistry>();
  ctx.engine   = std::make_shared<orchestra::core::AssignmentEngine>(ctx.registry);
  return ctx;
}

void TestExceptionMapping() {
  using orchestra::grpc::ToStatus;

  assert(ToStatus(orchestra::util::NotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(orchestra::util::AlreadyExists("x")).error_code() == ::grpc::StatusCode::ALREADY_EXISTS);
  assert(ToStatus(orchestra::util::InvalidState("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(orchestra::util::InvalidArgument("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(orchestra::util::Unavailable("x")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(std::runtime_error("boom")).error_code() == ::grpc::StatusCode::INTERNAL);
  assert(ToStatus(std::runtime_error("boom")).error_message() == "boom");
}

void TestUnknownPriorityReturnsInvalidArgument() {
  auto ctx = BuildServiceContext();
  orchestra::grpc::OrchestratorServer server(std::make_shared<orchestra::service::OrchestratorService>(ctx));

  orchestra::v1::EnqueueRequest req;
  req.set_command("build");
  req.set_priority(static_cast<orchestra::v1::TaskPriority>(99));
  orchestra::v1::EnqueueResponse resp;
  ::grpc::ServerContext          grpc_ctx;

  const auto status = server.Enqueue(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ctx.engine->GetSnapshot().tasks.empty());
}

void TestRefreshWithoutDiscoveryReturnsUnavailable() {
  auto ctx = BuildServiceContext();
  orchestra::grpc::OrchestratorServer server(std::make_shared<orchestra::service::OrchestratorService>(ctx));

  orchestra::v1::RefreshWorkersRequest  req;
  orchestra::v1::RefreshWorkersResponse resp;
  ::grpc::ServerContext                 grpc_ctx;

  const auto status = server.RefreshWorkers(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::UNAVAILABLE);
}

void TestRejectedUpdateIsOkWithAcceptedFalse() {
  auto ctx = BuildServiceContext();
  orchestra::grpc::OrchestratorServer server(std::make_shared<orchestra::service::OrchestratorService>(ctx));

  orchestra::v1::UpdateTaskStatusRequest req;
  req.set_task_id("missing-task");
  req.set_status(orchestra::v1::TASK_STATUS_COMPLETED);
  orchestra::v1::UpdateTaskStatusResponse resp;
  ::grpc::ServerContext                   grpc_ctx;

  const auto status = server.UpdateTaskStatus(&grpc_ctx, &req, &resp);
  assert(status.ok());
  assert(!resp.accepted());
}

} // namespace

int main() {
  TestExceptionMapping();
  TestUnknownPriorityReturnsInvalidArgument();
  TestRefreshWithoutDiscoveryReturnsUnavailable();
  TestRejectedUpdateIsOkWithAcceptedFalse();

  std::cout << "orchestra_unit_grpc_status: pass\n";
  return 0;
}
