#pragma once

#include <exception>

#include <grpcpp/grpcpp.h>

namespace orchestra::grpc {

/*
  Converts internal exceptions into gRPC status codes.
*/

::grpc::Status ToStatus(const std::exception& e);

} // namespace orchestra::grpc
