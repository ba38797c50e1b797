#pragma once

#include "orchestra/core/v1/types.pb.h"

#include "orchestra/services/v1/orchestrator_service.pb.h"
#include "orchestra/services/v1/orchestrator_service.grpc.pb.h"

namespace orchestra::v1 {
using namespace ::orchestra::core::v1;
using namespace ::orchestra::services::v1;
}
