#pragma once

#include <vector>

#include "internal/discovery/worker_descriptor.hpp"

namespace orchestra::discovery {

/*
  Source of worker descriptors.

  DiscoverAll may block on I/O. Implementations skip descriptors they fail
  to read instead of failing the batch; a thrown exception means the whole
  source was unreachable.
*/
class DiscoveryProvider {
 public:
  virtual ~DiscoveryProvider() = default;

  virtual std::vector<WorkerDescriptor> DiscoverAll() = 0;
};

} // namespace orchestra::discovery
