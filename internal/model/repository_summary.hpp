#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace orchestra::model {

// Workers sharing one resource context.
struct RepositorySummary {
  std::string              name;
  std::string              path;
  std::vector<std::string> worker_ids;

  std::uint32_t idle_count    = 0;
  std::uint32_t busy_count    = 0;
  std::uint32_t error_count   = 0;
  std::uint32_t offline_count = 0;
};

} // namespace orchestra::model
