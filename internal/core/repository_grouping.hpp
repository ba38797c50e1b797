#pragma once

#include <vector>

#include "internal/model/repository_summary.hpp"
#include "internal/model/worker.hpp"

namespace orchestra::core {

/*
  Groups workers by normalized resource context.

  The first worker (by id) in a group supplies the displayed path; the name
  is its last path component. Output is sorted by name, then path.
*/
std::vector<model::RepositorySummary> GroupByRepository(const std::vector<model::Worker>& workers);

} // namespace orchestra::core
