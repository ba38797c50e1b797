#include "repository_grouping.hpp"

#include <algorithm>
#include <map>

#include "internal/util/path_utils.hpp"

namespace orchestra::core {

std::vector<model::RepositorySummary> GroupByRepository(const std::vector<model::Worker>& workers) {
  std::vector<const model::Worker*> ordered;
  ordered.reserve(workers.size());
  for (const auto& worker : workers) {
    ordered.push_back(&worker);
  }
  std::sort(ordered.begin(), ordered.end(), [](const model::Worker* a, const model::Worker* b) { return a->id < b->id; });

  std::map<std::string, model::RepositorySummary> groups;
  for (const auto* worker : ordered) {
    auto [it, inserted] = groups.try_emplace(util::NormalizeResourceContext(worker->resource_context));
    auto& summary       = it->second;
    if (inserted) {
      summary.path = worker->resource_context;
      summary.name = util::ContextBaseName(worker->resource_context);
    }
    summary.worker_ids.push_back(worker->id);

    switch (worker->status) {
      case model::WorkerStatus::kIdle:
        ++summary.idle_count;
        break;
      case model::WorkerStatus::kBusy:
        ++summary.busy_count;
        break;
      case model::WorkerStatus::kError:
        ++summary.error_count;
        break;
      case model::WorkerStatus::kOffline:
        ++summary.offline_count;
        break;
    }
  }

  std::vector<model::RepositorySummary> out;
  out.reserve(groups.size());
  for (auto& [_, summary] : groups) {
    out.push_back(std::move(summary));
  }
  std::sort(out.begin(), out.end(), [](const model::RepositorySummary& a, const model::RepositorySummary& b) {
    if (a.name != b.name) return a.name < b.name;
    return a.path < b.path;
  });
  return out;
}

} // namespace orchestra::core
