#include "internal/core/repository_grouping.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

namespace {

using orchestra::core::GroupByRepository;
using orchestra::model::Worker;
using orchestra::model::WorkerStatus;

Worker MakeWorker(const std::string& id, const std::string& context, WorkerStatus status) {
  Worker worker;
  worker.id               = id;
  worker.resource_context = context;
  worker.status           = status;
  return worker;
}

void TestGroupsByNormalizedContext() {
  auto repos = GroupByRepository({
      MakeWorker("w3", "c:/Work/Zeta/", WorkerStatus::kOffline),
      MakeWorker("w1", "C:\\Work\\Zeta", WorkerStatus::kIdle),
      MakeWorker("w2", "/src/alpha", WorkerStatus::kBusy),
      MakeWorker("w4", "C:/work/zeta", WorkerStatus::kError),
  });

  assert(repos.size() == 2);

  // Byte order: upper case sorts first.
  assert(repos[0].name == "Zeta");
  assert(repos[0].path == "C:\\Work\\Zeta");
  assert((repos[0].worker_ids == std::vector<std::string>{"w1", "w3", "w4"}));
  assert(repos[0].idle_count == 1);
  assert(repos[0].busy_count == 0);
  assert(repos[0].error_count == 1);
  assert(repos[0].offline_count == 1);

  assert(repos[1].name == "alpha");
  assert(repos[1].path == "/src/alpha");
  assert(repos[1].busy_count == 1);
}

void TestEmptyInput() {
  assert(GroupByRepository({}).empty());
}

} // namespace

int main() {
  TestGroupsByNormalizedContext();
  TestEmptyInput();

  std::cout << "orchestra_unit_repository_grouping: pass\n";
  return 0;
}
