#pragma once

#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace orchestra::db::memory {

class MemoryTransaction;

// Process-local repository. Backs tests and the default `database.memory` config.
class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result                           ReplaceWorkers(Transaction&, const std::vector<model::WorkerRecord>&) override;
  std::vector<model::WorkerRecord> ListWorkers(Transaction&) override;

  Result                           UpsertTask(Transaction&, const model::TaskRecord&) override;
  std::optional<model::TaskRecord> GetTask(Transaction&, const std::string&) override;
  std::vector<model::TaskRecord>   ListTasks(Transaction&) override;

 private:
  friend class MemoryTransaction;

  std::mutex                                         mutex_;
  std::map<std::string, model::WorkerRecord>         workers_;
  std::unordered_map<std::string, model::TaskRecord> tasks_;
};

} // namespace orchestra::db::memory
