#pragma once

#include <map>
#include <optional>
#include <string>
#include <unordered_map>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace orchestra::db::memory {

/*
  Write set over the committed state.

  Only the rows a save touches are held here; Commit folds them into the
  repository under its mutex. Reads overlay the write set on the
  committed rows.
*/
class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);

  void Commit() override;
  void Rollback() override;

 private:
  friend class MemoryRepository;

  MemoryRepository& repo_;

  std::optional<std::map<std::string, model::WorkerRecord>> workers_;  // set by ReplaceWorkers
  std::unordered_map<std::string, model::TaskRecord>         tasks_;
  bool                                                       done_ = false;
};

} // namespace orchestra::db::memory
