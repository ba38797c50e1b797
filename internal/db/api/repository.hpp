#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/task_record.hpp"
#include "internal/db/model/worker_record.hpp"

namespace orchestra::db {

/*
  Repository abstraction.

  - All writes require a Transaction
  - Reads inside a transaction see its writes

  The in-memory engine is the source of truth while the process runs;
  the repository holds the last saved snapshot for crash recovery.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Workers (always written as a full set)
  // ---------------------------------------------------------------------

  virtual Result ReplaceWorkers(Transaction&, const std::vector<model::WorkerRecord>&) = 0;

  virtual std::vector<model::WorkerRecord> ListWorkers(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Tasks
  // ---------------------------------------------------------------------

  virtual Result UpsertTask(Transaction&, const model::TaskRecord&) = 0;

  virtual std::optional<model::TaskRecord> GetTask(Transaction&, const std::string& id) = 0;

  // Ordered by sequence.
  virtual std::vector<model::TaskRecord> ListTasks(Transaction&) = 0;
};

} // namespace orchestra::db
