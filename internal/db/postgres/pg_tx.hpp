#pragma once

#include <memory>
#include <pqxx/pqxx>

#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace orchestra::db::postgres {

// Holds a pooled connection for the lifetime of one pqxx::work.
class PgTransaction final : public db::Transaction {
 public:
  explicit PgTransaction(std::shared_ptr<PgPool> pool);
  ~PgTransaction();

  pqxx::work& Work() {
    return *work_;
  }

  void Commit() override;
  void Rollback() override;

 private:
  // Declared before work_ so the connection outlives it.
  std::shared_ptr<pqxx::connection> conn_;
  std::unique_ptr<pqxx::work>       work_;
  bool                              done_ = false;
};

} // namespace orchestra::db::postgres
