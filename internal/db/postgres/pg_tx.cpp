#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"

namespace orchestra::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool) : conn_(pool->Acquire()), work_(std::make_unique<pqxx::work>(*conn_)) {
}

PgTransaction::~PgTransaction() {
  if (done_) {
    return;
  }
  try {
    work_->abort();
  } catch (const std::exception& e) {
    ORCHESTRA_LOG_WARN("postgres rollback failed", {observability::StringField("error", e.what())});
  }
}

void PgTransaction::Commit() {
  work_->commit();
  done_ = true;
}

void PgTransaction::Rollback() {
  work_->abort();
  done_ = true;
}

} // namespace orchestra::db::postgres
