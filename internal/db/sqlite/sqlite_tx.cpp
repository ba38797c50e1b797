#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace orchestra::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  FinalizeStatements();
  if (!done_) {
    try {
      db_->Exec("ROLLBACK;");
    } catch (const std::exception& e) {
      ORCHESTRA_LOG_WARN("sqlite rollback failed", {observability::StringField("error", e.what())});
    }
  }
}

sqlite3_stmt* SqliteTransaction::Statement(const char* sql) {
  auto it = statements_.find(sql);
  if (it == statements_.end()) {
    it = statements_.emplace(sql, db_->Prepare(sql)).first;
    return it->second;
  }

  sqlite3_reset(it->second);
  sqlite3_clear_bindings(it->second);
  return it->second;
}

void SqliteTransaction::FinalizeStatements() {
  for (auto& [_, stmt] : statements_) {
    sqlite3_finalize(stmt);
  }
  statements_.clear();
}

void SqliteTransaction::Commit() {
  FinalizeStatements();
  db_->Exec("COMMIT;");
  done_ = true;
}

void SqliteTransaction::Rollback() {
  FinalizeStatements();
  db_->Exec("ROLLBACK;");
  done_ = true;
}

} // namespace orchestra::db::sqlite
