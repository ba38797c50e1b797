#pragma once

#include <memory>
#include <string>
#include <unordered_map>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace orchestra::db::sqlite {

/*
  BEGIN IMMEDIATE transaction with a per-transaction statement cache.

  A snapshot save upserts many rows through the same SQL; Statement()
  prepares each text once and hands back the reset handle on later calls.
*/
class SqliteTransaction final : public db::Transaction {
 public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  SqliteTransaction(const SqliteTransaction&)            = delete;
  SqliteTransaction& operator=(const SqliteTransaction&) = delete;

  sqlite3* Handle() const {
    return db_->Handle();
  }

  // Reset, unbound statement owned by this transaction. Throws on prepare failure.
  sqlite3_stmt* Statement(const char* sql);

  void Commit() override;
  void Rollback() override;

 private:
  void FinalizeStatements();

  std::shared_ptr<SqliteDB>                      db_;
  std::unordered_map<std::string, sqlite3_stmt*> statements_;
  bool                                           done_ = false;
};

} // namespace orchestra::db::sqlite
