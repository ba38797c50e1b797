#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "internal/db/sql/sql_queries.hpp"

namespace orchestra::db::sqlite {

using orchestra::db::ErrorCode;
using orchestra::db::Result;

namespace {

/*
  Owns one prepared statement for the duration of a call.
*/
class Statement {
public:
    Statement(sqlite3* db, const char* sql) {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
            stmt_ = nullptr;
        }
    }
    ~Statement() {
        if (stmt_) sqlite3_finalize(stmt_);
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    sqlite3_stmt* get() const { return stmt_; }
    explicit operator bool() const { return stmt_ != nullptr; }

private:
    sqlite3_stmt* stmt_ = nullptr;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
    sqlite3_bind_int(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
    return sqlite3_column_int(st, col);
}

model::WorkerRecord ReadWorker(sqlite3_stmt* st) {
    model::WorkerRecord r;
    r.id               = ColText(st, 0);
    r.name             = ColText(st, 1);
    r.kind             = ColText(st, 2);
    r.resource_context = ColText(st, 3);
    r.status           = static_cast<orchestra::model::WorkerStatus>(ColI32(st, 4));
    r.last_activity_ms = ColU64(st, 5);
    r.current_task_ref = ColText(st, 6);
    r.session_ref      = ColText(st, 7);
    return r;
}

model::TaskRecord ReadTask(sqlite3_stmt* st) {
    model::TaskRecord r;
    r.id               = ColText(st, 0);
    r.command          = ColText(st, 1);
    r.resource_context = ColText(st, 2);
    r.priority         = static_cast<orchestra::model::TaskPriority>(ColI32(st, 3));
    r.status           = static_cast<orchestra::model::TaskStatus>(ColI32(st, 4));
    r.worker_id        = ColText(st, 5);
    r.created_at_ms    = ColU64(st, 6);
    r.started_at_ms    = ColU64(st, 7);
    r.completed_at_ms  = ColU64(st, 8);
    r.result           = ColText(st, 9);
    r.sequence         = ColU64(st, 10);
    return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xFF) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Workers
// ------------------------------------------------------------------

Result SqliteRepository::ReplaceWorkers(Transaction& t, const std::vector<model::WorkerRecord>& records) {
    auto& tx = TX(t);
    auto* db = tx.Handle();

    if (int rc = sqlite3_exec(db, sql::DELETE_WORKERS, nullptr, nullptr, nullptr); rc != SQLITE_OK)
        return Translate(db, rc);

    for (const auto& r : records) {
        sqlite3_stmt* st = nullptr;
        try {
            st = tx.Statement(sql::INSERT_WORKER);
        } catch (const std::exception& e) {
            return Result::Err(ErrorCode::InternalError, e.what());
        }

        BindText(st, 1, r.id);
        BindText(st, 2, r.name);
        BindText(st, 3, r.kind);
        BindText(st, 4, r.resource_context);
        BindI32(st, 5, static_cast<int>(r.status));
        BindU64(st, 6, r.last_activity_ms);
        BindText(st, 7, r.current_task_ref);
        BindText(st, 8, r.session_ref);

        int rc = sqlite3_step(st);
        if (rc != SQLITE_DONE) return Translate(db, rc);
    }

    return Result::Ok();
}

std::vector<model::WorkerRecord> SqliteRepository::ListWorkers(Transaction& t) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::SELECT_WORKERS);
    if (!st) throw std::runtime_error(std::string("list workers: ") + sqlite3_errmsg(db));

    std::vector<model::WorkerRecord> records;
    while (sqlite3_step(st.get()) == SQLITE_ROW) {
        records.push_back(ReadWorker(st.get()));
    }
    return records;
}

// ------------------------------------------------------------------
// Tasks
// ------------------------------------------------------------------

Result SqliteRepository::UpsertTask(Transaction& t, const model::TaskRecord& r) {
    auto& tx = TX(t);

    sqlite3_stmt* st = nullptr;
    try {
        st = tx.Statement(sql::UPSERT_TASK);
    } catch (const std::exception& e) {
        return Result::Err(ErrorCode::InternalError, e.what());
    }

    BindText(st, 1, r.id);
    BindText(st, 2, r.command);
    BindText(st, 3, r.resource_context);
    BindI32(st, 4, static_cast<int>(r.priority));
    BindI32(st, 5, static_cast<int>(r.status));
    BindText(st, 6, r.worker_id);
    BindU64(st, 7, r.created_at_ms);
    BindU64(st, 8, r.started_at_ms);
    BindU64(st, 9, r.completed_at_ms);
    BindText(st, 10, r.result);
    BindU64(st, 11, r.sequence);

    return Translate(tx.Handle(), sqlite3_step(st));
}

std::optional<model::TaskRecord> SqliteRepository::GetTask(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::SELECT_TASK);
    if (!st) return std::nullopt;

    BindText(st.get(), 1, id);
    if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;

    return ReadTask(st.get());
}

std::vector<model::TaskRecord> SqliteRepository::ListTasks(Transaction& t) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::SELECT_TASKS);
    if (!st) throw std::runtime_error(std::string("list tasks: ") + sqlite3_errmsg(db));

    std::vector<model::TaskRecord> records;
    while (sqlite3_step(st.get()) == SQLITE_ROW) {
        records.push_back(ReadTask(st.get()));
    }
    return records;
}

} // namespace orchestra::db::sqlite
