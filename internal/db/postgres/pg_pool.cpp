#include "pg_pool.hpp"

namespace orchestra::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);

      if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        return Wrap(conn.release());
      }

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        lock.unlock();

        try {
          auto conn = std::make_unique<pqxx::connection>(conninfo_);
          PrepareStatements(*conn);
          return Wrap(conn.release());
        } catch (const std::exception&) {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
          cv_.notify_one();
          throw;
        }
      }

      cv_.wait(lock, [this] {
        return !idle_.empty() || live_connections_ < max_connections_;
      });
    }
  }
}

void PgPool::BootstrapSchema() {
  auto       conn = Acquire();
  pqxx::work tx(*conn);

  tx.exec("CREATE TABLE IF NOT EXISTS workers (id TEXT PRIMARY KEY, name TEXT NOT NULL, kind TEXT NOT NULL, resource_context TEXT NOT NULL, status SMALLINT NOT NULL, last_activity_ms BIGINT NOT NULL, current_task_ref TEXT NOT NULL, session_ref TEXT NOT NULL);");
  tx.exec("CREATE TABLE IF NOT EXISTS tasks (id TEXT PRIMARY KEY, command TEXT NOT NULL, resource_context TEXT NOT NULL, priority SMALLINT NOT NULL, status SMALLINT NOT NULL, worker_id TEXT NOT NULL, created_at_ms BIGINT NOT NULL, started_at_ms BIGINT NOT NULL, completed_at_ms BIGINT NOT NULL, result TEXT NOT NULL, sequence BIGINT NOT NULL);");
  tx.exec("CREATE INDEX IF NOT EXISTS tasks_sequence_idx ON tasks(sequence);");
  tx.commit();
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("delete_workers", "DELETE FROM workers");

  conn.prepare("insert_worker",
               "INSERT INTO workers(id,name,kind,resource_context,status,last_activity_ms,current_task_ref,session_ref) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8)");

  conn.prepare("list_workers",
               "SELECT id,name,kind,resource_context,status,last_activity_ms,current_task_ref,session_ref "
               "FROM workers ORDER BY id");

  conn.prepare("upsert_task",
               "INSERT INTO tasks(id,command,resource_context,priority,status,worker_id,created_at_ms,started_at_ms,completed_at_ms,result,sequence) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11) "
               "ON CONFLICT(id) DO UPDATE SET command=EXCLUDED.command, resource_context=EXCLUDED.resource_context, "
               "priority=EXCLUDED.priority, status=EXCLUDED.status, worker_id=EXCLUDED.worker_id, "
               "created_at_ms=EXCLUDED.created_at_ms, started_at_ms=EXCLUDED.started_at_ms, "
               "completed_at_ms=EXCLUDED.completed_at_ms, result=EXCLUDED.result, sequence=EXCLUDED.sequence");

  conn.prepare("get_task",
               "SELECT id,command,resource_context,priority,status,worker_id,created_at_ms,started_at_ms,completed_at_ms,result,sequence "
               "FROM tasks WHERE id=$1");

  conn.prepare("list_tasks",
               "SELECT id,command,resource_context,priority,status,worker_id,created_at_ms,started_at_ms,completed_at_ms,result,sequence "
               "FROM tasks ORDER BY sequence");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace orchestra::db::postgres
