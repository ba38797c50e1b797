#pragma once

namespace orchestra::db::sql {

/*
  Canonical SQL used by all backends.

  IMPORTANT:
  These are written in SQLite-compatible SQL subset
  so they work in both engines. Postgres binds with $n
  and keeps its own copies in PgPool.
*/

// schema

static constexpr const char* CREATE_WORKERS =
    "CREATE TABLE IF NOT EXISTS workers ("
    " id TEXT PRIMARY KEY,"
    " name TEXT NOT NULL,"
    " kind TEXT NOT NULL,"
    " resource_context TEXT NOT NULL,"
    " status INTEGER NOT NULL,"
    " last_activity_ms BIGINT NOT NULL,"
    " current_task_ref TEXT NOT NULL,"
    " session_ref TEXT NOT NULL);";

static constexpr const char* CREATE_TASKS =
    "CREATE TABLE IF NOT EXISTS tasks ("
    " id TEXT PRIMARY KEY,"
    " command TEXT NOT NULL,"
    " resource_context TEXT NOT NULL,"
    " priority INTEGER NOT NULL,"
    " status INTEGER NOT NULL,"
    " worker_id TEXT NOT NULL,"
    " created_at_ms BIGINT NOT NULL,"
    " started_at_ms BIGINT NOT NULL,"
    " completed_at_ms BIGINT NOT NULL,"
    " result TEXT NOT NULL,"
    " sequence BIGINT NOT NULL);";

static constexpr const char* CREATE_TASKS_SEQUENCE_INDEX =
    "CREATE INDEX IF NOT EXISTS tasks_sequence_idx ON tasks(sequence);";

// workers

static constexpr const char* DELETE_WORKERS =
    "DELETE FROM workers;";

static constexpr const char* INSERT_WORKER =
    "INSERT INTO workers(id,name,kind,resource_context,status,last_activity_ms,current_task_ref,session_ref)"
    " VALUES(?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_WORKERS =
    "SELECT id,name,kind,resource_context,status,last_activity_ms,current_task_ref,session_ref"
    " FROM workers ORDER BY id;";

// tasks

static constexpr const char* UPSERT_TASK =
    "INSERT INTO tasks(id,command,resource_context,priority,status,worker_id,"
    "created_at_ms,started_at_ms,completed_at_ms,result,sequence)"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?)"
    " ON CONFLICT(id) DO UPDATE SET"
    " command=excluded.command,"
    " resource_context=excluded.resource_context,"
    " priority=excluded.priority,"
    " status=excluded.status,"
    " worker_id=excluded.worker_id,"
    " created_at_ms=excluded.created_at_ms,"
    " started_at_ms=excluded.started_at_ms,"
    " completed_at_ms=excluded.completed_at_ms,"
    " result=excluded.result,"
    " sequence=excluded.sequence;";

static constexpr const char* SELECT_TASK =
    "SELECT id,command,resource_context,priority,status,worker_id,"
    "created_at_ms,started_at_ms,completed_at_ms,result,sequence"
    " FROM tasks WHERE id=?;";

static constexpr const char* SELECT_TASKS =
    "SELECT id,command,resource_context,priority,status,worker_id,"
    "created_at_ms,started_at_ms,completed_at_ms,result,sequence"
    " FROM tasks ORDER BY sequence;";

}
