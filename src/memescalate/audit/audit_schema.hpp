/**
 * @file audit_schema.hpp
 * @brief SQLite schema of the audit database.
 */
#pragma once
#include <string_view>

namespace memescalate::schema
{

// Timestamps are the checkpoint's ISO-8601 local time strings.
// Job ids are stored as text, as the scheduler prints them.

inline constexpr std::string_view kAuditSchema = R"SQL(

CREATE TABLE IF NOT EXISTS chains (
    chain_id TEXT PRIMARY KEY,
    mode TEXT NOT NULL,
    partition_name TEXT,
    original_script TEXT NOT NULL,
    script_args TEXT,
    original_array_spec TEXT,
    total_tasks INTEGER,
    max_level INTEGER,
    created_at TEXT NOT NULL,
    updated_at TEXT NOT NULL,
    status TEXT NOT NULL,
    current_level INTEGER DEFAULT 0,
    current_memory TEXT,
    current_time_limit TEXT,
    last_escalation_reason TEXT,
    pending_indices TEXT,
    failed_indices TEXT,
    completed_count INTEGER DEFAULT 0,
    failed_count INTEGER DEFAULT 0,
    escalate_count INTEGER DEFAULT 0,
    revision INTEGER DEFAULT 0
);

CREATE TABLE IF NOT EXISTS rounds (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    chain_id TEXT NOT NULL,
    round_num INTEGER NOT NULL,
    job_id TEXT NOT NULL,
    job_ids TEXT,
    handler_id TEXT,
    array_spec TEXT,
    level INTEGER NOT NULL,
    memory TEXT NOT NULL,
    time TEXT,
    partition_name TEXT,
    status TEXT NOT NULL,
    submitted_at TEXT NOT NULL,
    completed_count INTEGER DEFAULT 0,
    oom_count INTEGER DEFAULT 0,
    timeout_count INTEGER DEFAULT 0,
    failed_count INTEGER DEFAULT 0,
    escalate_indices TEXT,
    UNIQUE (chain_id, round_num),
    FOREIGN KEY (chain_id) REFERENCES chains(chain_id)
);

CREATE TABLE IF NOT EXISTS tasks (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    chain_id TEXT NOT NULL,
    round_id INTEGER,
    job_id TEXT NOT NULL,
    task_id INTEGER NOT NULL,
    status TEXT,
    exit_code INTEGER,
    signal INTEGER,
    max_rss TEXT,
    elapsed TEXT,
    timelimit TEXT,
    node TEXT,
    submit_time TEXT,
    start_time TEXT,
    end_time TEXT,
    UNIQUE (chain_id, job_id, task_id),
    FOREIGN KEY (chain_id) REFERENCES chains(chain_id),
    FOREIGN KEY (round_id) REFERENCES rounds(id)
);

CREATE TABLE IF NOT EXISTS actions (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    timestamp TEXT NOT NULL,
    chain_id TEXT NOT NULL,
    action_type TEXT NOT NULL,
    job_id TEXT,
    memory_level INTEGER,
    time_level INTEGER,
    indices TEXT,
    details TEXT
);

CREATE TABLE IF NOT EXISTS configs (
    chain_id TEXT PRIMARY KEY,
    config_yaml TEXT NOT NULL,
    levels_yaml TEXT,
    FOREIGN KEY (chain_id) REFERENCES chains(chain_id)
);

CREATE INDEX IF NOT EXISTS idx_rounds_chain ON rounds(chain_id);
CREATE INDEX IF NOT EXISTS idx_rounds_job ON rounds(job_id);
CREATE INDEX IF NOT EXISTS idx_tasks_chain ON tasks(chain_id);
CREATE INDEX IF NOT EXISTS idx_tasks_job ON tasks(job_id);
CREATE INDEX IF NOT EXISTS idx_tasks_status ON tasks(status);
CREATE INDEX IF NOT EXISTS idx_actions_chain ON actions(chain_id);

)SQL";

} // namespace memescalate::schema
