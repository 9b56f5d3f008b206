#pragma once

#include <array>

namespace beacon::db::sql {

/*
  Bootstrap schema, applied with CREATE ... IF NOT EXISTS on startup.

  Invariants carried by the schema rather than by code:
    heartbeats: UNIQUE(server_id, heartbeat_id) and UNIQUE(heartbeat_id)
    heartbeat_jobs: one pending row per server (partial unique index)
*/

inline constexpr std::array<const char*, 8> kSqliteSchema = {
    "CREATE TABLE IF NOT EXISTS clusters ("
    " id TEXT PRIMARY KEY,"
    " public_key_ed25519 TEXT,"
    " key_version INTEGER NOT NULL DEFAULT 1,"
    " heartbeat_grace_seconds INTEGER);",

    "CREATE TABLE IF NOT EXISTS servers ("
    " id TEXT PRIMARY KEY,"
    " cluster_id TEXT NOT NULL REFERENCES clusters(id),"
    " effective_status TEXT NOT NULL DEFAULT 'unknown' CHECK (effective_status IN ('online','offline','unknown')),"
    " confidence TEXT NOT NULL DEFAULT 'red' CHECK (confidence IN ('green','yellow','red')),"
    " uptime_percent REAL,"
    " quality_score REAL,"
    " anomaly_players_spike INTEGER NOT NULL DEFAULT 0,"
    " anomaly_last_detected_at_ms INTEGER,"
    " players_current INTEGER,"
    " players_capacity INTEGER,"
    " last_heartbeat_at_ms INTEGER,"
    " last_seen_at_ms INTEGER,"
    " status_source TEXT NOT NULL DEFAULT '',"
    " updated_at_ms INTEGER NOT NULL DEFAULT 0);",

    "CREATE TABLE IF NOT EXISTS heartbeats ("
    " id TEXT PRIMARY KEY,"
    " server_id TEXT NOT NULL REFERENCES servers(id),"
    " heartbeat_id TEXT NOT NULL,"
    " key_version INTEGER NOT NULL,"
    " agent_timestamp_ms INTEGER NOT NULL,"
    " received_at_ms INTEGER NOT NULL,"
    " status TEXT NOT NULL CHECK (status IN ('online','offline')),"
    " map_name TEXT,"
    " players_current INTEGER,"
    " players_capacity INTEGER,"
    " agent_version TEXT,"
    " signature TEXT NOT NULL,"
    " debug_payload TEXT,"
    " UNIQUE(server_id, heartbeat_id),"
    " UNIQUE(heartbeat_id));",

    "CREATE INDEX IF NOT EXISTS heartbeats_server_received_idx ON heartbeats(server_id, received_at_ms DESC);",

    "CREATE TABLE IF NOT EXISTS heartbeat_jobs ("
    " id INTEGER PRIMARY KEY AUTOINCREMENT,"
    " server_id TEXT NOT NULL REFERENCES servers(id),"
    " enqueued_at_ms INTEGER NOT NULL,"
    " claimed_at_ms INTEGER,"
    " processed_at_ms INTEGER,"
    " attempts INTEGER NOT NULL DEFAULT 0,"
    " last_error TEXT);",

    "CREATE UNIQUE INDEX IF NOT EXISTS heartbeat_jobs_one_pending_idx ON heartbeat_jobs(server_id) WHERE processed_at_ms IS NULL;",

    "CREATE INDEX IF NOT EXISTS heartbeat_jobs_pending_idx ON heartbeat_jobs(enqueued_at_ms) WHERE processed_at_ms IS NULL;",

    "CREATE TABLE IF NOT EXISTS ingest_rejections ("
    " id TEXT PRIMARY KEY,"
    " received_at_ms INTEGER NOT NULL,"
    " server_id TEXT,"
    " rejection_reason TEXT NOT NULL,"
    " agent_version TEXT,"
    " metadata TEXT NOT NULL DEFAULT '{}',"
    " event_type TEXT NOT NULL DEFAULT 'server.heartbeat.v1');",
};

inline constexpr std::array<const char*, 8> kPostgresSchema = {
    "CREATE TABLE IF NOT EXISTS clusters ("
    " id TEXT PRIMARY KEY,"
    " public_key_ed25519 TEXT,"
    " key_version BIGINT NOT NULL DEFAULT 1,"
    " heartbeat_grace_seconds BIGINT);",

    "CREATE TABLE IF NOT EXISTS servers ("
    " id TEXT PRIMARY KEY,"
    " cluster_id TEXT NOT NULL REFERENCES clusters(id),"
    " effective_status TEXT NOT NULL DEFAULT 'unknown' CHECK (effective_status IN ('online','offline','unknown')),"
    " confidence TEXT NOT NULL DEFAULT 'red' CHECK (confidence IN ('green','yellow','red')),"
    " uptime_percent DOUBLE PRECISION,"
    " quality_score DOUBLE PRECISION,"
    " anomaly_players_spike BOOLEAN NOT NULL DEFAULT FALSE,"
    " anomaly_last_detected_at_ms BIGINT,"
    " players_current BIGINT,"
    " players_capacity BIGINT,"
    " last_heartbeat_at_ms BIGINT,"
    " last_seen_at_ms BIGINT,"
    " status_source TEXT NOT NULL DEFAULT '',"
    " updated_at_ms BIGINT NOT NULL DEFAULT 0);",

    "CREATE TABLE IF NOT EXISTS heartbeats ("
    " id TEXT PRIMARY KEY,"
    " server_id TEXT NOT NULL REFERENCES servers(id),"
    " heartbeat_id TEXT NOT NULL,"
    " key_version BIGINT NOT NULL,"
    " agent_timestamp_ms BIGINT NOT NULL,"
    " received_at_ms BIGINT NOT NULL,"
    " status TEXT NOT NULL CHECK (status IN ('online','offline')),"
    " map_name TEXT,"
    " players_current BIGINT,"
    " players_capacity BIGINT,"
    " agent_version TEXT,"
    " signature TEXT NOT NULL,"
    " debug_payload TEXT,"
    // insertion order; breaks received_at_ms ties in ListRecentHeartbeats
    " seq BIGSERIAL NOT NULL,"
    " UNIQUE(server_id, heartbeat_id),"
    " UNIQUE(heartbeat_id));",

    "CREATE INDEX IF NOT EXISTS heartbeats_server_received_idx ON heartbeats(server_id, received_at_ms DESC);",

    "CREATE TABLE IF NOT EXISTS heartbeat_jobs ("
    " id BIGSERIAL PRIMARY KEY,"
    " server_id TEXT NOT NULL REFERENCES servers(id),"
    " enqueued_at_ms BIGINT NOT NULL,"
    " claimed_at_ms BIGINT,"
    " processed_at_ms BIGINT,"
    " attempts INTEGER NOT NULL DEFAULT 0,"
    " last_error TEXT);",

    "CREATE UNIQUE INDEX IF NOT EXISTS heartbeat_jobs_one_pending_idx ON heartbeat_jobs(server_id) WHERE processed_at_ms IS NULL;",

    "CREATE INDEX IF NOT EXISTS heartbeat_jobs_pending_idx ON heartbeat_jobs(enqueued_at_ms) WHERE processed_at_ms IS NULL;",

    "CREATE TABLE IF NOT EXISTS ingest_rejections ("
    " id TEXT PRIMARY KEY,"
    " received_at_ms BIGINT NOT NULL,"
    " server_id TEXT,"
    " rejection_reason TEXT NOT NULL,"
    " agent_version TEXT,"
    " metadata JSONB NOT NULL DEFAULT '{}'::jsonb,"
    " event_type TEXT NOT NULL DEFAULT 'server.heartbeat.v1');",
};

} // namespace beacon::db::sql
