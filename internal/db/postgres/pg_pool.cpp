#include "pg_pool.hpp"

namespace beacon::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
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

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("get_key_material",
               "SELECT s.id, c.id, c.public_key_ed25519, c.key_version, c.heartbeat_grace_seconds "
               "FROM servers s JOIN clusters c ON c.id = s.cluster_id WHERE s.id = $1");

  conn.prepare("insert_heartbeat",
               "INSERT INTO heartbeats(id,server_id,heartbeat_id,key_version,agent_timestamp_ms,received_at_ms,status,"
               "map_name,players_current,players_capacity,agent_version,signature,debug_payload) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13) ON CONFLICT DO NOTHING RETURNING id");

  conn.prepare("heartbeat_owner", "SELECT server_id FROM heartbeats WHERE heartbeat_id = $1");

  conn.prepare("apply_fast_path",
               "UPDATE servers SET last_seen_at_ms = $2, players_current = COALESCE($3, players_current), "
               "players_capacity = COALESCE($4, players_capacity), status_source = $5 WHERE id = $1");

  conn.prepare("upsert_pending_job",
               "INSERT INTO heartbeat_jobs(server_id, enqueued_at_ms, attempts) VALUES($1, $2, 0) "
               "ON CONFLICT (server_id) WHERE processed_at_ms IS NULL DO UPDATE SET enqueued_at_ms = GREATEST(EXCLUDED.enqueued_at_ms, heartbeat_jobs.enqueued_at_ms + 1)");
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
    if (!conn->is_open()) {
      // broken connections are dropped instead of recycled
      --live_connections_;
      delete conn;
      cv_.notify_one();
      return;
    }
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace beacon::db::postgres
