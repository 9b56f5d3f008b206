#include "pg_repository.hpp"

#include <algorithm>

#include "internal/db/sql/schema.hpp"

namespace beacon::db::postgres {

namespace {

std::optional<std::string> OptText(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return std::string(f.c_str());
}

std::optional<std::int64_t> OptI64(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return f.as<std::int64_t>();
}

std::optional<uint64_t> OptU64(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return static_cast<uint64_t>(f.as<std::int64_t>());
}

std::optional<double> OptDouble(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return f.as<double>();
}

std::optional<std::int64_t> ToParam(const std::optional<uint64_t>& v) {
  if (!v) return std::nullopt;
  return static_cast<std::int64_t>(*v);
}

std::int64_t ToParam(uint64_t v) {
  return static_cast<std::int64_t>(v);
}

constexpr const char* kServerColumns =
    "id,cluster_id,effective_status,confidence,uptime_percent,quality_score,anomaly_players_spike,anomaly_last_detected_at_ms,"
    "players_current,players_capacity,last_heartbeat_at_ms,last_seen_at_ms,status_source,updated_at_ms";

model::ServerRecord ReadServer(const pqxx::row& row) {
  model::ServerRecord r;
  r.id                          = row[0].c_str();
  r.cluster_id                  = row[1].c_str();
  r.effective_status            = beacon::model::ParseEffectiveStatus(row[2].c_str()).value_or(beacon::model::EffectiveStatus::kUnknown);
  r.confidence                  = beacon::model::ParseConfidence(row[3].c_str()).value_or(beacon::model::Confidence::kRed);
  r.uptime_percent              = OptDouble(row[4]);
  r.quality_score               = OptDouble(row[5]);
  r.anomaly_players_spike       = row[6].as<bool>();
  r.anomaly_last_detected_at_ms = OptU64(row[7]);
  r.players_current             = OptI64(row[8]);
  r.players_capacity            = OptI64(row[9]);
  r.last_heartbeat_at_ms        = OptU64(row[10]);
  r.last_seen_at_ms             = OptU64(row[11]);
  r.status_source               = row[12].c_str();
  r.updated_at_ms               = static_cast<uint64_t>(row[13].as<std::int64_t>());
  return r;
}

constexpr const char* kHeartbeatColumns =
    "id,server_id,heartbeat_id,key_version,agent_timestamp_ms,received_at_ms,status,map_name,players_current,players_capacity,"
    "agent_version,signature,debug_payload";

model::HeartbeatRecord ReadHeartbeat(const pqxx::row& row) {
  model::HeartbeatRecord r;
  r.id                 = row[0].c_str();
  r.server_id          = row[1].c_str();
  r.heartbeat_id       = row[2].c_str();
  r.key_version        = row[3].as<std::int64_t>();
  r.agent_timestamp_ms = static_cast<uint64_t>(row[4].as<std::int64_t>());
  r.received_at_ms     = static_cast<uint64_t>(row[5].as<std::int64_t>());
  r.status             = beacon::model::ParseHeartbeatStatus(row[6].c_str()).value_or(beacon::model::HeartbeatStatus::kOffline);
  r.map_name           = OptText(row[7]);
  r.players_current    = OptI64(row[8]);
  r.players_capacity   = OptI64(row[9]);
  r.agent_version      = OptText(row[10]);
  r.signature          = row[11].c_str();
  r.debug_payload      = OptText(row[12]);
  return r;
}

constexpr const char* kJobColumns = "id,server_id,enqueued_at_ms,claimed_at_ms,processed_at_ms,attempts,last_error";

model::JobRecord ReadJob(const pqxx::row& row) {
  model::JobRecord r;
  r.id              = static_cast<uint64_t>(row[0].as<std::int64_t>());
  r.server_id       = row[1].c_str();
  r.enqueued_at_ms  = static_cast<uint64_t>(row[2].as<std::int64_t>());
  r.claimed_at_ms   = OptU64(row[3]);
  r.processed_at_ms = OptU64(row[4]);
  r.attempts        = static_cast<uint32_t>(row[5].as<int>());
  r.last_error      = OptText(row[6]);
  return r;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

void PgRepository::Bootstrap(PgPool& pool) {
  auto       conn = pool.Acquire();
  pqxx::work tx(*conn);
  for (const char* sql : sql::kPostgresSchema) {
    tx.exec(sql);
  }
  tx.commit();
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e) || dynamic_cast<const pqxx::deadlock_detected*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Registry
// ------------------------------------------------------------------

Result PgRepository::UpsertCluster(Transaction& t, const model::ClusterRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO clusters(id,public_key_ed25519,key_version,heartbeat_grace_seconds) VALUES($1,$2,$3,$4) "
        "ON CONFLICT(id) DO UPDATE SET public_key_ed25519=EXCLUDED.public_key_ed25519, key_version=EXCLUDED.key_version, "
        "heartbeat_grace_seconds=EXCLUDED.heartbeat_grace_seconds;",
        r.id, r.public_key_ed25519, r.key_version, r.heartbeat_grace_seconds);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ClusterRecord> PgRepository::GetCluster(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_params("SELECT id,public_key_ed25519,key_version,heartbeat_grace_seconds FROM clusters WHERE id=$1;", id);
  if (res.empty()) return std::nullopt;

  model::ClusterRecord r;
  r.id                      = res[0][0].c_str();
  r.public_key_ed25519      = OptText(res[0][1]);
  r.key_version             = res[0][2].as<std::int64_t>();
  r.heartbeat_grace_seconds = OptI64(res[0][3]);
  return r;
}

Result PgRepository::InsertServer(Transaction& t, const model::ServerRecord& r) {
  try {
    TX(t).Work().exec_params(std::string("INSERT INTO servers(") + kServerColumns + ") VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13,$14);",
                             r.id, r.cluster_id, std::string(beacon::model::ToString(r.effective_status)),
                             std::string(beacon::model::ToString(r.confidence)), r.uptime_percent, r.quality_score, r.anomaly_players_spike,
                             ToParam(r.anomaly_last_detected_at_ms), r.players_current, r.players_capacity, ToParam(r.last_heartbeat_at_ms),
                             ToParam(r.last_seen_at_ms), r.status_source, ToParam(r.updated_at_ms));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ServerRecord> PgRepository::GetServer(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kServerColumns + " FROM servers WHERE id=$1;", id);
  if (res.empty()) return std::nullopt;
  return ReadServer(res[0]);
}

std::optional<model::KeyMaterialRecord> PgRepository::GetKeyMaterial(Transaction& t, const std::string& server_id) {
  auto res = TX(t).Work().exec_prepared("get_key_material", server_id);
  if (res.empty()) return std::nullopt;

  model::KeyMaterialRecord r;
  r.server_id               = res[0][0].c_str();
  r.cluster_id              = res[0][1].c_str();
  r.public_key_ed25519      = OptText(res[0][2]);
  r.key_version             = res[0][3].as<std::int64_t>();
  r.heartbeat_grace_seconds = OptI64(res[0][4]);
  return r;
}

// ------------------------------------------------------------------
// Heartbeats
// ------------------------------------------------------------------

Result PgRepository::InsertHeartbeat(Transaction& t, const model::HeartbeatRecord& r) {
  try {
    auto& w   = TX(t).Work();
    auto  res = w.exec_prepared("insert_heartbeat", r.id, r.server_id, r.heartbeat_id, r.key_version, ToParam(r.agent_timestamp_ms),
                                ToParam(r.received_at_ms), std::string(beacon::model::ToString(r.status)), r.map_name, r.players_current,
                                r.players_capacity, r.agent_version, r.signature, r.debug_payload);
    if (!res.empty()) return Result::Ok();

    // ON CONFLICT DO NOTHING swallowed the insert; find out whose row it was
    auto owner = w.exec_prepared("heartbeat_owner", r.heartbeat_id);
    if (owner.empty()) return Result::Err(ErrorCode::AlreadyExists, "heartbeat row id collision");
    if (r.server_id == owner[0][0].c_str()) return Result::Err(ErrorCode::AlreadyExists);
    return Result::Err(ErrorCode::Conflict, "heartbeat_id owned by another server");
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::HeartbeatRecord> PgRepository::GetHeartbeat(Transaction& t, const std::string& server_id, const std::string& heartbeat_id) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kHeartbeatColumns + " FROM heartbeats WHERE server_id=$1 AND heartbeat_id=$2;",
                                      server_id, heartbeat_id);
  if (res.empty()) return std::nullopt;
  return ReadHeartbeat(res[0]);
}

std::vector<model::HeartbeatRecord> PgRepository::ListRecentHeartbeats(Transaction& t, const std::string& server_id, uint32_t limit) {
  auto res = TX(t).Work().exec_params(
      std::string("SELECT ") + kHeartbeatColumns + " FROM heartbeats WHERE server_id=$1 ORDER BY received_at_ms DESC, seq DESC LIMIT $2;", server_id,
      static_cast<std::int64_t>(limit));

  std::vector<model::HeartbeatRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadHeartbeat(row));
  }
  return out;
}

// ------------------------------------------------------------------
// Derived state
// ------------------------------------------------------------------

Result PgRepository::ApplyFastPath(Transaction& t, const model::FastPathUpdate& u) {
  try {
    auto res = TX(t).Work().exec_prepared("apply_fast_path", u.server_id, ToParam(u.last_seen_at_ms), u.players_current, u.players_capacity,
                                          u.status_source);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::ApplyDerivedState(Transaction& t, const model::DerivedStateUpdate& u) {
  try {
    auto res = TX(t).Work().exec_params(
        "UPDATE servers SET effective_status=$2, confidence=$3, uptime_percent=$4, quality_score=$5, anomaly_players_spike=$6, "
        "anomaly_last_detected_at_ms=$7, players_current=$8, players_capacity=$9, last_heartbeat_at_ms=$10, updated_at_ms=$11 WHERE id=$1;",
        u.server_id, std::string(beacon::model::ToString(u.effective_status)), std::string(beacon::model::ToString(u.confidence)),
        u.uptime_percent, u.quality_score, u.anomaly_players_spike, ToParam(u.anomaly_last_detected_at_ms), u.players_current,
        u.players_capacity, ToParam(u.last_heartbeat_at_ms), ToParam(u.updated_at_ms));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Job queue
// ------------------------------------------------------------------

Result PgRepository::UpsertPendingJob(Transaction& t, const std::string& server_id, uint64_t now_ms) {
  try {
    TX(t).Work().exec_prepared("upsert_pending_job", server_id, ToParam(now_ms));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::JobRecord> PgRepository::ClaimJobs(Transaction& t, uint32_t batch_size, uint64_t now_ms, uint64_t claim_ttl_ms,
                                                      uint32_t max_attempts) {
  // SKIP LOCKED keeps concurrent workers from claiming the same rows
  auto res = TX(t).Work().exec_params(
      "WITH next AS ("
      " SELECT id FROM heartbeat_jobs WHERE processed_at_ms IS NULL"
      " AND (claimed_at_ms IS NULL OR claimed_at_ms + $2::bigint < $1::bigint)"
      " AND ($3::integer = 0 OR attempts < $3::integer)"
      " ORDER BY enqueued_at_ms ASC, id ASC LIMIT $4::integer FOR UPDATE SKIP LOCKED)"
      " UPDATE heartbeat_jobs j SET claimed_at_ms=$1::bigint, attempts=j.attempts+1 FROM next WHERE j.id=next.id"
      " RETURNING j.id,j.server_id,j.enqueued_at_ms,j.claimed_at_ms,j.processed_at_ms,j.attempts,j.last_error;",
      ToParam(now_ms), ToParam(claim_ttl_ms), static_cast<int>(max_attempts), static_cast<int>(batch_size));

  std::vector<model::JobRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadJob(row));
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    return a.enqueued_at_ms != b.enqueued_at_ms ? a.enqueued_at_ms < b.enqueued_at_ms : a.id < b.id;
  });
  return out;
}

Result PgRepository::MarkJobProcessed(Transaction& t, uint64_t job_id, uint64_t claimed_enqueued_at_ms, uint64_t processed_at_ms) {
  try {
    auto& w    = TX(t).Work();
    auto  done = w.exec_params(
        "UPDATE heartbeat_jobs SET processed_at_ms=$2, claimed_at_ms=NULL "
        "WHERE id=$1 AND (enqueued_at_ms=$3 OR processed_at_ms IS NOT NULL);",
        ToParam(job_id), ToParam(processed_at_ms), ToParam(claimed_enqueued_at_ms));
    if (done.affected_rows() > 0) return Result::Ok();

    // refreshed since the claim: release it for the next poll
    auto released = w.exec_params("UPDATE heartbeat_jobs SET claimed_at_ms=NULL, attempts=0, last_error=NULL WHERE id=$1;", ToParam(job_id));
    if (released.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Err(ErrorCode::Conflict, "job re-enqueued while claimed");
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::MarkJobFailed(Transaction& t, uint64_t job_id, const std::string& error, uint32_t attempts) {
  try {
    auto res = TX(t).Work().exec_params("UPDATE heartbeat_jobs SET last_error=$2, attempts=$3, claimed_at_ms=NULL WHERE id=$1;", ToParam(job_id),
                                        error, static_cast<int>(attempts));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::JobRecord> PgRepository::GetJob(Transaction& t, uint64_t job_id) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kJobColumns + " FROM heartbeat_jobs WHERE id=$1;", ToParam(job_id));
  if (res.empty()) return std::nullopt;
  return ReadJob(res[0]);
}

std::vector<model::JobRecord> PgRepository::ListJobsForServer(Transaction& t, const std::string& server_id) {
  auto res =
      TX(t).Work().exec_params(std::string("SELECT ") + kJobColumns + " FROM heartbeat_jobs WHERE server_id=$1 ORDER BY id ASC;", server_id);

  std::vector<model::JobRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadJob(row));
  }
  return out;
}

// ------------------------------------------------------------------
// Rejection audit
// ------------------------------------------------------------------

Result PgRepository::InsertRejection(Transaction& t, const model::RejectionRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO ingest_rejections(id,received_at_ms,server_id,rejection_reason,agent_version,metadata,event_type) "
        "VALUES($1,$2,$3,$4,$5,$6::jsonb,$7);",
        r.id, ToParam(r.received_at_ms), r.server_id, r.rejection_reason, r.agent_version, r.metadata_json, r.event_type);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::RejectionRecord> PgRepository::ListRejections(Transaction& t, uint32_t limit) {
  auto res = TX(t).Work().exec_params(
      "SELECT id,received_at_ms,server_id,rejection_reason,agent_version,metadata::text,event_type FROM ingest_rejections "
      "ORDER BY received_at_ms DESC LIMIT $1;",
      static_cast<std::int64_t>(limit));

  std::vector<model::RejectionRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::RejectionRecord r;
    r.id               = row[0].c_str();
    r.received_at_ms   = static_cast<uint64_t>(row[1].as<std::int64_t>());
    r.server_id        = OptText(row[2]);
    r.rejection_reason = row[3].c_str();
    r.agent_version    = OptText(row[4]);
    r.metadata_json    = row[5].c_str();
    r.event_type       = row[6].c_str();
    out.push_back(std::move(r));
  }
  return out;
}

} // namespace beacon::db::postgres
