#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <stdexcept>

#include "internal/db/sql/schema.hpp"

namespace beacon::db::sqlite {

using beacon::db::ErrorCode;
using beacon::db::Result;

namespace {

// Owns one prepared statement; prepare errors are reported through rc.
struct Statement {
  Statement(sqlite3* db, const char* sql) {
    rc = sqlite3_prepare_v2(db, sql, -1, &st, nullptr);
  }
  ~Statement() {
    if (st) sqlite3_finalize(st);
  }
  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  bool ok() const {
    return rc == SQLITE_OK;
  }

  sqlite3_stmt* st = nullptr;
  int           rc = SQLITE_OK;
};

void RequirePrepared(sqlite3* db, const Statement& s, const char* what) {
  if (!s.ok()) {
    throw std::runtime_error(std::string("sqlite prepare ") + what + ": " + sqlite3_errmsg(db));
  }
}

void RequireStep(sqlite3* db, int rc, const char* what) {
  if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
    throw std::runtime_error(std::string("sqlite step ") + what + ": " + sqlite3_errmsg(db));
  }
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& v) {
  if (v) {
    BindText(st, idx, *v);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindOptI64(sqlite3_stmt* st, int idx, const std::optional<int64_t>& v) {
  if (v) {
    BindI64(st, idx, *v);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindOptU64(sqlite3_stmt* st, int idx, const std::optional<uint64_t>& v) {
  if (v) {
    BindU64(st, idx, *v);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindOptDouble(sqlite3_stmt* st, int idx, const std::optional<double>& v) {
  if (v) {
    sqlite3_bind_double(st, idx, *v);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

bool IsNull(sqlite3_stmt* st, int col) {
  return sqlite3_column_type(st, col) == SQLITE_NULL;
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
  if (IsNull(st, col)) return std::nullopt;
  return ColText(st, col);
}

std::optional<int64_t> ColOptI64(sqlite3_stmt* st, int col) {
  if (IsNull(st, col)) return std::nullopt;
  return ColI64(st, col);
}

std::optional<uint64_t> ColOptU64(sqlite3_stmt* st, int col) {
  if (IsNull(st, col)) return std::nullopt;
  return ColU64(st, col);
}

std::optional<double> ColOptDouble(sqlite3_stmt* st, int col) {
  if (IsNull(st, col)) return std::nullopt;
  return sqlite3_column_double(st, col);
}

constexpr const char* kServerColumns =
    "id,cluster_id,effective_status,confidence,uptime_percent,quality_score,anomaly_players_spike,anomaly_last_detected_at_ms,"
    "players_current,players_capacity,last_heartbeat_at_ms,last_seen_at_ms,status_source,updated_at_ms";

model::ServerRecord ReadServer(sqlite3_stmt* st) {
  model::ServerRecord r;
  r.id                          = ColText(st, 0);
  r.cluster_id                  = ColText(st, 1);
  r.effective_status            = beacon::model::ParseEffectiveStatus(ColText(st, 2)).value_or(beacon::model::EffectiveStatus::kUnknown);
  r.confidence                  = beacon::model::ParseConfidence(ColText(st, 3)).value_or(beacon::model::Confidence::kRed);
  r.uptime_percent              = ColOptDouble(st, 4);
  r.quality_score               = ColOptDouble(st, 5);
  r.anomaly_players_spike       = sqlite3_column_int(st, 6) != 0;
  r.anomaly_last_detected_at_ms = ColOptU64(st, 7);
  r.players_current             = ColOptI64(st, 8);
  r.players_capacity            = ColOptI64(st, 9);
  r.last_heartbeat_at_ms        = ColOptU64(st, 10);
  r.last_seen_at_ms             = ColOptU64(st, 11);
  r.status_source               = ColText(st, 12);
  r.updated_at_ms               = ColU64(st, 13);
  return r;
}

constexpr const char* kHeartbeatColumns =
    "id,server_id,heartbeat_id,key_version,agent_timestamp_ms,received_at_ms,status,map_name,players_current,players_capacity,"
    "agent_version,signature,debug_payload";

model::HeartbeatRecord ReadHeartbeat(sqlite3_stmt* st) {
  model::HeartbeatRecord r;
  r.id                 = ColText(st, 0);
  r.server_id          = ColText(st, 1);
  r.heartbeat_id       = ColText(st, 2);
  r.key_version        = ColI64(st, 3);
  r.agent_timestamp_ms = ColU64(st, 4);
  r.received_at_ms     = ColU64(st, 5);
  r.status             = beacon::model::ParseHeartbeatStatus(ColText(st, 6)).value_or(beacon::model::HeartbeatStatus::kOffline);
  r.map_name           = ColOptText(st, 7);
  r.players_current    = ColOptI64(st, 8);
  r.players_capacity   = ColOptI64(st, 9);
  r.agent_version      = ColOptText(st, 10);
  r.signature          = ColText(st, 11);
  r.debug_payload      = ColOptText(st, 12);
  return r;
}

constexpr const char* kJobColumns = "id,server_id,enqueued_at_ms,claimed_at_ms,processed_at_ms,attempts,last_error";

model::JobRecord ReadJob(sqlite3_stmt* st) {
  model::JobRecord r;
  r.id              = ColU64(st, 0);
  r.server_id       = ColText(st, 1);
  r.enqueued_at_ms  = ColU64(st, 2);
  r.claimed_at_ms   = ColOptU64(st, 3);
  r.processed_at_ms = ColOptU64(st, 4);
  r.attempts        = static_cast<uint32_t>(sqlite3_column_int(st, 5));
  r.last_error      = ColOptText(st, 6);
  return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

void SqliteRepository::Bootstrap(SqliteDB& db) {
  for (const char* sql : sql::kSqliteSchema) {
    db.Exec(sql);
  }
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT: {
      const int extended = sqlite3_extended_errcode(db);
      if (extended == SQLITE_CONSTRAINT_UNIQUE || extended == SQLITE_CONSTRAINT_PRIMARYKEY) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    }
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Registry
// ------------------------------------------------------------------

Result SqliteRepository::UpsertCluster(Transaction& t, const model::ClusterRecord& r) {
  auto* db = TX(t).Handle();

  Statement s(db,
              "INSERT INTO clusters(id,public_key_ed25519,key_version,heartbeat_grace_seconds) VALUES(?,?,?,?) "
              "ON CONFLICT(id) DO UPDATE SET public_key_ed25519=excluded.public_key_ed25519, key_version=excluded.key_version, "
              "heartbeat_grace_seconds=excluded.heartbeat_grace_seconds;");
  if (!s.ok()) return Translate(db, s.rc);

  BindText(s.st, 1, r.id);
  BindOptText(s.st, 2, r.public_key_ed25519);
  BindI64(s.st, 3, r.key_version);
  BindOptI64(s.st, 4, r.heartbeat_grace_seconds);

  return Translate(db, sqlite3_step(s.st));
}

std::optional<model::ClusterRecord> SqliteRepository::GetCluster(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  Statement s(db, "SELECT id,public_key_ed25519,key_version,heartbeat_grace_seconds FROM clusters WHERE id=?;");
  RequirePrepared(db, s, "get cluster");
  BindText(s.st, 1, id);

  const int rc = sqlite3_step(s.st);
  RequireStep(db, rc, "get cluster");
  if (rc != SQLITE_ROW) return std::nullopt;

  model::ClusterRecord r;
  r.id                      = ColText(s.st, 0);
  r.public_key_ed25519      = ColOptText(s.st, 1);
  r.key_version             = ColI64(s.st, 2);
  r.heartbeat_grace_seconds = ColOptI64(s.st, 3);
  return r;
}

Result SqliteRepository::InsertServer(Transaction& t, const model::ServerRecord& r) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string("INSERT INTO servers(") + kServerColumns + ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?);";
  Statement         s(db, sql.c_str());
  if (!s.ok()) return Translate(db, s.rc);

  BindText(s.st, 1, r.id);
  BindText(s.st, 2, r.cluster_id);
  BindText(s.st, 3, std::string(beacon::model::ToString(r.effective_status)));
  BindText(s.st, 4, std::string(beacon::model::ToString(r.confidence)));
  BindOptDouble(s.st, 5, r.uptime_percent);
  BindOptDouble(s.st, 6, r.quality_score);
  sqlite3_bind_int(s.st, 7, r.anomaly_players_spike ? 1 : 0);
  BindOptU64(s.st, 8, r.anomaly_last_detected_at_ms);
  BindOptI64(s.st, 9, r.players_current);
  BindOptI64(s.st, 10, r.players_capacity);
  BindOptU64(s.st, 11, r.last_heartbeat_at_ms);
  BindOptU64(s.st, 12, r.last_seen_at_ms);
  BindText(s.st, 13, r.status_source);
  BindU64(s.st, 14, r.updated_at_ms);

  return Translate(db, sqlite3_step(s.st));
}

std::optional<model::ServerRecord> SqliteRepository::GetServer(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string("SELECT ") + kServerColumns + " FROM servers WHERE id=?;";
  Statement         s(db, sql.c_str());
  RequirePrepared(db, s, "get server");
  BindText(s.st, 1, id);

  const int rc = sqlite3_step(s.st);
  RequireStep(db, rc, "get server");
  if (rc != SQLITE_ROW) return std::nullopt;
  return ReadServer(s.st);
}

std::optional<model::KeyMaterialRecord> SqliteRepository::GetKeyMaterial(Transaction& t, const std::string& server_id) {
  auto* db = TX(t).Handle();

  Statement s(db,
              "SELECT s.id,c.id,c.public_key_ed25519,c.key_version,c.heartbeat_grace_seconds "
              "FROM servers s JOIN clusters c ON c.id=s.cluster_id WHERE s.id=?;");
  RequirePrepared(db, s, "get key material");
  BindText(s.st, 1, server_id);

  const int rc = sqlite3_step(s.st);
  RequireStep(db, rc, "get key material");
  if (rc != SQLITE_ROW) return std::nullopt;

  model::KeyMaterialRecord r;
  r.server_id               = ColText(s.st, 0);
  r.cluster_id              = ColText(s.st, 1);
  r.public_key_ed25519      = ColOptText(s.st, 2);
  r.key_version             = ColI64(s.st, 3);
  r.heartbeat_grace_seconds = ColOptI64(s.st, 4);
  return r;
}

// ------------------------------------------------------------------
// Heartbeats
// ------------------------------------------------------------------

Result SqliteRepository::InsertHeartbeat(Transaction& t, const model::HeartbeatRecord& r) {
  auto* db = TX(t).Handle();

  Result inserted;
  {
    const std::string sql = std::string("INSERT INTO heartbeats(") + kHeartbeatColumns + ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?);";
    Statement         s(db, sql.c_str());
    if (!s.ok()) return Translate(db, s.rc);

    BindText(s.st, 1, r.id);
    BindText(s.st, 2, r.server_id);
    BindText(s.st, 3, r.heartbeat_id);
    BindI64(s.st, 4, r.key_version);
    BindU64(s.st, 5, r.agent_timestamp_ms);
    BindU64(s.st, 6, r.received_at_ms);
    BindText(s.st, 7, std::string(beacon::model::ToString(r.status)));
    BindOptText(s.st, 8, r.map_name);
    BindOptI64(s.st, 9, r.players_current);
    BindOptI64(s.st, 10, r.players_capacity);
    BindOptText(s.st, 11, r.agent_version);
    BindText(s.st, 12, r.signature);
    BindOptText(s.st, 13, r.debug_payload);

    inserted = Translate(db, sqlite3_step(s.st));
  }
  if (inserted.code != ErrorCode::AlreadyExists) return inserted;

  // the unique constraint rejected the row; find out whose heartbeat_id it was
  Statement owner(db, "SELECT server_id FROM heartbeats WHERE heartbeat_id=?;");
  if (!owner.ok()) return Translate(db, owner.rc);
  BindText(owner.st, 1, r.heartbeat_id);

  const int rc = sqlite3_step(owner.st);
  if (rc == SQLITE_DONE) return Result::Err(ErrorCode::AlreadyExists, "heartbeat row id collision");
  if (rc != SQLITE_ROW) return Translate(db, rc);
  if (ColText(owner.st, 0) == r.server_id) return Result::Err(ErrorCode::AlreadyExists);
  return Result::Err(ErrorCode::Conflict, "heartbeat_id owned by another server");
}

std::optional<model::HeartbeatRecord> SqliteRepository::GetHeartbeat(Transaction& t, const std::string& server_id, const std::string& heartbeat_id) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string("SELECT ") + kHeartbeatColumns + " FROM heartbeats WHERE server_id=? AND heartbeat_id=?;";
  Statement         s(db, sql.c_str());
  RequirePrepared(db, s, "get heartbeat");
  BindText(s.st, 1, server_id);
  BindText(s.st, 2, heartbeat_id);

  const int rc = sqlite3_step(s.st);
  RequireStep(db, rc, "get heartbeat");
  if (rc != SQLITE_ROW) return std::nullopt;
  return ReadHeartbeat(s.st);
}

std::vector<model::HeartbeatRecord> SqliteRepository::ListRecentHeartbeats(Transaction& t, const std::string& server_id, uint32_t limit) {
  auto* db = TX(t).Handle();

  const std::string sql =
      std::string("SELECT ") + kHeartbeatColumns + " FROM heartbeats WHERE server_id=? ORDER BY received_at_ms DESC, rowid DESC LIMIT ?;";
  Statement s(db, sql.c_str());
  RequirePrepared(db, s, "list heartbeats");
  BindText(s.st, 1, server_id);
  BindU64(s.st, 2, limit);

  std::vector<model::HeartbeatRecord> out;
  int                                 rc = SQLITE_ROW;
  while ((rc = sqlite3_step(s.st)) == SQLITE_ROW) {
    out.push_back(ReadHeartbeat(s.st));
  }
  RequireStep(db, rc, "list heartbeats");
  return out;
}

// ------------------------------------------------------------------
// Derived state
// ------------------------------------------------------------------

Result SqliteRepository::ApplyFastPath(Transaction& t, const model::FastPathUpdate& u) {
  auto* db = TX(t).Handle();

  Statement s(db,
              "UPDATE servers SET last_seen_at_ms=?, players_current=COALESCE(?,players_current), "
              "players_capacity=COALESCE(?,players_capacity), status_source=? WHERE id=?;");
  if (!s.ok()) return Translate(db, s.rc);

  BindU64(s.st, 1, u.last_seen_at_ms);
  BindOptI64(s.st, 2, u.players_current);
  BindOptI64(s.st, 3, u.players_capacity);
  BindText(s.st, 4, u.status_source);
  BindText(s.st, 5, u.server_id);

  auto result = Translate(db, sqlite3_step(s.st));
  if (result && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return result;
}

Result SqliteRepository::ApplyDerivedState(Transaction& t, const model::DerivedStateUpdate& u) {
  auto* db = TX(t).Handle();

  Statement s(db,
              "UPDATE servers SET effective_status=?, confidence=?, uptime_percent=?, quality_score=?, anomaly_players_spike=?, "
              "anomaly_last_detected_at_ms=?, players_current=?, players_capacity=?, last_heartbeat_at_ms=?, updated_at_ms=? WHERE id=?;");
  if (!s.ok()) return Translate(db, s.rc);

  BindText(s.st, 1, std::string(beacon::model::ToString(u.effective_status)));
  BindText(s.st, 2, std::string(beacon::model::ToString(u.confidence)));
  BindOptDouble(s.st, 3, u.uptime_percent);
  BindOptDouble(s.st, 4, u.quality_score);
  sqlite3_bind_int(s.st, 5, u.anomaly_players_spike ? 1 : 0);
  BindOptU64(s.st, 6, u.anomaly_last_detected_at_ms);
  BindOptI64(s.st, 7, u.players_current);
  BindOptI64(s.st, 8, u.players_capacity);
  BindOptU64(s.st, 9, u.last_heartbeat_at_ms);
  BindU64(s.st, 10, u.updated_at_ms);
  BindText(s.st, 11, u.server_id);

  auto result = Translate(db, sqlite3_step(s.st));
  if (result && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return result;
}

// ------------------------------------------------------------------
// Job queue
// ------------------------------------------------------------------

Result SqliteRepository::UpsertPendingJob(Transaction& t, const std::string& server_id, uint64_t now_ms) {
  auto* db = TX(t).Handle();

  Statement s(db,
              "INSERT INTO heartbeat_jobs(server_id,enqueued_at_ms,attempts) VALUES(?,?,0) "
              "ON CONFLICT(server_id) WHERE processed_at_ms IS NULL DO UPDATE SET enqueued_at_ms=MAX(excluded.enqueued_at_ms, heartbeat_jobs.enqueued_at_ms + 1);");
  if (!s.ok()) return Translate(db, s.rc);

  BindText(s.st, 1, server_id);
  BindU64(s.st, 2, now_ms);

  return Translate(db, sqlite3_step(s.st));
}

std::vector<model::JobRecord> SqliteRepository::ClaimJobs(Transaction& t, uint32_t batch_size, uint64_t now_ms, uint64_t claim_ttl_ms,
                                                          uint32_t max_attempts) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string(
                              "UPDATE heartbeat_jobs SET claimed_at_ms=?1, attempts=attempts+1 WHERE id IN ("
                              " SELECT id FROM heartbeat_jobs WHERE processed_at_ms IS NULL"
                              " AND (claimed_at_ms IS NULL OR claimed_at_ms + ?2 < ?1)"
                              " AND (?3 = 0 OR attempts < ?3)"
                              " ORDER BY enqueued_at_ms ASC, id ASC LIMIT ?4) RETURNING ") +
                          kJobColumns + ";";
  Statement s(db, sql.c_str());
  RequirePrepared(db, s, "claim jobs");
  BindU64(s.st, 1, now_ms);
  BindU64(s.st, 2, claim_ttl_ms);
  BindU64(s.st, 3, max_attempts);
  BindU64(s.st, 4, batch_size);

  std::vector<model::JobRecord> out;
  int                           rc = SQLITE_ROW;
  while ((rc = sqlite3_step(s.st)) == SQLITE_ROW) {
    out.push_back(ReadJob(s.st));
  }
  RequireStep(db, rc, "claim jobs");

  // RETURNING order is unspecified
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    return a.enqueued_at_ms != b.enqueued_at_ms ? a.enqueued_at_ms < b.enqueued_at_ms : a.id < b.id;
  });
  return out;
}

Result SqliteRepository::MarkJobProcessed(Transaction& t, uint64_t job_id, uint64_t claimed_enqueued_at_ms, uint64_t processed_at_ms) {
  auto* db = TX(t).Handle();

  {
    Statement s(db,
                "UPDATE heartbeat_jobs SET processed_at_ms=?1, claimed_at_ms=NULL "
                "WHERE id=?2 AND (enqueued_at_ms=?3 OR processed_at_ms IS NOT NULL);");
    if (!s.ok()) return Translate(db, s.rc);
    BindU64(s.st, 1, processed_at_ms);
    BindU64(s.st, 2, job_id);
    BindU64(s.st, 3, claimed_enqueued_at_ms);

    auto result = Translate(db, sqlite3_step(s.st));
    if (!result) return result;
    if (sqlite3_changes(db) > 0) return Result::Ok();
  }

  // refreshed since the claim: release it for the next poll
  Statement s(db, "UPDATE heartbeat_jobs SET claimed_at_ms=NULL, attempts=0, last_error=NULL WHERE id=?;");
  if (!s.ok()) return Translate(db, s.rc);
  BindU64(s.st, 1, job_id);

  auto result = Translate(db, sqlite3_step(s.st));
  if (!result) return result;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return Result::Err(ErrorCode::Conflict, "job re-enqueued while claimed");
}

Result SqliteRepository::MarkJobFailed(Transaction& t, uint64_t job_id, const std::string& error, uint32_t attempts) {
  auto* db = TX(t).Handle();

  Statement s(db, "UPDATE heartbeat_jobs SET last_error=?, attempts=?, claimed_at_ms=NULL WHERE id=?;");
  if (!s.ok()) return Translate(db, s.rc);
  BindText(s.st, 1, error);
  BindU64(s.st, 2, attempts);
  BindU64(s.st, 3, job_id);

  auto result = Translate(db, sqlite3_step(s.st));
  if (result && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return result;
}

std::optional<model::JobRecord> SqliteRepository::GetJob(Transaction& t, uint64_t job_id) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string("SELECT ") + kJobColumns + " FROM heartbeat_jobs WHERE id=?;";
  Statement         s(db, sql.c_str());
  RequirePrepared(db, s, "get job");
  BindU64(s.st, 1, job_id);

  const int rc = sqlite3_step(s.st);
  RequireStep(db, rc, "get job");
  if (rc != SQLITE_ROW) return std::nullopt;
  return ReadJob(s.st);
}

std::vector<model::JobRecord> SqliteRepository::ListJobsForServer(Transaction& t, const std::string& server_id) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string("SELECT ") + kJobColumns + " FROM heartbeat_jobs WHERE server_id=? ORDER BY id ASC;";
  Statement         s(db, sql.c_str());
  RequirePrepared(db, s, "list jobs");
  BindText(s.st, 1, server_id);

  std::vector<model::JobRecord> out;
  int                           rc = SQLITE_ROW;
  while ((rc = sqlite3_step(s.st)) == SQLITE_ROW) {
    out.push_back(ReadJob(s.st));
  }
  RequireStep(db, rc, "list jobs");
  return out;
}

// ------------------------------------------------------------------
// Rejection audit
// ------------------------------------------------------------------

Result SqliteRepository::InsertRejection(Transaction& t, const model::RejectionRecord& r) {
  auto* db = TX(t).Handle();

  Statement s(db,
              "INSERT INTO ingest_rejections(id,received_at_ms,server_id,rejection_reason,agent_version,metadata,event_type) "
              "VALUES(?,?,?,?,?,?,?);");
  if (!s.ok()) return Translate(db, s.rc);

  BindText(s.st, 1, r.id);
  BindU64(s.st, 2, r.received_at_ms);
  BindOptText(s.st, 3, r.server_id);
  BindText(s.st, 4, r.rejection_reason);
  BindOptText(s.st, 5, r.agent_version);
  BindText(s.st, 6, r.metadata_json);
  BindText(s.st, 7, r.event_type);

  return Translate(db, sqlite3_step(s.st));
}

std::vector<model::RejectionRecord> SqliteRepository::ListRejections(Transaction& t, uint32_t limit) {
  auto* db = TX(t).Handle();

  Statement s(db,
              "SELECT id,received_at_ms,server_id,rejection_reason,agent_version,metadata,event_type FROM ingest_rejections "
              "ORDER BY received_at_ms DESC, rowid DESC LIMIT ?;");
  RequirePrepared(db, s, "list rejections");
  BindU64(s.st, 1, limit);

  std::vector<model::RejectionRecord> out;
  int                                 rc = SQLITE_ROW;
  while ((rc = sqlite3_step(s.st)) == SQLITE_ROW) {
    model::RejectionRecord r;
    r.id               = ColText(s.st, 0);
    r.received_at_ms   = ColU64(s.st, 1);
    r.server_id        = ColOptText(s.st, 2);
    r.rejection_reason = ColText(s.st, 3);
    r.agent_version    = ColOptText(s.st, 4);
    r.metadata_json    = ColText(s.st, 5);
    r.event_type       = ColText(s.st, 6);
    out.push_back(std::move(r));
  }
  RequireStep(db, rc, "list rejections");
  return out;
}

} // namespace beacon::db::sqlite
