#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace beacon::db::memory {

namespace {

bool IsClaimable(const model::JobRecord& job, uint64_t now_ms, uint64_t claim_ttl_ms, uint32_t max_attempts) {
  if (job.processed_at_ms.has_value()) return false;
  if (max_attempts > 0 && job.attempts >= max_attempts) return false;
  if (!job.claimed_at_ms.has_value()) return true;
  return *job.claimed_at_ms + claim_ttl_ms < now_ms;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Registry
// ------------------------------------------------------------------

Result MemoryRepository::UpsertCluster(Transaction& t, const model::ClusterRecord& r) {
  TX(t).Mutable().clusters[r.id] = r;
  return Result::Ok();
}

std::optional<model::ClusterRecord> MemoryRepository::GetCluster(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.clusters.find(id);
  if (it == s.clusters.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::InsertServer(Transaction& t, const model::ServerRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.clusters.contains(r.cluster_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "unknown cluster " + r.cluster_id);
  }
  if (s.servers.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists);
  s.servers[r.id] = r;
  return Result::Ok();
}

std::optional<model::ServerRecord> MemoryRepository::GetServer(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.servers.find(id);
  if (it == s.servers.end()) return std::nullopt;
  return it->second;
}

std::optional<model::KeyMaterialRecord> MemoryRepository::GetKeyMaterial(Transaction& t, const std::string& server_id) {
  const auto& s      = TX(t).View();
  auto        server = s.servers.find(server_id);
  if (server == s.servers.end()) return std::nullopt;
  auto cluster = s.clusters.find(server->second.cluster_id);
  if (cluster == s.clusters.end()) return std::nullopt;

  model::KeyMaterialRecord key;
  key.server_id               = server_id;
  key.cluster_id              = cluster->second.id;
  key.public_key_ed25519      = cluster->second.public_key_ed25519;
  key.key_version             = cluster->second.key_version;
  key.heartbeat_grace_seconds = cluster->second.heartbeat_grace_seconds;
  return key;
}

// ------------------------------------------------------------------
// Heartbeats
// ------------------------------------------------------------------

Result MemoryRepository::InsertHeartbeat(Transaction& t, const model::HeartbeatRecord& r) {
  auto& s     = TX(t).Mutable();
  auto  owner = s.heartbeat_owner.find(r.heartbeat_id);
  if (owner != s.heartbeat_owner.end()) {
    if (owner->second == r.server_id) return Result::Err(ErrorCode::AlreadyExists);
    return Result::Err(ErrorCode::Conflict, "heartbeat_id owned by another server");
  }
  if (!s.servers.contains(r.server_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "unknown server " + r.server_id);
  }

  s.heartbeat_owner[r.heartbeat_id] = r.server_id;
  s.heartbeats[r.server_id].push_back(r);
  return Result::Ok();
}

std::optional<model::HeartbeatRecord> MemoryRepository::GetHeartbeat(Transaction& t, const std::string& server_id, const std::string& heartbeat_id) {
  const auto& s  = TX(t).View();
  auto        it = s.heartbeats.find(server_id);
  if (it == s.heartbeats.end()) return std::nullopt;
  for (const auto& hb : it->second) {
    if (hb.heartbeat_id == heartbeat_id) return hb;
  }
  return std::nullopt;
}

std::vector<model::HeartbeatRecord> MemoryRepository::ListRecentHeartbeats(Transaction& t, const std::string& server_id, uint32_t limit) {
  const auto& s  = TX(t).View();
  auto        it = s.heartbeats.find(server_id);
  if (it == s.heartbeats.end()) return {};

  std::vector<model::HeartbeatRecord> out(it->second.rbegin(), it->second.rend());
  std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.received_at_ms > b.received_at_ms; });
  if (out.size() > limit) out.resize(limit);
  return out;
}

// ------------------------------------------------------------------
// Derived state
// ------------------------------------------------------------------

Result MemoryRepository::ApplyFastPath(Transaction& t, const model::FastPathUpdate& u) {
  auto& s  = TX(t).Mutable();
  auto  it = s.servers.find(u.server_id);
  if (it == s.servers.end()) return Result::Err(ErrorCode::NotFound);

  auto& server           = it->second;
  server.last_seen_at_ms = u.last_seen_at_ms;
  if (u.players_current) server.players_current = u.players_current;
  if (u.players_capacity) server.players_capacity = u.players_capacity;
  server.status_source = u.status_source;
  return Result::Ok();
}

Result MemoryRepository::ApplyDerivedState(Transaction& t, const model::DerivedStateUpdate& u) {
  auto& s  = TX(t).Mutable();
  auto  it = s.servers.find(u.server_id);
  if (it == s.servers.end()) return Result::Err(ErrorCode::NotFound);

  auto& server                       = it->second;
  server.effective_status            = u.effective_status;
  server.confidence                  = u.confidence;
  server.uptime_percent              = u.uptime_percent;
  server.quality_score               = u.quality_score;
  server.anomaly_players_spike       = u.anomaly_players_spike;
  server.anomaly_last_detected_at_ms = u.anomaly_last_detected_at_ms;
  server.players_current             = u.players_current;
  server.players_capacity            = u.players_capacity;
  server.last_heartbeat_at_ms        = u.last_heartbeat_at_ms;
  server.updated_at_ms               = u.updated_at_ms;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Job queue
// ------------------------------------------------------------------

Result MemoryRepository::UpsertPendingJob(Transaction& t, const std::string& server_id, uint64_t now_ms) {
  auto& s = TX(t).Mutable();
  for (auto& [_, job] : s.jobs) {
    if (job.server_id == server_id && !job.processed_at_ms.has_value()) {
      job.enqueued_at_ms = std::max(now_ms, job.enqueued_at_ms + 1);
      return Result::Ok();
    }
  }

  model::JobRecord job;
  job.id             = s.next_job_id++;
  job.server_id      = server_id;
  job.enqueued_at_ms = now_ms;
  s.jobs[job.id]     = job;
  return Result::Ok();
}

std::vector<model::JobRecord> MemoryRepository::ClaimJobs(Transaction& t, uint32_t batch_size, uint64_t now_ms, uint64_t claim_ttl_ms,
                                                          uint32_t max_attempts) {
  auto& s = TX(t).Mutable();

  std::vector<model::JobRecord*> candidates;
  for (auto& [_, job] : s.jobs) {
    if (IsClaimable(job, now_ms, claim_ttl_ms, max_attempts)) candidates.push_back(&job);
  }
  std::stable_sort(candidates.begin(), candidates.end(), [](const auto* a, const auto* b) { return a->enqueued_at_ms < b->enqueued_at_ms; });
  if (candidates.size() > batch_size) candidates.resize(batch_size);

  std::vector<model::JobRecord> claimed;
  claimed.reserve(candidates.size());
  for (auto* job : candidates) {
    job->claimed_at_ms = now_ms;
    job->attempts += 1;
    claimed.push_back(*job);
  }
  return claimed;
}

Result MemoryRepository::MarkJobProcessed(Transaction& t, uint64_t job_id, uint64_t claimed_enqueued_at_ms, uint64_t processed_at_ms) {
  auto& s  = TX(t).Mutable();
  auto  it = s.jobs.find(job_id);
  if (it == s.jobs.end()) return Result::Err(ErrorCode::NotFound);

  auto& job = it->second;
  job.claimed_at_ms.reset();
  if (job.enqueued_at_ms != claimed_enqueued_at_ms && !job.processed_at_ms.has_value()) {
    job.attempts = 0;
    job.last_error.reset();
    return Result::Err(ErrorCode::Conflict, "job re-enqueued while claimed");
  }
  job.processed_at_ms = processed_at_ms;
  return Result::Ok();
}

Result MemoryRepository::MarkJobFailed(Transaction& t, uint64_t job_id, const std::string& error, uint32_t attempts) {
  auto& s  = TX(t).Mutable();
  auto  it = s.jobs.find(job_id);
  if (it == s.jobs.end()) return Result::Err(ErrorCode::NotFound);
  it->second.last_error = error;
  it->second.attempts   = attempts;
  it->second.claimed_at_ms.reset();
  return Result::Ok();
}

std::optional<model::JobRecord> MemoryRepository::GetJob(Transaction& t, uint64_t job_id) {
  const auto& s  = TX(t).View();
  auto        it = s.jobs.find(job_id);
  if (it == s.jobs.end()) return std::nullopt;
  return it->second;
}

std::vector<model::JobRecord> MemoryRepository::ListJobsForServer(Transaction& t, const std::string& server_id) {
  std::vector<model::JobRecord> out;
  for (const auto& [_, job] : TX(t).View().jobs) {
    if (job.server_id == server_id) out.push_back(job);
  }
  return out;
}

// ------------------------------------------------------------------
// Rejection audit
// ------------------------------------------------------------------

Result MemoryRepository::InsertRejection(Transaction& t, const model::RejectionRecord& r) {
  TX(t).Mutable().rejections.push_back(r);
  return Result::Ok();
}

std::vector<model::RejectionRecord> MemoryRepository::ListRejections(Transaction& t, uint32_t limit) {
  const auto&                         s = TX(t).View();
  std::vector<model::RejectionRecord> out(s.rejections.rbegin(), s.rejections.rend());
  if (out.size() > limit) out.resize(limit);
  return out;
}

} // namespace beacon::db::memory
