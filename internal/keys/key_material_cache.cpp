#include "internal/keys/key_material_cache.hpp"

#include <stdexcept>

#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"

namespace beacon::keys {

KeyMaterialCache::KeyMaterialCache(Loader loader, Options options, util::ClockFn clock)
    : loader_(std::move(loader)), options_(options), clock_(std::move(clock)) {
  if (!loader_) {
    throw std::invalid_argument("KeyMaterialCache: loader is required");
  }
  if (!clock_) {
    clock_ = util::Now;
  }
}

std::optional<KeyMaterial> KeyMaterialCache::Get(const std::string& server_id) {
  {
    std::lock_guard lock(mutex_);
    auto            it = entries_.find(server_id);
    if (it != entries_.end() && clock_() - it->second.loaded_at < options_.ttl) {
      return it->second.material;
    }
  }
  return Load(server_id);
}

std::optional<KeyMaterial> KeyMaterialCache::Refresh(const std::string& server_id) {
  return Load(server_id);
}

std::optional<KeyMaterial> KeyMaterialCache::Load(const std::string& server_id) {
  std::optional<KeyMaterial> loaded;
  try {
    loaded = loader_(server_id);
  } catch (const std::exception& e) {
    std::lock_guard lock(mutex_);
    auto            it = entries_.find(server_id);
    if (it == entries_.end() || clock_() - it->second.loaded_at >= options_.max_stale) {
      throw;
    }
    BEACON_LOG_WARN("key material reload failed, serving stale entry",
                    {beacon::observability::StringField("server_id", server_id), beacon::observability::StringField("error", e.what())});
    return it->second.material;
  }

  std::lock_guard lock(mutex_);
  if (!loaded) {
    entries_.erase(server_id);
    return std::nullopt;
  }
  entries_[server_id] = Entry{*loaded, clock_()};
  return loaded;
}

void KeyMaterialCache::Invalidate(const std::string& server_id) {
  std::lock_guard lock(mutex_);
  entries_.erase(server_id);
}

void KeyMaterialCache::Clear() {
  std::lock_guard lock(mutex_);
  entries_.clear();
}

std::size_t KeyMaterialCache::Size() const {
  std::lock_guard lock(mutex_);
  return entries_.size();
}

KeyMaterialCache::Loader KeyMaterialCache::RepositoryLoader(std::shared_ptr<db::Repository> repository) {
  return [repository = std::move(repository)](const std::string& server_id) -> std::optional<KeyMaterial> {
    auto tx     = repository->Begin();
    auto record = repository->GetKeyMaterial(*tx, server_id);
    tx->Commit();
    if (!record) return std::nullopt;

    KeyMaterial key;
    key.server_id      = record->server_id;
    key.cluster_id     = record->cluster_id;
    key.public_key_b64 = record->public_key_ed25519;
    key.key_version    = record->key_version;
    key.grace_seconds  = record->heartbeat_grace_seconds;
    return key;
  };
}

} // namespace beacon::keys
