#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "internal/util/time.hpp"

namespace beacon::db {
class Repository;
}

namespace beacon::keys {

struct KeyMaterial {
  std::string                 server_id;
  std::string                 cluster_id;
  std::optional<std::string>  public_key_b64;
  std::int64_t                key_version = 0;
  std::optional<std::int64_t> grace_seconds;
};

/*
  KeyMaterialCache

  Process-scoped TTL cache of per-server key material, injected into the
  Ingest Gate.

  - Entries younger than ttl are served without touching the loader.
  - A loader failure falls back to the previous entry while it is younger
    than max_stale (stale-if-error); otherwise the error propagates.
  - Misses (loader returns nullopt) are not cached.

  The loader runs without the cache lock held and must not be called from
  inside an open repository transaction.
*/
class KeyMaterialCache {
 public:
  using Loader = std::function<std::optional<KeyMaterial>(const std::string& server_id)>;

  struct Options {
    std::chrono::seconds ttl{60};
    std::chrono::seconds max_stale{600};
  };

  KeyMaterialCache(Loader loader, Options options, util::ClockFn clock = util::Now);

  std::optional<KeyMaterial> Get(const std::string& server_id);

  // Bypasses the TTL; still stale-if-error.
  std::optional<KeyMaterial> Refresh(const std::string& server_id);

  void Invalidate(const std::string& server_id);
  void Clear();

  std::size_t Size() const;

  // Loader reading GetKeyMaterial in a short read transaction.
  static Loader RepositoryLoader(std::shared_ptr<db::Repository> repository);

 private:
  struct Entry {
    KeyMaterial     material;
    util::TimePoint loaded_at;
  };

  std::optional<KeyMaterial> Load(const std::string& server_id);

  Loader        loader_;
  Options       options_;
  util::ClockFn clock_;

  mutable std::mutex                     mutex_;
  std::unordered_map<std::string, Entry> entries_;
};

} // namespace beacon::keys
