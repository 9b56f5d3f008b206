#pragma once

#include <map>
#include <set>
#include <string>
#include <string_view>

namespace beacon::ingest {

/*
  Consent / eligibility collaborator.

  Decides whether data of a given type may be ingested for a server.
  Implementations must be thread-safe; Allowed() is called on every request.
*/
class EligibilityPolicy {
 public:
  using Context = std::map<std::string, std::string>;

  virtual ~EligibilityPolicy() = default;

  virtual bool Allowed(const std::string& server_id, std::string_view data_type, const Context& context) const = 0;
};

class AllowAllPolicy final : public EligibilityPolicy {
 public:
  bool Allowed(const std::string&, std::string_view, const Context&) const override {
    return true;
  }
};

// Refuses every data type for the configured servers.
class DenyListPolicy final : public EligibilityPolicy {
 public:
  explicit DenyListPolicy(std::set<std::string> denied_server_ids) : denied_(std::move(denied_server_ids)) {
  }

  bool Allowed(const std::string& server_id, std::string_view, const Context&) const override {
    return !denied_.contains(server_id);
  }

 private:
  std::set<std::string> denied_;
};

} // namespace beacon::ingest
