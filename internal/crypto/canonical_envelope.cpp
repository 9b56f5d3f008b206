#include "internal/crypto/canonical_envelope.hpp"

#include <mutex>
#include <set>

#include "internal/crypto/ed25519.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace beacon::crypto {
namespace {

void WarnUnsignedField(const std::string& name) {
  static std::mutex            mutex;
  static std::set<std::string> seen;

  {
    std::lock_guard lock(mutex);
    if (!seen.insert(name).second) return;
  }
  BEACON_LOG_WARN("heartbeat field excluded from signature", {beacon::observability::StringField("field", name)});
}

void AppendOptString(std::string& out, const std::optional<std::string>& v) {
  out += v ? JsonQuote(*v) : "null";
}

void AppendOptInt(std::string& out, const std::optional<std::int64_t>& v) {
  out += v ? std::to_string(*v) : "null";
}

} // namespace

std::optional<std::string> NormalizeTimestamp(std::string_view timestamp) {
  auto tp = util::ParseRfc3339(timestamp);
  if (!tp) return std::nullopt;
  return util::FormatRfc3339Utc(*tp);
}

std::string JsonQuote(std::string_view text) {
  static constexpr char kHex[] = "0123456789abcdef";

  std::string out;
  out.reserve(text.size() + 2);
  out += '"';
  for (char ch : text) {
    const auto c = static_cast<unsigned char>(ch);
    switch (c) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\b':
        out += "\\b";
        break;
      case '\f':
        out += "\\f";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        if (c < 0x20) {
          out += "\\u00";
          out += kHex[c >> 4];
          out += kHex[c & 0x0f];
        } else {
          out += ch;
        }
    }
  }
  out += '"';
  return out;
}

std::string CanonicalizeHeartbeat(const beacon::model::HeartbeatEnvelope& heartbeat) {
  auto timestamp = NormalizeTimestamp(heartbeat.timestamp);
  if (!timestamp) {
    throw util::InvalidArgument("timestamp is not RFC3339: " + heartbeat.timestamp);
  }

  for (const auto& [name, _] : heartbeat.extra_fields) {
    WarnUnsignedField(name);
  }

  std::string out;
  out.reserve(256);
  out += "{\"agent_version\":";
  AppendOptString(out, heartbeat.agent_version);
  out += ",\"heartbeat_id\":";
  out += JsonQuote(heartbeat.heartbeat_id);
  out += ",\"key_version\":";
  out += std::to_string(heartbeat.key_version);
  out += ",\"map_name\":";
  AppendOptString(out, heartbeat.map_name);
  out += ",\"players_capacity\":";
  AppendOptInt(out, heartbeat.players_capacity);
  out += ",\"players_current\":";
  AppendOptInt(out, heartbeat.players_current);
  out += ",\"server_id\":";
  out += JsonQuote(heartbeat.server_id);
  out += ",\"status\":";
  out += JsonQuote(heartbeat.status);
  out += ",\"timestamp\":";
  out += JsonQuote(*timestamp);
  out += '}';
  return out;
}

bool VerifyHeartbeatSignature(const beacon::model::HeartbeatEnvelope& heartbeat, std::string_view public_key_b64) {
  auto timestamp = NormalizeTimestamp(heartbeat.timestamp);
  if (!timestamp) return false;
  return VerifyEd25519(public_key_b64, heartbeat.signature, CanonicalizeHeartbeat(heartbeat));
}

} // namespace beacon::crypto
