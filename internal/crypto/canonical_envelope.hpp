#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "internal/model/heartbeat.hpp"

namespace beacon::crypto {

/*
  Canonical heartbeat envelope.

  The signed bytes are a compact JSON object over a fixed whitelist:

    agent_version, heartbeat_id, key_version, map_name, players_capacity,
    players_current, server_id, status, timestamp

  Keys sorted, no whitespace, absent optionals as null, timestamp
  normalized to YYYY-MM-DDTHH:MM:SSZ, non-ASCII emitted as raw UTF-8.
  signature, debug payload and any extra field are never signed.
*/

// nullopt when the input is not RFC3339.
std::optional<std::string> NormalizeTimestamp(std::string_view timestamp);

// Throws util::InvalidArgument when the timestamp does not parse.
std::string CanonicalizeHeartbeat(const beacon::model::HeartbeatEnvelope& heartbeat);

// JSON string literal including the surrounding quotes.
std::string JsonQuote(std::string_view text);

// Verifies heartbeat.signature over CanonicalizeHeartbeat(heartbeat). Never throws.
bool VerifyHeartbeatSignature(const beacon::model::HeartbeatEnvelope& heartbeat, std::string_view public_key_b64);

} // namespace beacon::crypto
