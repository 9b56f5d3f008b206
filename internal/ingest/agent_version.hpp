#pragma once

#include <array>
#include <string_view>

namespace beacon::ingest {

using AgentVersion = std::array<int, 3>;

// "X", "X.Y" or "X.Y.Z"; -/+ suffixes and non-digit tails dropped,
// missing parts 0. Empty or unparseable input is 0.0.0.
AgentVersion ParseAgentVersion(std::string_view text);

bool IsVersionAtLeast(std::string_view version, std::string_view minimum);

} // namespace beacon::ingest
