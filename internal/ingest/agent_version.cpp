#include "internal/ingest/agent_version.hpp"

#include <cctype>
#include <climits>

namespace beacon::ingest {
namespace {

std::string_view Trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return s;
}

int LeadingNumber(std::string_view part) {
  part = Trim(part);
  long long value = 0;
  for (char c : part) {
    if (!std::isdigit(static_cast<unsigned char>(c))) break;
    value = value * 10 + (c - '0');
    if (value > INT_MAX) return INT_MAX;
  }
  return static_cast<int>(value);
}

} // namespace

AgentVersion ParseAgentVersion(std::string_view text) {
  AgentVersion out{0, 0, 0};

  text = Trim(text);
  if (auto cut = text.find_first_of("-+"); cut != std::string_view::npos) {
    text = text.substr(0, cut);
  }

  for (std::size_t i = 0; i < out.size(); ++i) {
    const auto dot = text.find('.');
    out[i]         = LeadingNumber(text.substr(0, dot));
    if (dot == std::string_view::npos) break;
    text.remove_prefix(dot + 1);
  }
  return out;
}

bool IsVersionAtLeast(std::string_view version, std::string_view minimum) {
  return ParseAgentVersion(version) >= ParseAgentVersion(minimum);
}

} // namespace beacon::ingest
