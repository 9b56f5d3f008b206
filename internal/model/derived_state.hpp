#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace beacon::model {

enum class EffectiveStatus : std::uint8_t {
  kOnline  = 1,
  kOffline = 2,
  kUnknown = 3,
};

enum class Confidence : std::uint8_t {
  kGreen  = 1,
  kYellow = 2,
  kRed    = 3,
};

constexpr std::string_view ToString(EffectiveStatus status) {
  switch (status) {
    case EffectiveStatus::kOnline:
      return "online";
    case EffectiveStatus::kOffline:
      return "offline";
    case EffectiveStatus::kUnknown:
    default:
      return "unknown";
  }
}

constexpr std::string_view ToString(Confidence confidence) {
  switch (confidence) {
    case Confidence::kGreen:
      return "green";
    case Confidence::kYellow:
      return "yellow";
    case Confidence::kRed:
    default:
      return "red";
  }
}

constexpr std::optional<EffectiveStatus> ParseEffectiveStatus(std::string_view text) {
  if (text == "online") return EffectiveStatus::kOnline;
  if (text == "offline") return EffectiveStatus::kOffline;
  if (text == "unknown") return EffectiveStatus::kUnknown;
  return std::nullopt;
}

constexpr std::optional<Confidence> ParseConfidence(std::string_view text) {
  if (text == "green") return Confidence::kGreen;
  if (text == "yellow") return Confidence::kYellow;
  if (text == "red") return Confidence::kRed;
  return std::nullopt;
}

} // namespace beacon::model
