#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace beacon::crypto {

// Standard alphabet with padding. nullopt on any malformed input.
std::optional<std::string> DecodeBase64(std::string_view text);

std::string EncodeBase64(std::string_view bytes);

} // namespace beacon::crypto
