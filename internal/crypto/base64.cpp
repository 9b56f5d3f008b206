#include "internal/crypto/base64.hpp"

#include <openssl/evp.h>

#include <vector>

namespace beacon::crypto {

std::optional<std::string> DecodeBase64(std::string_view text) {
  if (text.empty()) return std::string();
  if (text.size() % 4 != 0) return std::nullopt;

  std::vector<unsigned char> out(text.size() / 4 * 3);
  const int n = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(text.data()), static_cast<int>(text.size()));
  if (n < 0) return std::nullopt;

  // EVP_DecodeBlock keeps the bytes produced by '=' padding
  std::size_t size    = static_cast<std::size_t>(n);
  std::size_t padding = 0;
  if (text.back() == '=') ++padding;
  if (text.size() >= 2 && text[text.size() - 2] == '=') ++padding;
  if (padding > size) return std::nullopt;
  size -= padding;

  return std::string(reinterpret_cast<const char*>(out.data()), size);
}

std::string EncodeBase64(std::string_view bytes) {
  if (bytes.empty()) return {};

  std::vector<unsigned char> out(4 * ((bytes.size() + 2) / 3) + 1);
  const int n = EVP_EncodeBlock(out.data(), reinterpret_cast<const unsigned char*>(bytes.data()), static_cast<int>(bytes.size()));
  return std::string(reinterpret_cast<const char*>(out.data()), static_cast<std::size_t>(n));
}

} // namespace beacon::crypto
