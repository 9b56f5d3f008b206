#pragma once

#include <string>
#include <string_view>

namespace beacon::crypto {

inline constexpr std::size_t kEd25519PublicKeySize = 32;
inline constexpr std::size_t kEd25519SignatureSize = 64;

/*
  Ed25519 over OpenSSL EVP raw keys.

  Keys and signatures cross every boundary as base64 text.
*/

// False on bad base64, wrong key or signature length, or mismatch. Never throws.
bool VerifyEd25519(std::string_view public_key_b64, std::string_view signature_b64, std::string_view message);

struct Ed25519KeyPair {
  std::string public_key_b64;
  std::string private_key_b64; // 32-byte seed
};

// Agent-side helpers; throw std::runtime_error on OpenSSL failure.
Ed25519KeyPair GenerateEd25519KeyPair();
std::string    SignEd25519(std::string_view private_key_b64, std::string_view message);

} // namespace beacon::crypto
