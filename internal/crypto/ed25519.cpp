#include "internal/crypto/ed25519.hpp"

#include <openssl/evp.h>

#include <memory>
#include <stdexcept>

#include "internal/crypto/base64.hpp"

namespace beacon::crypto {
namespace {

struct PkeyDeleter {
  void operator()(EVP_PKEY* p) const {
    EVP_PKEY_free(p);
  }
};

struct MdCtxDeleter {
  void operator()(EVP_MD_CTX* c) const {
    EVP_MD_CTX_free(c);
  }
};

struct PkeyCtxDeleter {
  void operator()(EVP_PKEY_CTX* c) const {
    EVP_PKEY_CTX_free(c);
  }
};

using PkeyPtr    = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using MdCtxPtr   = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter>;

const unsigned char* Bytes(std::string_view s) {
  return reinterpret_cast<const unsigned char*>(s.data());
}

std::string RawKey(EVP_PKEY* key, bool is_private) {
  std::size_t len = 0;
  int         ok  = is_private ? EVP_PKEY_get_raw_private_key(key, nullptr, &len) : EVP_PKEY_get_raw_public_key(key, nullptr, &len);
  if (ok != 1) throw std::runtime_error("ed25519: cannot size raw key");

  std::string out(len, '\0');
  auto*       dst = reinterpret_cast<unsigned char*>(out.data());
  ok              = is_private ? EVP_PKEY_get_raw_private_key(key, dst, &len) : EVP_PKEY_get_raw_public_key(key, dst, &len);
  if (ok != 1) throw std::runtime_error("ed25519: cannot export raw key");
  out.resize(len);
  return out;
}

} // namespace

bool VerifyEd25519(std::string_view public_key_b64, std::string_view signature_b64, std::string_view message) {
  auto public_key = DecodeBase64(public_key_b64);
  auto signature  = DecodeBase64(signature_b64);
  if (!public_key || public_key->size() != kEd25519PublicKeySize) return false;
  if (!signature || signature->size() != kEd25519SignatureSize) return false;

  PkeyPtr key(EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, Bytes(*public_key), public_key->size()));
  if (!key) return false;

  MdCtxPtr ctx(EVP_MD_CTX_new());
  if (!ctx) return false;
  if (EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, key.get()) != 1) return false;

  return EVP_DigestVerify(ctx.get(), Bytes(*signature), signature->size(), Bytes(message), message.size()) == 1;
}

Ed25519KeyPair GenerateEd25519KeyPair() {
  PkeyCtxPtr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr));
  if (!ctx || EVP_PKEY_keygen_init(ctx.get()) != 1) {
    throw std::runtime_error("ed25519: keygen init failed");
  }

  EVP_PKEY* raw = nullptr;
  if (EVP_PKEY_keygen(ctx.get(), &raw) != 1) {
    throw std::runtime_error("ed25519: keygen failed");
  }
  PkeyPtr key(raw);

  Ed25519KeyPair pair;
  pair.public_key_b64  = EncodeBase64(RawKey(key.get(), false));
  pair.private_key_b64 = EncodeBase64(RawKey(key.get(), true));
  return pair;
}

std::string SignEd25519(std::string_view private_key_b64, std::string_view message) {
  auto seed = DecodeBase64(private_key_b64);
  if (!seed || seed->size() != kEd25519PublicKeySize) {
    throw std::runtime_error("ed25519: private key must be 32 bytes of base64");
  }

  PkeyPtr key(EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, Bytes(*seed), seed->size()));
  if (!key) throw std::runtime_error("ed25519: invalid private key");

  MdCtxPtr ctx(EVP_MD_CTX_new());
  if (!ctx || EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, key.get()) != 1) {
    throw std::runtime_error("ed25519: sign init failed");
  }

  std::string signature(kEd25519SignatureSize, '\0');
  std::size_t len = signature.size();
  if (EVP_DigestSign(ctx.get(), reinterpret_cast<unsigned char*>(signature.data()), &len, Bytes(message), message.size()) != 1) {
    throw std::runtime_error("ed25519: sign failed");
  }
  signature.resize(len);
  return EncodeBase64(signature);
}

} // namespace beacon::crypto
