#ifndef PCLOUD_SIGNING_KEY_HPP
#define PCLOUD_SIGNING_KEY_HPP

#include <openssl/evp.h>

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "content_digest.hpp"
#include "crypto_error.hpp"

namespace pcloud::crypto {

using EVP_PKEY_ptr = std::unique_ptr<EVP_PKEY, void (*)(EVP_PKEY*)>;
using Bytes = std::vector<uint8_t>;

static constexpr size_t SIGNATURE_SIZE = 64;
static constexpr size_t PUBLIC_KEY_SIZE = 32;
static constexpr size_t SECRET_KEY_SIZE = 32;

using Signature = std::array<uint8_t, SIGNATURE_SIZE>;
using PublicKeyBytes = std::array<uint8_t, PUBLIC_KEY_SIZE>;

// Ed25519 public key. Doubles as the identity of a client.
class VerifyingKey {
public:
  explicit VerifyingKey(const PublicKeyBytes& bytes);

  // Throws KeyError unless exactly PUBLIC_KEY_SIZE bytes are given
  static VerifyingKey from_bytes(const uint8_t* data, size_t length);
  static VerifyingKey from_bytes(const Bytes& bytes) { return from_bytes(bytes.data(), bytes.size()); }

  const PublicKeyBytes& bytes() const { return bytes_; }

  // Strict Ed25519 verification, non-canonical signatures are rejected
  bool verify(const uint8_t* msg, size_t msg_len, const Signature& signature) const;
  bool verify(const Bytes& msg, const Signature& signature) const;
  // Finalizes the accumulator and verifies the signature over its digest
  bool verify_digest(ContentDigest digest, const Signature& signature) const;

  bool operator==(const VerifyingKey& other) const { return bytes_ == other.bytes_; }
  bool operator!=(const VerifyingKey& other) const { return !(*this == other); }

private:
  PublicKeyBytes bytes_;
};

// Ed25519 private key
class SigningKey {
public:
  // ---- CONSTRUCTION ----
  static SigningKey generate();
  static SigningKey from_secret(const Bytes& secret);
  // PKCS#8 PEM
  static SigningKey from_pem(const std::string& pem);

  SigningKey(SigningKey&&) = default;
  SigningKey& operator=(SigningKey&&) = default;


  // ---- EXPORT ----
  std::string to_pem() const;
  Bytes secret() const;
  VerifyingKey verifying_key() const;


  // ---- SIGNING ----
  // Ed25519 is deterministic: equal messages produce equal signatures
  Signature sign(const uint8_t* msg, size_t msg_len) const;
  Signature sign(const Bytes& msg) const;
  // Finalizes the accumulator and signs its digest
  Signature sign_digest(ContentDigest digest) const;

private:
  explicit SigningKey(EVP_PKEY* pkey);

  EVP_PKEY_ptr key_pair_;
};

} // namespace pcloud::crypto

#endif // PCLOUD_SIGNING_KEY_HPP
