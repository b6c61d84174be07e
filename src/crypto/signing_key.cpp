#include "crypto/signing_key.hpp"

#include <algorithm>
#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <boost/log/trivial.hpp>

namespace pcloud::crypto {

using EVP_MD_CTX_ptr = std::unique_ptr<EVP_MD_CTX, void (*)(EVP_MD_CTX*)>;
using BIO_ptr = std::unique_ptr<BIO, int (*)(BIO*)>;

namespace {

EVP_PKEY_ptr make_public_key(const PublicKeyBytes& bytes) {
  EVP_PKEY* pkey = EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, bytes.data(), bytes.size());
  if (!pkey) {
    throw KeyError("Failed to import public key");
  }
  return EVP_PKEY_ptr(pkey, EVP_PKEY_free);
}

} // namespace


//==============================================
// VERIFYING KEY
//==============================================

VerifyingKey::VerifyingKey(const PublicKeyBytes& bytes) : bytes_(bytes) {}

VerifyingKey VerifyingKey::from_bytes(const uint8_t* data, size_t length) {
  if (length != PUBLIC_KEY_SIZE) {
    throw KeyError("Invalid public key size: " + std::to_string(length));
  }
  PublicKeyBytes bytes;
  std::copy(data, data + length, bytes.begin());
  // Reject anything OpenSSL refuses to load as an Ed25519 point
  make_public_key(bytes);
  return VerifyingKey(bytes);
}

bool VerifyingKey::verify(const uint8_t* msg, size_t msg_len, const Signature& signature) const {
  auto pkey = make_public_key(bytes_);
  EVP_MD_CTX_ptr mdctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
  if (!mdctx || 1 != EVP_DigestVerifyInit(mdctx.get(), nullptr, nullptr, nullptr, pkey.get())) {
    throw CryptoError("Failed to initialize DigestVerify");
  }
  return 1 == EVP_DigestVerify(mdctx.get(), signature.data(), signature.size(), msg, msg_len);
}

bool VerifyingKey::verify(const Bytes& msg, const Signature& signature) const {
  return verify(msg.data(), msg.size(), signature);
}

bool VerifyingKey::verify_digest(ContentDigest digest, const Signature& signature) const {
  const auto value = digest.finalize();
  return verify(value.data(), value.size(), signature);
}


//==============================================
// SIGNING KEY CONSTRUCTION
//==============================================

SigningKey::SigningKey(EVP_PKEY* pkey) : key_pair_(pkey, EVP_PKEY_free) {}

SigningKey SigningKey::generate() {
  EVP_PKEY* pkey = nullptr;
  EVP_PKEY_CTX* pctx = EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr);
  if (pctx) {
    if (1 != EVP_PKEY_keygen_init(pctx) || 1 != EVP_PKEY_keygen(pctx, &pkey)) {
      pkey = nullptr;
    }
    EVP_PKEY_CTX_free(pctx);
  }
  if (!pkey) {
    throw KeyError("Failed to generate key");
  }
  BOOST_LOG_TRIVIAL(debug) << "Signing key: Generated new Ed25519 keypair";
  return SigningKey(pkey);
}

SigningKey SigningKey::from_secret(const Bytes& secret) {
  if (secret.size() != SECRET_KEY_SIZE) {
    throw KeyError("Invalid secret key size: " + std::to_string(secret.size()));
  }
  EVP_PKEY* pkey = EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, secret.data(), secret.size());
  if (!pkey) {
    throw KeyError("Failed to import secret key");
  }
  return SigningKey(pkey);
}

SigningKey SigningKey::from_pem(const std::string& pem) {
  BIO_ptr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())), BIO_free);
  if (!bio) {
    throw KeyError("Failed to allocate BIO");
  }
  EVP_PKEY* pkey = PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr);
  if (!pkey) {
    throw KeyError("Failed to read private key");
  }
  if (EVP_PKEY_id(pkey) != EVP_PKEY_ED25519) {
    EVP_PKEY_free(pkey);
    throw KeyError("Private key is not an Ed25519 key");
  }
  return SigningKey(pkey);
}


//==============================================
// EXPORT
//==============================================

std::string SigningKey::to_pem() const {
  BIO_ptr bio(BIO_new(BIO_s_mem()), BIO_free);
  if (!bio || 1 != PEM_write_bio_PrivateKey(bio.get(), key_pair_.get(), nullptr, nullptr, 0, nullptr, nullptr)) {
    throw KeyError("Failed to export private key");
  }
  char* data = nullptr;
  long length = BIO_get_mem_data(bio.get(), &data);
  return std::string(data, static_cast<size_t>(length));
}

Bytes SigningKey::secret() const {
  size_t len = 0;
  EVP_PKEY_get_raw_private_key(key_pair_.get(), nullptr, &len);
  Bytes secret(len, 0);
  if (1 != EVP_PKEY_get_raw_private_key(key_pair_.get(), secret.data(), &len)) {
    throw KeyError("Failed to export secret key");
  }
  return secret;
}

VerifyingKey SigningKey::verifying_key() const {
  PublicKeyBytes bytes{};
  size_t len = bytes.size();
  if (1 != EVP_PKEY_get_raw_public_key(key_pair_.get(), bytes.data(), &len) || len != PUBLIC_KEY_SIZE) {
    throw KeyError("Failed to export public key");
  }
  return VerifyingKey(bytes);
}


//==============================================
// SIGNING
//==============================================

Signature SigningKey::sign(const uint8_t* msg, size_t msg_len) const {
  EVP_MD_CTX_ptr mdctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
  size_t sig_len = 0;
  if (!mdctx ||
      1 != EVP_DigestSignInit(mdctx.get(), nullptr, nullptr, nullptr, key_pair_.get()) ||
      1 != EVP_DigestSign(mdctx.get(), nullptr, &sig_len, nullptr, 0)) {
    throw SigningError("Failed to initialize DigestSign");
  }
  if (sig_len != SIGNATURE_SIZE) {
    throw SigningError("Unexpected signature size");
  }
  Signature sig{};
  if (1 != EVP_DigestSign(mdctx.get(), sig.data(), &sig_len, msg, msg_len)) {
    throw SigningError("Failed to sign message");
  }
  return sig;
}

Signature SigningKey::sign(const Bytes& msg) const {
  return sign(msg.data(), msg.size());
}

Signature SigningKey::sign_digest(ContentDigest digest) const {
  const auto value = digest.finalize();
  return sign(value.data(), value.size());
}

} // namespace pcloud::crypto
