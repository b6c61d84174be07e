#ifndef PCLOUD_CLIENT_KEYSTORE_HPP
#define PCLOUD_CLIENT_KEYSTORE_HPP

#include <filesystem>
#include "crypto/signing_key.hpp"

namespace pcloud {
namespace client {

class KeyStore {
public:
  virtual ~KeyStore() = default;

  // Destructive: the previous identity loses access to its files
  virtual void regenerate_keypair() = 0;
  virtual crypto::SigningKey get_signing_key() const = 0;
};

// Keeps the private key as PKCS#8 PEM in an owner-only file
class FileKeyStore : public KeyStore {
public:
  explicit FileKeyStore(std::filesystem::path key_path) : key_path_(std::move(key_path)) {}

  void regenerate_keypair() override;
  crypto::SigningKey get_signing_key() const override;

  const std::filesystem::path& key_path() const { return key_path_; }

private:
  std::filesystem::path key_path_;
};

} // namespace client
} // namespace pcloud

#endif // PCLOUD_CLIENT_KEYSTORE_HPP
