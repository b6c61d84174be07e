#pragma once

#include <array>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <boost/beast/core/file.hpp>
#include "crypto/signing_key.hpp"
#include "store/temp_file.hpp"

namespace pcloud {
namespace store {

// Final on-disk locations of one stored artifact
struct ArtifactPaths {
  std::filesystem::path payload;
  std::filesystem::path signature;
};

// A stored artifact opened for reading. The open payload keeps its contents
// even if a later commit replaces the file at the final path.
struct StoredArtifact {
  crypto::Signature signature;
  boost::beast::file payload;
};

// True if path names something strictly below base. Both paths must already be
// lexically normal.
bool is_strict_descendant(const std::filesystem::path& base, const std::filesystem::path& path);

class Store {
public:

  // ---- CONSTRUCTOR ----
  // Creates and canonicalizes the storage root and the scratch area
  Store(const std::filesystem::path& storage_root, const std::filesystem::path& scratch_dir);


  // ---- NAMESPACE RESOLUTION ----
  // storage_root / base58(pubkey) / filename, with ".sig" appended for the signature.
  // Throws SandboxViolationError if the result escapes the identity's namespace.
  static ArtifactPaths resolve(const std::filesystem::path& storage_root,
                               const crypto::VerifyingKey& pubkey,
                               const std::string& filename);
  ArtifactPaths resolve(const crypto::VerifyingKey& pubkey, const std::string& filename) const;


  // ---- CORE STORAGE OPERATIONS ----
  // Opens a fresh upload scratch file
  TempFile create_temp_file() const;
  // Durably flushes the payload, writes its signature, then renames the payload
  // into place. The signature is visible before the payload. If the payload
  // rename fails the previous signature is put back.
  void commit(TempFile& payload, const ArtifactPaths& paths, const crypto::Signature& signature);
  // Reads the signature and opens the payload as one consistent pair with
  // respect to commit(). Throws NotFoundError or IoError.
  StoredArtifact open_artifact(const ArtifactPaths& paths) const;
  // Throws NotFoundError when either half of the artifact is missing
  crypto::Signature read_signature(const ArtifactPaths& paths) const;
  bool has(const ArtifactPaths& paths) const;


  // ---- GETTERS ----
  const std::filesystem::path& root() const { return storage_root_; }
  const std::filesystem::path& scratch_dir() const { return scratch_dir_; }

private:
  // ---- PARAMETERS ----
  std::filesystem::path storage_root_;
  std::filesystem::path scratch_dir_;
  // Striped locks serializing commits to the same payload path
  static constexpr size_t COMMIT_LOCK_STRIPES = 64;
  mutable std::array<std::mutex, COMMIT_LOCK_STRIPES> commit_locks_;

  // Ensures directory exists, create if needed
  static void check_directory_exists(const std::filesystem::path& path);
  std::mutex& commit_lock_for(const std::filesystem::path& payload) const;
  crypto::Signature read_signature_unlocked(const ArtifactPaths& paths) const;
  // Copy of the current signature file, if any, kept until the commit is done
  static std::optional<TempFile> backup_signature(const ArtifactPaths& paths);
  static void restore_signature(const ArtifactPaths& paths, std::optional<TempFile>& backup) noexcept;
};

} // namespace store
} // namespace pcloud
