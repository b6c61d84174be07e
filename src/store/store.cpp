#include "store/store.hpp"
#include <algorithm>
#include <fstream>
#include <iterator>
#include <boost/log/trivial.hpp>
#include "protocol/constants.hpp"
#include "protocol/protocol_error.hpp"
#include "protocol/signed_request.hpp"

namespace pcloud {
namespace store {

namespace fs = std::filesystem;

namespace {

constexpr const char* UPLOAD_PREFIX = "pcloud-uploading";

bool ends_with(const std::string& value, const std::string& suffix) {
  return value.size() >= suffix.size() &&
         value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Throws MalformedInputError for an over-long path, IoError for other stat failures
bool is_regular(const fs::path& path) {
  std::error_code ec;
  const auto status = fs::status(path, ec);
  if (ec == std::errc::filename_too_long) {
    throw protocol::MalformedInputError("Filename too long");
  }
  if (status.type() == fs::file_type::not_found) {
    return false;
  }
  if (ec) {
    throw protocol::IoError("Failed to stat " + path.string() + ": " + ec.message());
  }
  return fs::is_regular_file(status);
}

} // namespace

bool is_strict_descendant(const fs::path& base, const fs::path& path) {
  auto [base_end, path_it] = std::mismatch(base.begin(), base.end(), path.begin(), path.end());
  if (base_end != base.end()) {
    return false;
  }
  // A trailing separator shows up as an empty component
  bool has_component = false;
  for (; path_it != path.end(); ++path_it) {
    if (path_it->empty() || *path_it == "." || *path_it == "..") {
      return false;
    }
    has_component = true;
  }
  return has_component;
}


//==============================================
// CONSTRUCTOR
//==============================================

Store::Store(const fs::path& storage_root, const fs::path& scratch_dir) {
  BOOST_LOG_TRIVIAL(info) << "Store: Initializing Store with base path: " << storage_root.string();
  check_directory_exists(storage_root);
  storage_root_ = fs::canonical(storage_root);

  auto scratch = scratch_dir.empty() ? storage_root_ / ".scratch" : scratch_dir;
  check_directory_exists(scratch);
  scratch_dir_ = fs::canonical(scratch);
  BOOST_LOG_TRIVIAL(debug) << "Store: Storage root " << storage_root_.string()
                           << ", scratch area " << scratch_dir_.string();
}


//==============================================
// NAMESPACE RESOLUTION
//==============================================

ArtifactPaths Store::resolve(const fs::path& storage_root, const crypto::VerifyingKey& pubkey,
                             const std::string& filename) {
  if (filename.empty()) {
    throw protocol::SandboxViolationError("Empty filename");
  }
  if (filename.find('\0') != std::string::npos) {
    throw protocol::MalformedInputError("Filename contains a NUL byte");
  }
  if (ends_with(filename, protocol::SIGNATURE_EXTENSION)) {
    throw protocol::MalformedInputError("Filename must not end with " +
                                        std::string(protocol::SIGNATURE_EXTENSION));
  }

  for (const auto& component : fs::path(filename)) {
    if (component.native().size() > protocol::MAX_NAME_COMPONENT_LENGTH) {
      throw protocol::MalformedInputError("Filename component too long");
    }
  }

  const fs::path namespace_dir = (storage_root / protocol::encode_pubkey(pubkey)).lexically_normal();
  const fs::path payload = (namespace_dir / filename).lexically_normal();

  if (!is_strict_descendant(namespace_dir, payload)) {
    BOOST_LOG_TRIVIAL(warning) << "Store: Rejected filename outside namespace: " << filename;
    throw protocol::SandboxViolationError("Trying to get path outside storage directory");
  }

  fs::path signature = payload;
  signature += protocol::SIGNATURE_EXTENSION;

  BOOST_LOG_TRIVIAL(debug) << "Store: Resolved " << filename << " to " << payload.string();
  return ArtifactPaths{payload, signature};
}

ArtifactPaths Store::resolve(const crypto::VerifyingKey& pubkey, const std::string& filename) const {
  return resolve(storage_root_, pubkey, filename);
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

TempFile Store::create_temp_file() const {
  return TempFile::create(scratch_dir_, UPLOAD_PREFIX);
}

void Store::commit(TempFile& payload, const ArtifactPaths& paths, const crypto::Signature& signature) {
  BOOST_LOG_TRIVIAL(info) << "Store: Committing " << payload.size() << " bytes to " << paths.payload.string();

  payload.sync();

  std::error_code ec;
  fs::create_directories(paths.payload.parent_path(), ec);
  if (ec) {
    throw protocol::IoError("Failed to create directory " + paths.payload.parent_path().string() +
                            ": " + ec.message());
  }

  std::lock_guard<std::mutex> lock(commit_lock_for(paths.payload));
  auto previous_signature = backup_signature(paths);

  // The signature goes through its own temporary so it is never seen half written
  auto signature_file = TempFile::create(paths.signature.parent_path(), ".pcloud-signature");
  signature_file.append(signature.data(), signature.size());
  signature_file.sync();
  signature_file.persist(paths.signature);

  try {
    payload.persist(paths.payload);
  } catch (const protocol::IoError& e) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to publish " << paths.payload.string() << ": " << e.what();
    restore_signature(paths, previous_signature);
    throw;
  }
  BOOST_LOG_TRIVIAL(info) << "Store: File written to: " << paths.payload.string();
}

StoredArtifact Store::open_artifact(const ArtifactPaths& paths) const {
  std::lock_guard<std::mutex> lock(commit_lock_for(paths.payload));

  StoredArtifact artifact;
  artifact.signature = read_signature_unlocked(paths);

  boost::beast::error_code ec;
  artifact.payload.open(paths.payload.c_str(), boost::beast::file_mode::scan, ec);
  if (ec == boost::system::errc::no_such_file_or_directory) {
    throw protocol::NotFoundError("File not found");
  }
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to open " << paths.payload.string() << ": " << ec.message();
    throw protocol::IoError("Failed to open file: " + ec.message());
  }
  return artifact;
}

crypto::Signature Store::read_signature(const ArtifactPaths& paths) const {
  std::lock_guard<std::mutex> lock(commit_lock_for(paths.payload));
  return read_signature_unlocked(paths);
}

crypto::Signature Store::read_signature_unlocked(const ArtifactPaths& paths) const {
  if (!is_regular(paths.payload) || !is_regular(paths.signature)) {
    BOOST_LOG_TRIVIAL(debug) << "Store: File not found: " << paths.payload.string();
    throw protocol::NotFoundError("File not found");
  }

  std::ifstream file(paths.signature, std::ios::binary);
  if (!file) {
    throw protocol::IoError("Failed to open signature file");
  }

  crypto::Signature signature{};
  file.read(reinterpret_cast<char*>(signature.data()), static_cast<std::streamsize>(signature.size()));
  if (file.gcount() != static_cast<std::streamsize>(signature.size()) || file.get() != std::ifstream::traits_type::eof()) {
    BOOST_LOG_TRIVIAL(error) << "Store: Corrupt signature file: " << paths.signature.string();
    throw protocol::IoError("Corrupt signature file");
  }
  return signature;
}

bool Store::has(const ArtifactPaths& paths) const {
  return is_regular(paths.payload) && is_regular(paths.signature);
}


//==============================================
// UTILITY METHODS
//==============================================

void Store::check_directory_exists(const fs::path& path) {
  std::error_code ec;
  if (fs::is_directory(path, ec)) {
    return;
  }
  fs::create_directories(path, ec);
  if (ec) {
    throw protocol::IoError("Failed to create directory " + path.string() + ": " + ec.message());
  }
}

std::mutex& Store::commit_lock_for(const fs::path& payload) const {
  return commit_locks_[std::hash<std::string>{}(payload.string()) % COMMIT_LOCK_STRIPES];
}

std::optional<TempFile> Store::backup_signature(const ArtifactPaths& paths) {
  std::ifstream existing(paths.signature, std::ios::binary);
  if (!existing) {
    return std::nullopt;
  }
  const std::string bytes((std::istreambuf_iterator<char>(existing)), std::istreambuf_iterator<char>());

  auto backup = TempFile::create(paths.signature.parent_path(), ".pcloud-signature-backup");
  backup.append(bytes.data(), bytes.size());
  backup.sync();
  return std::optional<TempFile>(std::move(backup));
}

void Store::restore_signature(const ArtifactPaths& paths, std::optional<TempFile>& backup) noexcept {
  try {
    if (backup) {
      backup->persist(paths.signature);
      BOOST_LOG_TRIVIAL(info) << "Store: Restored previous signature " << paths.signature.string();
      return;
    }
    std::error_code ec;
    fs::remove(paths.signature, ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "Store: Failed to remove " << paths.signature.string() << ": " << ec.message();
    }
  } catch (const protocol::IoError& e) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to restore signature " << paths.signature.string() << ": " << e.what();
  }
}

} // namespace store
} // namespace pcloud
