#include "client/transfer_client.hpp"
#include <fstream>
#include <vector>
#include <boost/log/trivial.hpp>
#include "protocol/protocol_error.hpp"
#include "store/store.hpp"
#include "store/temp_file.hpp"

namespace pcloud {
namespace client {

namespace fs = std::filesystem;
namespace beast = boost::beast;

//==============================================
// CONSTRUCTOR
//==============================================

TransferClient::TransferClient(Api& api, const KeyStore& keystore, fs::path download_dir,
                               std::ostream& out)
  : api_(api), keystore_(keystore), download_dir_(std::move(download_dir)), out_(out) {}


//==============================================
// PUSH
//==============================================

void TransferClient::push(const fs::path& path) {
  std::string filename = path.filename().string();
  if (filename.empty()) {
    throw protocol::MalformedInputError("Path has no file name: " + path.string());
  }

  auto key = keystore_.get_signing_key();

  beast::error_code ec;
  beast::file file;
  file.open(path.string().c_str(), beast::file_mode::read, ec);
  if (ec) {
    throw protocol::IoError("Cannot open " + path.string() + ": " + ec.message());
  }

  out_ << "Signing " << path.string() << "..." << std::endl;
  auto digest = digest_file(file);
  std::uint64_t size = digest.bytes_processed();
  crypto::Signature file_signature = key.sign_digest(std::move(digest));

  auto request = protocol::SignableRequest::build(filename, key.verifying_key()).sign(key);

  file.seek(0, ec);
  if (ec) {
    throw protocol::IoError("Cannot rewind " + path.string() + ": " + ec.message());
  }

  BOOST_LOG_TRIVIAL(info) << "TransferClient: Pushing " << filename << " (" << size << " bytes)";
  out_ << "Uploading " << filename << " (" << size << " bytes)..." << std::endl;
  api_.push(request, file_signature, std::move(file));
  out_ << "OK" << std::endl;
}


//==============================================
// PULL
//==============================================

fs::path TransferClient::pull(const std::string& filename) {
  auto key = keystore_.get_signing_key();
  auto request = protocol::SignableRequest::build(filename, key.verifying_key()).sign(key);

  fs::create_directories(download_dir_);
  fs::path base = fs::canonical(download_dir_);

  fs::path destination = (base / filename).lexically_normal();
  if (!store::is_strict_descendant(base, destination)) {
    throw protocol::SandboxViolationError("Refusing to write " + filename + " outside " + base.string());
  }

  // Hidden scratch file in the download directory so the final rename stays on one filesystem
  auto temp = store::TempFile::create(base, ".pcloud-downloading");

  out_ << "Downloading " << filename << "..." << std::endl;
  crypto::Signature server_signature = api_.pull(request, temp.path());

  auto digest = digest_file(temp.path());
  std::uint64_t size = digest.bytes_processed();
  crypto::Signature own_signature = key.sign_digest(std::move(digest));

  // Ed25519 is deterministic, so an untampered payload reproduces the stored signature
  if (own_signature != server_signature) {
    BOOST_LOG_TRIVIAL(error) << "TransferClient: Signature mismatch for " << filename;
    throw protocol::IntegrityError("Signature mismatch");
  }

  fs::create_directories(destination.parent_path());
  temp.persist(destination);

  BOOST_LOG_TRIVIAL(info) << "TransferClient: Pulled " << filename << " (" << size << " bytes) to "
                          << destination.string();
  out_ << "OK " << destination.string() << std::endl;
  return destination;
}


//==============================================
// HELPERS
//==============================================

crypto::ContentDigest TransferClient::digest_file(beast::file& file) {
  crypto::ContentDigest digest;
  std::vector<char> buffer(64 * 1024);

  while (true) {
    beast::error_code ec;
    size_t read = file.read(buffer.data(), buffer.size(), ec);
    if (ec) {
      throw protocol::IoError("Failed to read local file: " + ec.message());
    }
    if (read == 0) {
      break;
    }
    digest.update(buffer.data(), read);
  }
  return digest;
}

crypto::ContentDigest TransferClient::digest_file(const fs::path& path) {
  std::ifstream input(path, std::ios::binary);
  if (!input) {
    throw protocol::IoError("Cannot open " + path.string());
  }
  crypto::ContentDigest digest;
  digest.update(input);
  return digest;
}

} // namespace client
} // namespace pcloud
