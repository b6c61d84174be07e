#ifndef PCLOUD_CLIENT_TRANSFER_CLIENT_HPP
#define PCLOUD_CLIENT_TRANSFER_CLIENT_HPP

#include <filesystem>
#include <ostream>
#include <string>
#include "client/api.hpp"
#include "client/keystore.hpp"

namespace pcloud {
namespace client {

// Signs local files for upload and verifies downloads before they are visible
// in the download directory.
class TransferClient {
public:

  // ---- CONSTRUCTOR ----
  TransferClient(Api& api, const KeyStore& keystore, std::filesystem::path download_dir,
                 std::ostream& out);


  // ---- TRANSFERS ----
  // Uploads path under its final component name
  void push(const std::filesystem::path& path);
  // Downloads filename and returns where it was placed. Nothing is written to
  // the destination unless the content matches the client's own signature.
  std::filesystem::path pull(const std::string& filename);

private:
  // ---- PARAMETERS ----
  Api& api_;
  const KeyStore& keystore_;
  std::filesystem::path download_dir_;
  std::ostream& out_;

  // ---- HELPERS ----
  static crypto::ContentDigest digest_file(boost::beast::file& file);
  static crypto::ContentDigest digest_file(const std::filesystem::path& path);
};

} // namespace client
} // namespace pcloud

#endif // PCLOUD_CLIENT_TRANSFER_CLIENT_HPP
