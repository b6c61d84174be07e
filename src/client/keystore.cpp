#include "client/keystore.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>
#include <boost/log/trivial.hpp>
#include "store/temp_file.hpp"

namespace pcloud {
namespace client {

namespace fs = std::filesystem;

void FileKeyStore::regenerate_keypair() {
  BOOST_LOG_TRIVIAL(info) << "Keystore: Regenerating keypair at " << key_path_.string();

  auto dir = key_path_.parent_path();
  if (dir.empty()) {
    dir = ".";
  }
  if (!fs::exists(dir)) {
    fs::create_directories(dir);
    fs::permissions(dir, fs::perms::owner_all, fs::perm_options::replace);
  }

  auto key = crypto::SigningKey::generate();
  std::string pem = key.to_pem();

  // Written beside the target with 0600 and renamed, so a crash never leaves a partial key
  auto file = store::TempFile::create(dir, ".signing-key");
  file.append(pem.data(), pem.size());
  file.sync();
  file.persist(key_path_);

  std::fill(pem.begin(), pem.end(), '\0');
}

crypto::SigningKey FileKeyStore::get_signing_key() const {
  std::ifstream file(key_path_, std::ios::binary);
  if (!file) {
    throw crypto::KeyError("No signing key at " + key_path_.string() + ", run `pcloud regenerate-keys` first");
  }

  std::stringstream pem;
  pem << file.rdbuf();
  std::string text = pem.str();
  auto key = crypto::SigningKey::from_pem(text);
  std::fill(text.begin(), text.end(), '\0');
  return key;
}

} // namespace client
} // namespace pcloud
