#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <filesystem>
#include "client/keystore.hpp"
#include "crypto/crypto_error.hpp"
#include "test_utils.hpp"

using namespace pcloud;
using ::testing::HasSubstr;
namespace fs = std::filesystem;

class KeyStoreTest : public ::testing::Test {
protected:
  fs::path test_dir;

  void SetUp() override {
    test_dir = make_test_dir("keystore_test");
  }

  void TearDown() override {
    fs::remove_all(test_dir);
  }
};

TEST_F(KeyStoreTest, MissingKeyTellsUserToRegenerate) {
  client::FileKeyStore keystore(test_dir / "missing.pem");
  try {
    keystore.get_signing_key();
    FAIL() << "Expected KeyError";
  } catch (const crypto::KeyError& e) {
    EXPECT_THAT(e.what(), HasSubstr("regenerate-keys"));
  }
}

TEST_F(KeyStoreTest, RegenerateCreatesOwnerOnlyKey) {
  auto key_path = test_dir / "nested" / "signing_key.pem";
  client::FileKeyStore keystore(key_path);
  keystore.regenerate_keypair();

  ASSERT_TRUE(fs::exists(key_path));
  EXPECT_EQ((fs::status(key_path).permissions() & fs::perms::all),
            fs::perms::owner_read | fs::perms::owner_write);
  EXPECT_THAT(read_file(key_path), HasSubstr("BEGIN PRIVATE KEY"));

  // No scratch files left beside the key
  EXPECT_EQ(count_entries(key_path.parent_path()), 1u);
}

TEST_F(KeyStoreTest, KeyIsStableUntilRegenerated) {
  client::FileKeyStore keystore(test_dir / "signing_key.pem");
  keystore.regenerate_keypair();

  auto first = keystore.get_signing_key().verifying_key();
  EXPECT_EQ(keystore.get_signing_key().verifying_key(), first);

  client::FileKeyStore reopened(test_dir / "signing_key.pem");
  EXPECT_EQ(reopened.get_signing_key().verifying_key(), first);

  keystore.regenerate_keypair();
  EXPECT_NE(keystore.get_signing_key().verifying_key(), first);
}

TEST_F(KeyStoreTest, CorruptKeyFile) {
  write_file(test_dir / "bad.pem", "garbage");
  client::FileKeyStore keystore(test_dir / "bad.pem");
  EXPECT_THROW(keystore.get_signing_key(), crypto::KeyError);
}
