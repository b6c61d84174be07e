#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "crypto/content_digest.hpp"
#include "crypto/signing_key.hpp"
#include "test_utils.hpp"

using namespace pcloud::crypto;

namespace {

Bytes from_hex(const std::string& hex) {
  Bytes out;
  for (size_t i = 0; i + 1 < hex.size(); i += 2) {
    out.push_back(static_cast<uint8_t>(std::stoi(hex.substr(i, 2), nullptr, 16)));
  }
  return out;
}

} // namespace

// RFC 8032 section 7.1, test 1
TEST(SigningKeyTest, Rfc8032Vector) {
  auto key = SigningKey::from_secret(from_hex("9d61b19deffd5a60ba844af492ec2cc44449c5697b326919703bac031cae7f60"));

  auto pubkey = key.verifying_key().bytes();
  EXPECT_EQ(Bytes(pubkey.begin(), pubkey.end()),
            from_hex("d75a980182b10ab7d54bfed3c964073a0ee172f3daa62325af021a68f707511a"));

  auto sig = key.sign(Bytes{});
  EXPECT_EQ(Bytes(sig.begin(), sig.end()),
            from_hex("e5564300c360ac729086e2cc806e828a84877f1eb8e5d974d873e065224901555"
                     "fb8821590a33bacc61e39701cf9b46bd25bf5f0595bbe24655141438e7a100b"));
}

TEST(SigningKeyTest, SignAndVerify) {
  auto key = SigningKey::generate();
  Bytes msg = {'p', 'c', 'l', 'o', 'u', 'd'};
  auto sig = key.sign(msg);

  EXPECT_TRUE(key.verifying_key().verify(msg, sig));

  Bytes tampered = msg;
  tampered[0] ^= 0x01;
  EXPECT_FALSE(key.verifying_key().verify(tampered, sig));

  auto other = SigningKey::generate();
  EXPECT_FALSE(other.verifying_key().verify(msg, sig));
}

TEST(SigningKeyTest, SignaturesAreDeterministic) {
  auto key = SigningKey::generate();
  Bytes msg(100, 0x42);
  EXPECT_EQ(key.sign(msg), key.sign(msg));
}

TEST(SigningKeyTest, DigestSignature) {
  auto key = SigningKey::generate();

  ContentDigest signed_digest;
  signed_digest.update("hello");
  auto sig = key.sign_digest(std::move(signed_digest));

  ContentDigest same;
  same.update("hel");
  same.update("lo");
  EXPECT_TRUE(key.verifying_key().verify_digest(std::move(same), sig));

  ContentDigest different;
  different.update("hello!");
  EXPECT_FALSE(key.verifying_key().verify_digest(std::move(different), sig));
}

TEST(SigningKeyTest, PemRoundTripKeepsIdentity) {
  auto key = SigningKey::generate();
  auto pem = key.to_pem();
  EXPECT_NE(pem.find("BEGIN PRIVATE KEY"), std::string::npos);

  auto restored = SigningKey::from_pem(pem);
  EXPECT_EQ(restored.verifying_key(), key.verifying_key());
  EXPECT_EQ(restored.secret(), key.secret());
}

TEST(SigningKeyTest, InvalidKeyMaterial) {
  EXPECT_THROW(SigningKey::from_pem("not a pem"), KeyError);
  EXPECT_THROW(SigningKey::from_secret(Bytes(31, 1)), KeyError);
  EXPECT_THROW(VerifyingKey::from_bytes(Bytes(33, 1)), KeyError);
  EXPECT_THROW(VerifyingKey::from_bytes(Bytes{}), KeyError);
}

TEST(SigningKeyTest, NonCanonicalScalarRejected) {
  auto key = SigningKey::generate();
  Bytes msg = {'p', 'c', 'l', 'o', 'u', 'd'};
  auto sig = key.sign(msg);
  auto malleated = with_malleated_scalar(sig);

  ASSERT_NE(malleated, sig);
  EXPECT_TRUE(key.verifying_key().verify(msg, sig));
  EXPECT_FALSE(key.verifying_key().verify(msg, malleated));

  ContentDigest digest;
  digest.update("payload");
  ContentDigest same;
  same.update("payload");
  auto digest_sig = key.sign_digest(std::move(digest));
  EXPECT_FALSE(key.verifying_key().verify_digest(std::move(same), with_malleated_scalar(digest_sig)));
}
