#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "crypto/signing_key.hpp"
#include "protocol/constants.hpp"
#include "protocol/protocol_error.hpp"
#include "protocol/signed_request.hpp"
#include "test_utils.hpp"

using namespace pcloud;
using namespace pcloud::protocol;
using ::testing::ElementsAre;

class SignedRequestTest : public ::testing::Test {
protected:
  crypto::SigningKey key = crypto::SigningKey::generate();
  const std::uint64_t now = 1700000000;

  SignedRequest sign_at(const std::string& filename, std::uint64_t time) {
    return SignableRequest::build_with_time(filename, key.verifying_key(), time).sign(key);
  }
};

TEST_F(SignedRequestTest, CanonicalEncodingLayout) {
  auto request = SignableRequest::build_with_time("abc", key.verifying_key(), 0x0102030405060708ULL);
  auto encoded = request.canonical_encoding();

  ASSERT_EQ(encoded.size(), 4u + 3u + crypto::PUBLIC_KEY_SIZE + 8u);
  EXPECT_THAT(std::vector<uint8_t>(encoded.begin(), encoded.begin() + 4), ElementsAre(3, 0, 0, 0));
  EXPECT_EQ(std::string(encoded.begin() + 4, encoded.begin() + 7), "abc");

  const auto& pubkey = key.verifying_key().bytes();
  EXPECT_TRUE(std::equal(pubkey.begin(), pubkey.end(), encoded.begin() + 7));

  EXPECT_THAT(std::vector<uint8_t>(encoded.end() - 8, encoded.end()),
              ElementsAre(0x08, 0x07, 0x06, 0x05, 0x04, 0x03, 0x02, 0x01));
}

TEST_F(SignedRequestTest, FreshRequestVerifies) {
  auto request = sign_at("notes.txt", now);
  EXPECT_NO_THROW(request.request().check_signature(request.signature(), now));
  EXPECT_NO_THROW(request.request().check_signature(request.signature(), now + MAX_TIME_DIFF));
  EXPECT_NO_THROW(request.request().check_signature(request.signature(), now - MAX_TIME_DIFF));
}

TEST_F(SignedRequestTest, StaleRequestRejectedEvenWithValidSignature) {
  auto request = sign_at("notes.txt", now);
  EXPECT_THROW(request.request().check_signature(request.signature(), now + MAX_TIME_DIFF + 1),
               AuthenticationError);
  EXPECT_THROW(request.request().check_signature(request.signature(), now - MAX_TIME_DIFF - 1),
               AuthenticationError);
}

TEST_F(SignedRequestTest, CurrentTimeRequestVerifies) {
  auto request = SignableRequest::build("notes.txt", key.verifying_key()).sign(key);
  EXPECT_NO_THROW(request.verify());
}

TEST_F(SignedRequestTest, SignatureBoundToEveryField) {
  auto request = sign_at("notes.txt", now);
  auto other_key = crypto::SigningKey::generate();

  auto other_name = SignableRequest::build_with_time("notes2.txt", key.verifying_key(), now);
  EXPECT_THROW(other_name.check_signature(request.signature(), now), AuthenticationError);

  auto other_identity = SignableRequest::build_with_time("notes.txt", other_key.verifying_key(), now);
  EXPECT_THROW(other_identity.check_signature(request.signature(), now), AuthenticationError);

  auto other_time = SignableRequest::build_with_time("notes.txt", key.verifying_key(), now + 1);
  EXPECT_THROW(other_time.check_signature(request.signature(), now), AuthenticationError);
}

TEST_F(SignedRequestTest, WireFieldsCarryTheRequest) {
  auto request = sign_at("dir/notes.txt", now);
  auto fields = to_fields(request);

  EXPECT_EQ(fields.filename, "dir/notes.txt");
  EXPECT_EQ(fields.time, "1700000000");

  auto parsed = from_fields(fields);
  EXPECT_EQ(parsed.filename(), request.filename());
  EXPECT_EQ(parsed.pubkey(), request.pubkey());
  EXPECT_EQ(parsed.time(), request.time());
  EXPECT_EQ(parsed.signature(), request.signature());
  EXPECT_NO_THROW(parsed.request().check_signature(parsed.signature(), now));
}

TEST_F(SignedRequestTest, MalformedFieldsRejected) {
  auto good = to_fields(sign_at("notes.txt", now));

  auto bad_time = good;
  bad_time.time = "12a";
  EXPECT_THROW(from_fields(bad_time), MalformedInputError);
  bad_time.time = "-5";
  EXPECT_THROW(from_fields(bad_time), MalformedInputError);
  bad_time.time = "";
  EXPECT_THROW(from_fields(bad_time), MalformedInputError);
  bad_time.time = "99999999999999999999";
  EXPECT_THROW(from_fields(bad_time), MalformedInputError);

  auto bad_key = good;
  bad_key.pubkey = "0OIl";
  EXPECT_THROW(from_fields(bad_key), MalformedInputError);
  bad_key.pubkey = "2g";
  EXPECT_THROW(from_fields(bad_key), MalformedInputError);

  auto bad_signature = good;
  bad_signature.request_signature = good.pubkey;
  EXPECT_THROW(from_fields(bad_signature), MalformedInputError);
}

TEST_F(SignedRequestTest, ErrorKindsAreReported) {
  try {
    sign_at("notes.txt", now).request().check_signature(crypto::Signature{}, now);
    FAIL() << "Expected AuthenticationError";
  } catch (const ProtocolError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::AUTHENTICATION);
  }
}

TEST_F(SignedRequestTest, NonCanonicalSignatureRejected) {
  auto request = sign_at("notes.txt", now);
  EXPECT_NO_THROW(request.request().check_signature(request.signature(), now));
  EXPECT_THROW(request.request().check_signature(with_malleated_scalar(request.signature()), now),
               AuthenticationError);
}
