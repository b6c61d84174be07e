#include <gtest/gtest.h>
#include <iomanip>
#include <sstream>
#include <string>
#include "crypto/content_digest.hpp"

using namespace pcloud::crypto;

namespace {

std::string to_hex(const ContentDigest::Digest& digest) {
  std::ostringstream out;
  for (auto byte : digest) {
    out << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
  }
  return out.str();
}

} // namespace

TEST(ContentDigestTest, MatchesBlake2bReferenceValues) {
  ContentDigest empty;
  EXPECT_EQ(to_hex(empty.finalize()),
            "786a02f742015903c6c6fd852552d272912f4740e15847618a86e217f71f5419"
            "d25e1031afee585313896444934eb04b903a685b1448b755d56f701afe9be2ce");

  ContentDigest abc;
  abc.update("abc");
  EXPECT_EQ(to_hex(abc.finalize()),
            "ba80a53f981c4d0d6a2797b69f12f6e94c212f14685ac4b74b12bb6fdbffa2d1"
            "7d87c5392aab792dc252d5de4533cc9518d38aa8dbf1925ab92386edd4009923");
}

TEST(ContentDigestTest, ChunkingDoesNotChangeResult) {
  std::string data(200 * 1024, '\0');
  for (size_t i = 0; i < data.size(); ++i) {
    data[i] = static_cast<char>(i * 31 + 7);
  }

  ContentDigest whole;
  whole.update(data);

  ContentDigest chunked;
  for (size_t offset = 0; offset < data.size(); offset += 1000) {
    chunked.update(std::string_view(data).substr(offset, 1000));
  }

  std::istringstream stream(data);
  ContentDigest streamed;
  streamed.update(stream);

  EXPECT_EQ(whole.bytes_processed(), data.size());
  EXPECT_EQ(chunked.bytes_processed(), data.size());
  EXPECT_EQ(streamed.bytes_processed(), data.size());

  auto expected = whole.finalize();
  EXPECT_EQ(chunked.finalize(), expected);
  EXPECT_EQ(streamed.finalize(), expected);
}

TEST(ContentDigestTest, DifferentContentDifferentDigest) {
  ContentDigest a;
  a.update("hello");
  ContentDigest b;
  b.update("hellp");
  EXPECT_NE(a.finalize(), b.finalize());
}

TEST(ContentDigestTest, FinalizeOnlyOnce) {
  ContentDigest digest;
  digest.update("data");
  EXPECT_FALSE(digest.is_finalized());
  digest.finalize();
  EXPECT_TRUE(digest.is_finalized());
  EXPECT_THROW(digest.finalize(), DigestError);
  EXPECT_THROW(digest.update("more"), DigestError);
}
