#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "utils/base58.hpp"

using namespace pcloud::utils;

namespace {

std::vector<uint8_t> from_hex(const std::string& hex) {
  std::vector<uint8_t> out;
  for (size_t i = 0; i + 1 < hex.size(); i += 2) {
    out.push_back(static_cast<uint8_t>(std::stoi(hex.substr(i, 2), nullptr, 16)));
  }
  return out;
}

} // namespace

TEST(Base58Test, KnownVectors) {
  const std::vector<std::pair<std::string, std::string>> vectors = {
    {"", ""},
    {"61", "2g"},
    {"626262", "a3gV"},
    {"636363", "aPEr"},
    {"516b6fcd0f", "ABnLTmg"},
    {"572e4794", "3EFU7m"},
    {"10c8511e", "Rt5zm"},
    {"00eb15231dfceb60925886b67d065299925915aeb172c06647", "1NS17iag9jJgTHD1VXjvLCEnZuQ3rJDE9L"},
  };

  for (const auto& [hex, text] : vectors) {
    auto bytes = from_hex(hex);
    EXPECT_EQ(base58_encode(bytes), text) << "Encoding " << hex;
    auto decoded = base58_decode(text);
    ASSERT_TRUE(decoded.has_value()) << "Decoding " << text;
    EXPECT_EQ(*decoded, bytes) << "Decoding " << text;
  }
}

TEST(Base58Test, LeadingZerosBecomeOnes) {
  std::vector<uint8_t> zeros(10, 0);
  EXPECT_EQ(base58_encode(zeros), "1111111111");

  auto decoded = base58_decode("111");
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(*decoded, std::vector<uint8_t>(3, 0));
}

TEST(Base58Test, RejectsCharactersOutsideAlphabet) {
  for (const std::string text : {"0abc", "abcO", "Il", "ab c", "abc+", "\xc3\xa9"}) {
    EXPECT_FALSE(base58_decode(text).has_value()) << "Accepted " << text;
  }
}
