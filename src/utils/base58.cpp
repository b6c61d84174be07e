#include "utils/base58.hpp"
#include <array>

namespace pcloud {
namespace utils {

namespace {

constexpr char ALPHABET[] = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

// Maps ASCII to alphabet index, -1 for characters outside the alphabet
std::array<int8_t, 128> make_reverse_table() {
  std::array<int8_t, 128> table{};
  table.fill(-1);
  for (int i = 0; i < 58; ++i) {
    table[static_cast<unsigned char>(ALPHABET[i])] = static_cast<int8_t>(i);
  }
  return table;
}

} // namespace


//==============================================
// ENCODING
//==============================================

std::string base58_encode(const uint8_t* data, size_t length) {
  size_t zeros = 0;
  while (zeros < length && data[zeros] == 0) {
    ++zeros;
  }

  // log(256) / log(58) ~ 1.37, digits are kept little endian
  std::vector<uint8_t> digits((length - zeros) * 138 / 100 + 1, 0);
  size_t digits_len = 0;

  for (size_t i = zeros; i < length; ++i) {
    int carry = data[i];
    size_t j = 0;
    for (; j < digits_len || carry != 0; ++j) {
      carry += 256 * digits[j];
      digits[j] = static_cast<uint8_t>(carry % 58);
      carry /= 58;
    }
    digits_len = j;
  }

  std::string result(zeros, '1');
  result.reserve(zeros + digits_len);
  for (size_t i = 0; i < digits_len; ++i) {
    result.push_back(ALPHABET[digits[digits_len - 1 - i]]);
  }
  return result;
}


//==============================================
// DECODING
//==============================================

std::optional<std::vector<uint8_t>> base58_decode(std::string_view text) {
  static const auto reverse = make_reverse_table();

  size_t ones = 0;
  while (ones < text.size() && text[ones] == '1') {
    ++ones;
  }

  // log(58) / log(256) ~ 0.733, bytes are kept little endian
  std::vector<uint8_t> bytes((text.size() - ones) * 733 / 1000 + 1, 0);
  size_t bytes_len = 0;

  for (size_t i = ones; i < text.size(); ++i) {
    const auto c = static_cast<unsigned char>(text[i]);
    if (c >= reverse.size() || reverse[c] < 0) {
      return std::nullopt;
    }
    int carry = reverse[c];
    size_t j = 0;
    for (; j < bytes_len || carry != 0; ++j) {
      carry += 58 * bytes[j];
      bytes[j] = static_cast<uint8_t>(carry & 0xff);
      carry >>= 8;
    }
    bytes_len = j;
  }

  std::vector<uint8_t> result(ones, 0);
  result.reserve(ones + bytes_len);
  for (size_t i = 0; i < bytes_len; ++i) {
    result.push_back(bytes[bytes_len - 1 - i]);
  }
  return result;
}

} // namespace utils
} // namespace pcloud
