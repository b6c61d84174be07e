#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pcloud {
namespace utils {

// Base58 with the Bitcoin alphabet. Each leading zero byte is encoded as '1'.
std::string base58_encode(const uint8_t* data, size_t length);

template <typename Container>
std::string base58_encode(const Container& bytes) {
  return base58_encode(reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size());
}

// Returns std::nullopt when the text contains a character outside the alphabet
std::optional<std::vector<uint8_t>> base58_decode(std::string_view text);

} // namespace utils
} // namespace pcloud
