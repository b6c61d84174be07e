#ifndef PCLOUD_CONTENT_DIGEST_HPP
#define PCLOUD_CONTENT_DIGEST_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <istream>
#include <memory>
#include <string_view>
#include "crypto_error.hpp"

namespace pcloud::crypto {

// Forward declaration for OpenSSL digest context
struct DigestContext;

// Incremental BLAKE2b-512 accumulator. Bytes must be fed in their original
// order; finalize() may be called once.
class ContentDigest {
public:
  static constexpr size_t DIGEST_SIZE = 64;
  using Digest = std::array<uint8_t, DIGEST_SIZE>;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  ContentDigest();
  ~ContentDigest();
  ContentDigest(ContentDigest&& other) noexcept;
  ContentDigest& operator=(ContentDigest&& other) noexcept;


  // ---- ACCUMULATION ----
  void update(const void* data, size_t length);
  void update(std::string_view data) { update(data.data(), data.size()); }
  // Reads the stream to its end in fixed-size blocks
  void update(std::istream& input);


  // ---- FINALIZATION ----
  Digest finalize();
  bool is_finalized() const { return finalized_; }

  std::uint64_t bytes_processed() const { return bytes_processed_; }

private:
  // ---- PARAMETERS ----
  std::unique_ptr<DigestContext> context_;
  bool finalized_ = false;
  std::uint64_t bytes_processed_ = 0;
  static constexpr size_t BUFFER_SIZE = 64 * 1024;
};

} // namespace pcloud::crypto

#endif // PCLOUD_CONTENT_DIGEST_HPP
