#include "crypto/content_digest.hpp"
#include <openssl/evp.h>
#include <vector>
#include <boost/log/trivial.hpp>

namespace pcloud::crypto {

//=================================================
// RAII WRAPPER TO MANAGE DIGEST CONTEXT LIFECYCLE
//=================================================

struct DigestContext {
  EVP_MD_CTX* ctx = nullptr;

  DigestContext() {
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw DigestError("Failed to create digest context");
    }
    if (1 != EVP_DigestInit_ex(ctx, EVP_blake2b512(), nullptr)) {
      EVP_MD_CTX_free(ctx);
      throw DigestError("Failed to initialize BLAKE2b-512");
    }
  }

  ~DigestContext() {
    if (ctx) {
      EVP_MD_CTX_free(ctx);
    }
  }

  EVP_MD_CTX* get() { return ctx; }
};


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

ContentDigest::ContentDigest() : context_(std::make_unique<DigestContext>()) {}

ContentDigest::~ContentDigest() = default;

ContentDigest::ContentDigest(ContentDigest&& other) noexcept = default;

ContentDigest& ContentDigest::operator=(ContentDigest&& other) noexcept = default;


//==============================================
// ACCUMULATION
//==============================================

void ContentDigest::update(const void* data, size_t length) {
  if (finalized_ || !context_) {
    throw DigestError("Digest already finalized");
  }
  if (length == 0) {
    return;
  }
  if (1 != EVP_DigestUpdate(context_->get(), data, length)) {
    throw DigestError("Failed to update digest");
  }
  bytes_processed_ += length;
}

void ContentDigest::update(std::istream& input) {
  std::vector<char> buffer(BUFFER_SIZE);
  while (input) {
    input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    auto count = input.gcount();
    if (count > 0) {
      update(buffer.data(), static_cast<size_t>(count));
    }
  }
  if (input.bad()) {
    throw DigestError("Failed to read input stream");
  }
}


//==============================================
// FINALIZATION
//==============================================

ContentDigest::Digest ContentDigest::finalize() {
  if (finalized_ || !context_) {
    throw DigestError("Digest already finalized");
  }

  Digest digest{};
  unsigned int length = 0;
  if (1 != EVP_DigestFinal_ex(context_->get(), digest.data(), &length) || length != DIGEST_SIZE) {
    throw DigestError("Failed to finalize digest");
  }
  finalized_ = true;

  BOOST_LOG_TRIVIAL(trace) << "Content digest: Finalized over " << bytes_processed_ << " bytes";
  return digest;
}

} // namespace pcloud::crypto
