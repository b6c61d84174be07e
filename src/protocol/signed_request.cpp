#include "protocol/signed_request.hpp"
#include <algorithm>
#include <chrono>
#include <limits>
#include <boost/log/trivial.hpp>
#include "crypto/byte_order.hpp"
#include "protocol/constants.hpp"
#include "utils/base58.hpp"

namespace pcloud {
namespace protocol {

//==============================================
// CONSTRUCTION
//==============================================

SignableRequest::SignableRequest(std::string filename, const crypto::VerifyingKey& pubkey,
                                 std::uint64_t time)
  : filename_(std::move(filename))
  , pubkey_(pubkey)
  , time_(time) {}

SignableRequest SignableRequest::build(std::string filename, const crypto::VerifyingKey& pubkey) {
  return SignableRequest(std::move(filename), pubkey, unix_time());
}

SignableRequest SignableRequest::build_with_time(std::string filename, const crypto::VerifyingKey& pubkey,
                                                 std::uint64_t time) {
  return SignableRequest(std::move(filename), pubkey, time);
}

std::uint64_t SignableRequest::unix_time() {
  auto now = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(now).count());
}


//==============================================
// CANONICAL ENCODING AND SIGNING
//==============================================

std::vector<uint8_t> SignableRequest::canonical_encoding() const {
  if (filename_.size() > std::numeric_limits<std::uint32_t>::max()) {
    throw MalformedInputError("Filename too long");
  }

  std::vector<uint8_t> out;
  out.reserve(sizeof(std::uint32_t) + filename_.size() + crypto::PUBLIC_KEY_SIZE + sizeof(std::uint64_t));

  crypto::ByteOrder::appendLittleEndian(out, static_cast<std::uint32_t>(filename_.size()));
  out.insert(out.end(), filename_.begin(), filename_.end());
  out.insert(out.end(), pubkey_.bytes().begin(), pubkey_.bytes().end());
  crypto::ByteOrder::appendLittleEndian(out, time_);
  return out;
}

SignedRequest SignableRequest::sign(const crypto::SigningKey& key) const {
  auto signature = key.sign(canonical_encoding());
  return SignedRequest(*this, signature);
}


//==============================================
// VERIFICATION
//==============================================

void SignableRequest::check_signature(const crypto::Signature& signature) const {
  check_signature(signature, unix_time());
}

void SignableRequest::check_signature(const crypto::Signature& signature, std::uint64_t now) const {
  const std::uint64_t time_diff = now > time_ ? now - time_ : time_ - now;
  if (time_diff > MAX_TIME_DIFF) {
    BOOST_LOG_TRIVIAL(warning) << "Signed request: Rejected stale request for " << filename_
                               << ", time difference " << time_diff << " seconds";
    throw AuthenticationError("Time difference is too high (" + std::to_string(time_diff) +
                              " seconds). Client's and server's clocks must be synchronized.");
  }

  if (!pubkey_.verify(canonical_encoding(), signature)) {
    BOOST_LOG_TRIVIAL(warning) << "Signed request: Invalid request signature for " << filename_;
    throw AuthenticationError("Invalid request signature");
  }
}


//==============================================
// WIRE FIELDS
//==============================================

std::string encode_signature(const crypto::Signature& signature) {
  return utils::base58_encode(signature);
}

crypto::Signature decode_signature(const std::string& text) {
  auto bytes = utils::base58_decode(text);
  if (!bytes || bytes->size() != crypto::SIGNATURE_SIZE) {
    throw MalformedInputError("Invalid signature encoding");
  }
  crypto::Signature signature;
  std::copy(bytes->begin(), bytes->end(), signature.begin());
  return signature;
}

std::string encode_pubkey(const crypto::VerifyingKey& pubkey) {
  return utils::base58_encode(pubkey.bytes());
}

crypto::VerifyingKey decode_pubkey(const std::string& text) {
  auto bytes = utils::base58_decode(text);
  if (!bytes) {
    throw MalformedInputError("Invalid public key encoding");
  }
  try {
    return crypto::VerifyingKey::from_bytes(*bytes);
  } catch (const crypto::CryptoError& e) {
    throw MalformedInputError(e.what());
  }
}

std::uint64_t parse_time(const std::string& text) {
  if (text.empty() || text.size() > 20 ||
      text.find_first_not_of("0123456789") != std::string::npos) {
    throw MalformedInputError("Invalid time: " + text);
  }
  try {
    return std::stoull(text);
  } catch (const std::out_of_range&) {
    throw MalformedInputError("Invalid time: " + text);
  }
}

RequestFields to_fields(const SignedRequest& request) {
  RequestFields fields;
  fields.filename = request.filename();
  fields.pubkey = encode_pubkey(request.pubkey());
  fields.time = std::to_string(request.time());
  fields.request_signature = encode_signature(request.signature());
  return fields;
}

SignedRequest from_fields(const RequestFields& fields) {
  auto pubkey = decode_pubkey(fields.pubkey);
  auto time = parse_time(fields.time);
  auto signature = decode_signature(fields.request_signature);
  return SignedRequest(SignableRequest::build_with_time(fields.filename, pubkey, time), signature);
}

} // namespace protocol
} // namespace pcloud
