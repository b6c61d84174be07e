#ifndef PCLOUD_SIGNED_REQUEST_HPP
#define PCLOUD_SIGNED_REQUEST_HPP

#include <cstdint>
#include <string>
#include <vector>
#include "crypto/signing_key.hpp"
#include "protocol/protocol_error.hpp"

namespace pcloud {
namespace protocol {

class SignedRequest;

// {resource name, identity, time} triple bound together by a request signature.
// Built fresh for every push/pull and never persisted.
class SignableRequest {
public:
  // ---- CONSTRUCTION ----
  // Stamps the current wall clock time, seconds resolution
  static SignableRequest build(std::string filename, const crypto::VerifyingKey& pubkey);
  // Reconstructs a request from received fields; time must be the value the client asserted
  static SignableRequest build_with_time(std::string filename, const crypto::VerifyingKey& pubkey,
                                         std::uint64_t time);


  // ---- CANONICAL ENCODING AND SIGNING ----
  // u32_le(len(filename)) || filename || pubkey[32] || u64_le(time)
  std::vector<uint8_t> canonical_encoding() const;
  SignedRequest sign(const crypto::SigningKey& key) const;


  // ---- VERIFICATION ----
  // Throws AuthenticationError when the request is stale or the signature does not verify
  void check_signature(const crypto::Signature& signature) const;
  void check_signature(const crypto::Signature& signature, std::uint64_t now) const;


  // ---- GETTERS ----
  const std::string& filename() const { return filename_; }
  const crypto::VerifyingKey& pubkey() const { return pubkey_; }
  std::uint64_t time() const { return time_; }

  static std::uint64_t unix_time();

private:
  SignableRequest(std::string filename, const crypto::VerifyingKey& pubkey, std::uint64_t time);

  std::string filename_;
  crypto::VerifyingKey pubkey_;
  std::uint64_t time_;
};

class SignedRequest {
public:
  SignedRequest(SignableRequest request, const crypto::Signature& signature)
    : request_(std::move(request)), signature_(signature) {}

  const SignableRequest& request() const { return request_; }
  const crypto::Signature& signature() const { return signature_; }

  const std::string& filename() const { return request_.filename(); }
  const crypto::VerifyingKey& pubkey() const { return request_.pubkey(); }
  std::uint64_t time() const { return request_.time(); }

  void verify() const { request_.check_signature(signature_); }

private:
  SignableRequest request_;
  crypto::Signature signature_;
};


//==============================================
// WIRE FIELDS
//==============================================

// Named fields carried as HTTP headers
struct RequestFields {
  std::string filename;
  std::string pubkey;
  std::string time;
  std::string request_signature;
};

RequestFields to_fields(const SignedRequest& request);
// Throws MalformedInputError on any unparseable field. Does not verify the signature.
SignedRequest from_fields(const RequestFields& fields);

std::string encode_signature(const crypto::Signature& signature);
crypto::Signature decode_signature(const std::string& text);
std::string encode_pubkey(const crypto::VerifyingKey& pubkey);
crypto::VerifyingKey decode_pubkey(const std::string& text);
std::uint64_t parse_time(const std::string& text);

} // namespace protocol
} // namespace pcloud

#endif // PCLOUD_SIGNED_REQUEST_HPP
