#ifndef PCLOUD_CLIENT_API_HPP
#define PCLOUD_CLIENT_API_HPP

#include <filesystem>
#include <boost/beast/core/file.hpp>
#include "config/config.hpp"
#include "crypto/signing_key.hpp"
#include "protocol/signed_request.hpp"

namespace pcloud {
namespace client {

// Transport used by the transfer client
class Api {
public:
  virtual ~Api() = default;

  // Sends the file from its current position to its end. Throws TransportError
  // carrying the server's error text on a non-OK status.
  virtual void push(const protocol::SignedRequest& request, const crypto::Signature& file_signature,
                    boost::beast::file file) = 0;

  // Writes the payload into destination and returns the file signature asserted by the server
  virtual crypto::Signature pull(const protocol::SignedRequest& request,
                                 const std::filesystem::path& destination) = 0;
};

// HTTP/1.1 transport, one connection per call
class HttpClient : public Api {
public:
  explicit HttpClient(config::Endpoint server);

  void push(const protocol::SignedRequest& request, const crypto::Signature& file_signature,
            boost::beast::file file) override;
  crypto::Signature pull(const protocol::SignedRequest& request,
                         const std::filesystem::path& destination) override;

private:
  config::Endpoint server_;
};

} // namespace client
} // namespace pcloud

#endif // PCLOUD_CLIENT_API_HPP
