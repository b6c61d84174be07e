#ifndef PCLOUD_DOWNLOAD_PIPELINE_HPP
#define PCLOUD_DOWNLOAD_PIPELINE_HPP

#include <boost/beast/http/file_body.hpp>
#include "crypto/signing_key.hpp"
#include "protocol/signed_request.hpp"
#include "store/store.hpp"

namespace pcloud {
namespace server {

// Opened artifact ready to be streamed; the body reads the payload in small blocks
struct DownloadArtifact {
  crypto::Signature file_signature;
  boost::beast::http::file_body::value_type body;
};

class DownloadPipeline {
public:
  explicit DownloadPipeline(store::Store& store) : store_(store) {}

  // Verifies the request, reads the stored signature and opens the payload.
  // Throws AuthenticationError, SandboxViolationError, NotFoundError or IoError.
  DownloadArtifact open(const protocol::SignedRequest& request) const;

private:
  store::Store& store_;
};

} // namespace server
} // namespace pcloud

#endif // PCLOUD_DOWNLOAD_PIPELINE_HPP
