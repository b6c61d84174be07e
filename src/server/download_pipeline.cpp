#include "server/download_pipeline.hpp"
#include <boost/log/trivial.hpp>
#include "protocol/protocol_error.hpp"

namespace pcloud {
namespace server {

DownloadArtifact DownloadPipeline::open(const protocol::SignedRequest& request) const {
  request.verify();

  const auto paths = store_.resolve(request.pubkey(), request.filename());

  auto stored = store_.open_artifact(paths);

  DownloadArtifact artifact;
  artifact.file_signature = stored.signature;

  boost::beast::error_code ec;
  artifact.body.reset(std::move(stored.payload), ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Download: Failed to size " << paths.payload.string() << ": " << ec.message();
    throw protocol::IoError("Failed to open file: " + ec.message());
  }

  BOOST_LOG_TRIVIAL(info) << "Download: Serving " << request.filename() << " (" << artifact.body.size() << " bytes)";
  return artifact;
}

} // namespace server
} // namespace pcloud
