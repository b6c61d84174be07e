#ifndef PCLOUD_UPLOAD_PIPELINE_HPP
#define PCLOUD_UPLOAD_PIPELINE_HPP

#include <cstdint>
#include <optional>
#include "crypto/content_digest.hpp"
#include "crypto/signing_key.hpp"
#include "protocol/signed_request.hpp"
#include "store/store.hpp"
#include "store/temp_file.hpp"

namespace pcloud {
namespace server {

// Receives one upload. Every chunk is appended to a scratch file and then fed to
// the digest; on completion the asserted file signature is checked against the
// digest before the artifact is committed. Any failure removes the scratch file,
// and so does destruction of an unfinished pipeline.
class UploadPipeline {
public:
  enum class State {
    Receiving,
    Verifying,
    Committing,
    Done,
    Failed
  };

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Verifies the request and resolves its paths before touching the disk
  UploadPipeline(store::Store& store, protocol::SignedRequest request,
                 const crypto::Signature& file_signature);
  ~UploadPipeline();

  UploadPipeline(const UploadPipeline&) = delete;
  UploadPipeline& operator=(const UploadPipeline&) = delete;


  // ---- STREAMING ----
  void append_chunk(const void* data, size_t length);
  // End of stream: verify, then commit
  void finish();
  // Abandons the upload, e.g. when the peer disconnected
  void abort(const std::string& reason);


  // ---- GETTERS ----
  State state() const { return state_; }
  std::uint64_t bytes_received() const { return bytes_received_; }
  const protocol::SignedRequest& request() const { return request_; }
  const store::ArtifactPaths& paths() const { return paths_; }

private:
  // ---- PARAMETERS ----
  store::Store& store_;
  protocol::SignedRequest request_;
  crypto::Signature file_signature_;
  store::ArtifactPaths paths_;
  crypto::ContentDigest hasher_;
  std::optional<store::TempFile> temp_file_;
  State state_;
  std::uint64_t bytes_received_ = 0;

  // Moves to Failed and removes the scratch file, logging (not throwing) cleanup errors
  void fail(const char* reason) noexcept;
};

const char* state_to_string(UploadPipeline::State state);

} // namespace server
} // namespace pcloud

#endif // PCLOUD_UPLOAD_PIPELINE_HPP
