#include "server/upload_pipeline.hpp"
#include <boost/log/trivial.hpp>
#include "protocol/protocol_error.hpp"

namespace pcloud {
namespace server {

const char* state_to_string(UploadPipeline::State state) {
  switch (state) {
    case UploadPipeline::State::Receiving:  return "Receiving";
    case UploadPipeline::State::Verifying:  return "Verifying";
    case UploadPipeline::State::Committing: return "Committing";
    case UploadPipeline::State::Done:       return "Done";
    case UploadPipeline::State::Failed:     return "Failed";
    default:                                return "Unknown";
  }
}

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

UploadPipeline::UploadPipeline(store::Store& store, protocol::SignedRequest request,
                               const crypto::Signature& file_signature)
  : store_(store)
  , request_(std::move(request))
  , file_signature_(file_signature)
  , state_(State::Failed) {
  request_.verify();
  BOOST_LOG_TRIVIAL(info) << "Upload: Request signature OK for " << request_.filename();

  paths_ = store_.resolve(request_.pubkey(), request_.filename());
  temp_file_.emplace(store_.create_temp_file());
  state_ = State::Receiving;
  BOOST_LOG_TRIVIAL(info) << "Upload: Started writing file to " << temp_file_->path().string();
}

UploadPipeline::~UploadPipeline() {
  if (state_ != State::Done && state_ != State::Failed) {
    BOOST_LOG_TRIVIAL(warning) << "Upload: Pipeline for " << request_.filename()
                               << " discarded in state " << state_to_string(state_);
  }
  // Any still-owned scratch file is removed by TempFile's destructor
}


//==============================================
// STREAMING
//==============================================

void UploadPipeline::append_chunk(const void* data, size_t length) {
  if (state_ != State::Receiving) {
    throw protocol::IoError(std::string("Upload not receiving (") + state_to_string(state_) + ")");
  }

  try {
    temp_file_->append(data, length);
    hasher_.update(data, length);
    bytes_received_ += length;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Upload: File write error: " << e.what();
    fail(e.what());
    throw;
  }
}

void UploadPipeline::finish() {
  if (state_ != State::Receiving) {
    throw protocol::IoError(std::string("Upload not receiving (") + state_to_string(state_) + ")");
  }

  try {
    state_ = State::Verifying;
    BOOST_LOG_TRIVIAL(debug) << "Upload: Received " << bytes_received_ << " bytes, verifying file signature";
    if (!request_.pubkey().verify_digest(std::move(hasher_), file_signature_)) {
      throw protocol::IntegrityError("File signature does not match the uploaded content");
    }

    state_ = State::Committing;
    store_.commit(*temp_file_, paths_, file_signature_);
    temp_file_.reset();
    state_ = State::Done;
    BOOST_LOG_TRIVIAL(info) << "Upload: Stored " << request_.filename() << " (" << bytes_received_ << " bytes)";
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Upload: Failed in state " << state_to_string(state_) << ": " << e.what();
    fail(e.what());
    throw;
  }
}

void UploadPipeline::abort(const std::string& reason) {
  if (state_ == State::Done || state_ == State::Failed) {
    return;
  }
  BOOST_LOG_TRIVIAL(warning) << "Upload: Aborted " << request_.filename() << ": " << reason;
  fail(reason.c_str());
}

void UploadPipeline::fail(const char* reason) noexcept {
  state_ = State::Failed;
  if (!temp_file_) {
    return;
  }
  try {
    temp_file_->discard();
  } catch (const std::exception& cleanup) {
    BOOST_LOG_TRIVIAL(error) << "Upload: Cleanup failed after \"" << reason << "\": " << cleanup.what();
  }
  temp_file_.reset();
}

} // namespace server
} // namespace pcloud
