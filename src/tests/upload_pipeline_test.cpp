#include <gtest/gtest.h>
#include <filesystem>
#include "crypto/content_digest.hpp"
#include "crypto/signing_key.hpp"
#include "protocol/protocol_error.hpp"
#include "protocol/signed_request.hpp"
#include "server/upload_pipeline.hpp"
#include "store/store.hpp"
#include "test_utils.hpp"

using namespace pcloud;
using namespace pcloud::server;
namespace fs = std::filesystem;

class UploadPipelineTest : public ::testing::Test {
protected:
  fs::path test_dir;
  std::unique_ptr<store::Store> store;
  crypto::SigningKey key = crypto::SigningKey::generate();

  void SetUp() override {
    test_dir = make_test_dir("upload_pipeline_test");
    store = std::make_unique<store::Store>(test_dir / "storage", fs::path());
  }

  void TearDown() override {
    store.reset();
    fs::remove_all(test_dir);
  }

  protocol::SignedRequest signed_request(const std::string& filename) {
    return protocol::SignableRequest::build(filename, key.verifying_key()).sign(key);
  }

  crypto::Signature file_signature(const std::string& content) {
    crypto::ContentDigest digest;
    digest.update(content);
    return key.sign_digest(std::move(digest));
  }

  void send_in_chunks(UploadPipeline& pipeline, const std::string& content, size_t chunk_size) {
    for (size_t offset = 0; offset < content.size(); offset += chunk_size) {
      auto length = std::min(chunk_size, content.size() - offset);
      pipeline.append_chunk(content.data() + offset, length);
    }
  }
};

TEST_F(UploadPipelineTest, StoresVerifiedUpload) {
  const std::string content = "hello";
  UploadPipeline pipeline(*store, signed_request("notes.txt"), file_signature(content));
  EXPECT_EQ(pipeline.state(), UploadPipeline::State::Receiving);

  send_in_chunks(pipeline, content, 2);
  pipeline.finish();

  EXPECT_EQ(pipeline.state(), UploadPipeline::State::Done);
  EXPECT_EQ(pipeline.bytes_received(), content.size());
  EXPECT_EQ(read_file(pipeline.paths().payload), content);
  EXPECT_EQ(store->read_signature(pipeline.paths()), file_signature(content));
  EXPECT_EQ(count_entries(store->scratch_dir()), 0u);

  // Stored signature verifies against the digest of the content with the uploader's key
  crypto::ContentDigest digest;
  digest.update(content);
  EXPECT_TRUE(key.verifying_key().verify_digest(std::move(digest), store->read_signature(pipeline.paths())));
}

TEST_F(UploadPipelineTest, LargeUploadInManyChunks) {
  std::string content(1024 * 1024 + 17, '\0');
  for (size_t i = 0; i < content.size(); ++i) {
    content[i] = static_cast<char>(i % 251);
  }

  UploadPipeline pipeline(*store, signed_request("big.bin"), file_signature(content));
  send_in_chunks(pipeline, content, 64 * 1024);
  pipeline.finish();

  EXPECT_EQ(read_file(pipeline.paths().payload), content);
}

TEST_F(UploadPipelineTest, DigestMismatchLeavesNoArtifact) {
  UploadPipeline pipeline(*store, signed_request("notes.txt"), file_signature("hello"));
  send_in_chunks(pipeline, "hellO", 5);

  EXPECT_THROW(pipeline.finish(), protocol::IntegrityError);
  EXPECT_EQ(pipeline.state(), UploadPipeline::State::Failed);
  EXPECT_FALSE(fs::exists(pipeline.paths().payload));
  EXPECT_FALSE(fs::exists(pipeline.paths().signature));
  EXPECT_EQ(count_entries(store->scratch_dir()), 0u);
}

TEST_F(UploadPipelineTest, MismatchDoesNotReplaceExistingArtifact) {
  {
    UploadPipeline first(*store, signed_request("notes.txt"), file_signature("original"));
    send_in_chunks(first, "original", 3);
    first.finish();
  }

  UploadPipeline second(*store, signed_request("notes.txt"), file_signature("replacement"));
  send_in_chunks(second, "tampered", 3);
  EXPECT_THROW(second.finish(), protocol::IntegrityError);

  EXPECT_EQ(read_file(second.paths().payload), "original");
  EXPECT_EQ(store->read_signature(second.paths()), file_signature("original"));
}

TEST_F(UploadPipelineTest, InterruptedUploadLeavesNothing) {
  fs::path payload;
  {
    UploadPipeline pipeline(*store, signed_request("notes.txt"), file_signature("hello world"));
    payload = pipeline.paths().payload;
    send_in_chunks(pipeline, "hello", 2);
    EXPECT_EQ(count_entries(store->scratch_dir()), 1u);
    // Peer goes away: the pipeline is dropped without finish()
  }
  EXPECT_FALSE(fs::exists(payload));
  EXPECT_EQ(count_entries(store->scratch_dir()), 0u);
}

TEST_F(UploadPipelineTest, AbortRemovesScratchFile) {
  UploadPipeline pipeline(*store, signed_request("notes.txt"), file_signature("hello"));
  send_in_chunks(pipeline, "hel", 3);
  pipeline.abort("connection reset");

  EXPECT_EQ(pipeline.state(), UploadPipeline::State::Failed);
  EXPECT_EQ(count_entries(store->scratch_dir()), 0u);
  EXPECT_THROW(pipeline.append_chunk("lo", 2), protocol::IoError);
  EXPECT_THROW(pipeline.finish(), protocol::IoError);
}

TEST_F(UploadPipelineTest, InvalidRequestRejectedBeforeDiskWork) {
  auto other = crypto::SigningKey::generate();
  auto forged = protocol::SignableRequest::build("notes.txt", key.verifying_key()).sign(other);
  EXPECT_THROW(UploadPipeline pipeline(*store, forged, file_signature("hello")), protocol::AuthenticationError);

  auto stale = protocol::SignableRequest::build_with_time("notes.txt", key.verifying_key(),
                                                          protocol::SignableRequest::unix_time() - 3600).sign(key);
  EXPECT_THROW(UploadPipeline pipeline(*store, stale, file_signature("hello")), protocol::AuthenticationError);

  EXPECT_THROW(UploadPipeline pipeline(*store, signed_request("../escape.txt"), file_signature("hello")),
               protocol::SandboxViolationError);

  EXPECT_EQ(count_entries(store->scratch_dir()), 0u);
  EXPECT_EQ(count_entries(store->root()), 1u);  // only the scratch area
}

TEST_F(UploadPipelineTest, SignatureFromAnotherIdentityRejected) {
  auto other = crypto::SigningKey::generate();
  crypto::ContentDigest digest;
  digest.update("hello");
  auto foreign_signature = other.sign_digest(std::move(digest));

  UploadPipeline pipeline(*store, signed_request("notes.txt"), foreign_signature);
  send_in_chunks(pipeline, "hello", 5);
  EXPECT_THROW(pipeline.finish(), protocol::IntegrityError);
  EXPECT_FALSE(fs::exists(pipeline.paths().payload));
}
