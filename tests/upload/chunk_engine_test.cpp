#include "tus/upload/chunk_engine.hpp"
#include "support/fake_tus_server.hpp"

#include <gtest/gtest.h>

using namespace std::chrono_literals;
using tus::ErrorKind;
using tus::client::ClientConfig;
using tus::io::MemorySource;
using tus::network::HttpMethod;
using tus::testing::FakeTusServer;
using tus::testing::make_payload;
using tus::upload::ChunkTransferEngine;
using tus::upload::TransferOutcome;
using tus::upload::UploadDescriptor;

class ChunkEngineTest : public ::testing::Test {
protected:
    ChunkEngineTest()
        : payload_(make_payload(10000))
        , source_(payload_) {
        config_.chunk_size = 4096;
    }

    UploadDescriptor seeded(std::vector<uint8_t> stored = {}, bool deferred = false) {
        const auto location = server_.seed_upload(std::move(stored),
            deferred ? std::nullopt : std::optional<uint64_t>(payload_.size()));
        return UploadDescriptor(location, "http://tus.test/files/", payload_.size(), {}, {}, deferred);
    }

    std::vector<uint8_t> payload_;
    MemorySource source_;
    FakeTusServer server_;
    ClientConfig config_;
};

TEST_F(ChunkEngineTest, AcceptedChunkLeavesDescriptorUntouched) {
    auto descriptor = seeded();
    ChunkTransferEngine engine(server_, config_);

    auto outcome = engine.send_chunk(descriptor, source_);

    EXPECT_EQ(outcome.kind, TransferOutcome::Kind::Accepted);
    EXPECT_EQ(outcome.server_offset, 4096u);
    EXPECT_EQ(outcome.bytes_sent, 4096u);
    EXPECT_EQ(descriptor.confirmed_offset(), 0u);

    const auto patches = server_.patches();
    ASSERT_EQ(patches.size(), 1u);
    EXPECT_EQ(patches[0].offset, 0u);
    EXPECT_EQ(patches[0].size, 4096u);
    EXPECT_TRUE(patches[0].checksum.empty());
    EXPECT_TRUE(patches[0].upload_length.empty());
}

TEST_F(ChunkEngineTest, LastChunkIsShort) {
    auto descriptor = seeded(std::vector<uint8_t>(payload_.begin(), payload_.begin() + 8192));
    ASSERT_TRUE(descriptor.advance(8192).is_ok());
    ChunkTransferEngine engine(server_, config_);

    EXPECT_EQ(engine.next_chunk_size(descriptor), 1808u);
    auto outcome = engine.send_chunk(descriptor, source_);

    EXPECT_EQ(outcome.kind, TransferOutcome::Kind::Accepted);
    EXPECT_EQ(outcome.server_offset, 10000u);
    EXPECT_EQ(outcome.bytes_sent, 1808u);
}

TEST_F(ChunkEngineTest, PartialWriteIsOffsetMismatch) {
    auto descriptor = seeded();
    server_.truncate_next_patch(1000);
    ChunkTransferEngine engine(server_, config_);

    auto outcome = engine.send_chunk(descriptor, source_);

    EXPECT_EQ(outcome.kind, TransferOutcome::Kind::OffsetMismatch);
    EXPECT_EQ(outcome.server_offset, 1000u);
}

TEST_F(ChunkEngineTest, ConflictQueriesServerOffset) {
    // Server already holds 2048 bytes the descriptor does not know about
    auto descriptor = seeded(std::vector<uint8_t>(payload_.begin(), payload_.begin() + 2048));
    ChunkTransferEngine engine(server_, config_);

    auto outcome = engine.send_chunk(descriptor, source_);

    EXPECT_EQ(outcome.kind, TransferOutcome::Kind::OffsetMismatch);
    EXPECT_EQ(outcome.server_offset, 2048u);
    EXPECT_EQ(server_.request_count(HttpMethod::HEAD), 1u);
}

TEST_F(ChunkEngineTest, TimeoutIsTransportFailure) {
    auto descriptor = seeded();
    server_.fail_with_timeout(HttpMethod::PATCH);
    ChunkTransferEngine engine(server_, config_);

    auto outcome = engine.send_chunk(descriptor, source_);

    EXPECT_EQ(outcome.kind, TransferOutcome::Kind::TransportFailure);
    EXPECT_EQ(outcome.error.kind, ErrorKind::Transport);
}

TEST_F(ChunkEngineTest, CancelTokenReachesTransport) {
    auto descriptor = seeded();
    tus::CancellationToken token;
    token.cancel();
    server_.stall_next(HttpMethod::PATCH, 5s);
    ChunkTransferEngine engine(server_, config_, &token);

    auto outcome = engine.send_chunk(descriptor, source_);

    EXPECT_EQ(outcome.kind, TransferOutcome::Kind::TransportFailure);
    EXPECT_EQ(outcome.error.kind, ErrorKind::Cancelled);
    EXPECT_TRUE(server_.patches().empty());
}

TEST_F(ChunkEngineTest, ServerErrorsAreRetryable) {
    auto descriptor = seeded();
    server_.fail_with_status(HttpMethod::PATCH, 503);
    server_.fail_with_status(HttpMethod::PATCH, 423);
    ChunkTransferEngine engine(server_, config_);

    EXPECT_EQ(engine.send_chunk(descriptor, source_).kind, TransferOutcome::Kind::TransportFailure);
    EXPECT_EQ(engine.send_chunk(descriptor, source_).kind, TransferOutcome::Kind::TransportFailure);
}

TEST_F(ChunkEngineTest, DefinitiveStatusesAreRejected) {
    auto descriptor = seeded();
    server_.fail_with_status(HttpMethod::PATCH, 460);
    server_.fail_with_status(HttpMethod::PATCH, 404);
    server_.fail_with_status(HttpMethod::PATCH, 403);
    ChunkTransferEngine engine(server_, config_);

    auto checksum = engine.send_chunk(descriptor, source_);
    EXPECT_EQ(checksum.kind, TransferOutcome::Kind::Rejected);
    EXPECT_EQ(checksum.error.kind, ErrorKind::ChecksumMismatch);

    auto gone = engine.send_chunk(descriptor, source_);
    EXPECT_EQ(gone.kind, TransferOutcome::Kind::Rejected);
    EXPECT_EQ(gone.error.kind, ErrorKind::SessionGone);

    auto forbidden = engine.send_chunk(descriptor, source_);
    EXPECT_EQ(forbidden.kind, TransferOutcome::Kind::Rejected);
    EXPECT_EQ(forbidden.error.kind, ErrorKind::ProtocolRejection);
}

TEST_F(ChunkEngineTest, TruncatedSourceIsRejectedBeforeSending) {
    auto descriptor = seeded();
    MemorySource truncated(std::vector<uint8_t>(payload_.begin(), payload_.begin() + 100));
    ChunkTransferEngine engine(server_, config_);

    auto outcome = engine.send_chunk(descriptor, truncated);

    EXPECT_EQ(outcome.kind, TransferOutcome::Kind::Rejected);
    EXPECT_EQ(outcome.error.kind, ErrorKind::SourceRead);
    EXPECT_TRUE(server_.patches().empty());
}

TEST_F(ChunkEngineTest, ChecksumHeaderIsVerifiedByServer) {
    auto descriptor = seeded();
    config_.checksum_enabled = true;
    config_.checksum_algorithm = "sha256";
    ChunkTransferEngine engine(server_, config_);

    auto outcome = engine.send_chunk(descriptor, source_);

    EXPECT_EQ(outcome.kind, TransferOutcome::Kind::Accepted);
    const auto patches = server_.patches();
    ASSERT_EQ(patches.size(), 1u);
    EXPECT_EQ(patches[0].checksum.rfind("sha256 ", 0), 0u);
}

TEST_F(ChunkEngineTest, UndeclaredLengthIsSentWithChunk) {
    auto descriptor = seeded({}, true);
    ChunkTransferEngine engine(server_, config_);

    auto outcome = engine.send_chunk(descriptor, source_);

    EXPECT_EQ(outcome.kind, TransferOutcome::Kind::Accepted);
    EXPECT_EQ(server_.patches()[0].upload_length, "10000");
    EXPECT_EQ(server_.upload_at(descriptor.location())->length, 10000u);
}

TEST_F(ChunkEngineTest, CustomHeadersAreSent) {
    auto descriptor = seeded();
    config_.headers["Authorization"] = "Bearer secret";
    ChunkTransferEngine engine(server_, config_);

    engine.send_chunk(descriptor, source_);

    const auto requests = server_.requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].get_header("Authorization"), "Bearer secret");
    EXPECT_EQ(requests[0].get_header("Tus-Resumable"), "1.0.0");
}
