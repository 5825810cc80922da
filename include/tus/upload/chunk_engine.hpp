#pragma once

#include "tus/client/config.hpp"
#include "tus/io/file_source.hpp"
#include "tus/network/transport.hpp"
#include "tus/upload/descriptor.hpp"
#include "tus/upload/types.hpp"

namespace tus::upload {

/**
 * @brief Sends one chunk and interprets the server's answer
 *
 * send_chunk() reads min(chunk_size, remaining) bytes at the descriptor's
 * confirmed offset, PATCHes them to the upload location and classifies
 * the response. It never mutates the descriptor: applying the outcome is
 * the state machine's job, so re-invoking after any failure is safe.
 *
 * The optional token is passed to every request, so cancelling it cuts a
 * chunk short instead of waiting for the PATCH to finish.
 */
class ChunkTransferEngine {
public:
    ChunkTransferEngine(network::Transport& transport,
                        const client::ClientConfig& config,
                        const CancellationToken* cancel = nullptr);

    TransferOutcome send_chunk(const UploadDescriptor& descriptor, io::FileSource& source) const;

    /// Size of the chunk send_chunk() would send next
    [[nodiscard]] std::size_t next_chunk_size(const UploadDescriptor& descriptor) const noexcept;

private:
    TransferOutcome interpret(const UploadDescriptor& descriptor,
                              const network::HttpResponse& response,
                              uint64_t bytes_sent) const;

    TransferOutcome query_server_offset(const UploadDescriptor& descriptor, uint64_t bytes_sent) const;

    network::Transport& transport_;
    const client::ClientConfig& config_;
    const CancellationToken* cancel_;
};

} // namespace tus::upload
