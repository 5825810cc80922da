#pragma once

#include "tus/client/config.hpp"
#include "tus/core/cancellation.hpp"
#include "tus/core/result.hpp"
#include "tus/events/event_bus.hpp"
#include "tus/io/file_source.hpp"
#include "tus/network/transport.hpp"
#include "tus/protocol/requests.hpp"
#include "tus/protocol/server_info.hpp"
#include "tus/upload/chunk_engine.hpp"
#include "tus/upload/descriptor.hpp"
#include "tus/upload/session.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace tus::upload {

/**
 * @brief Drives one upload session from creation or resumption to a terminal state
 *
 * One instance runs one session once: create() or resume() moves it into
 * Transferring, transfer() runs the chunk loop to Completed or Failed.
 * To retry a failed session, build a new instance and resume() again.
 *
 * Retry policy:
 * - creation is never retried
 * - the resume status query and each chunk are retried on transport
 *   failures, at most config.max_attempts consecutive attempts with
 *   config.backoff between them
 * - offset mismatches are reconciled, at most
 *   config.max_offset_reconciliations in a row without forward progress
 * - protocol rejections and invariant violations fail immediately
 *
 * The descriptor is caller-owned and must not be shared with another
 * running state machine. It is only ever changed through advance() and
 * reconcile(), each followed by an event carrying a snapshot.
 */
class UploadStateMachine {
public:
    UploadStateMachine(network::Transport& transport,
                       const client::ClientConfig& config,
                       events::EventBus* bus = nullptr,
                       CancellationToken* cancel = nullptr);

    /**
     * @brief Creation handshake (Idle → Creating → Transferring)
     *
     * @param source_path recorded in the descriptor so resume() can reopen the file
     */
    Result<UploadDescriptor> create(io::FileSource& source,
                                    const std::string& endpoint,
                                    const Metadata& metadata,
                                    const std::string& source_path = {});

    /**
     * @brief Status query and reconciliation (Idle → Resuming → Transferring)
     *
     * Overwrites the descriptor's offset with the server's value.
     */
    Result<void> resume(UploadDescriptor& descriptor);

    /// Chunk loop (Transferring → Completed)
    Result<void> transfer(UploadDescriptor& descriptor, io::FileSource& source);

    /// OPTIONS on @p endpoint
    Result<protocol::ServerInfo> discover(const std::string& endpoint);

    /// HEAD on @p location, retried on transport failures like a chunk
    Result<protocol::UploadStatus> query_status(const std::string& location);

    [[nodiscard]] UploadState state() const noexcept { return session_.state(); }
    [[nodiscard]] const std::optional<Error>& last_error() const noexcept { return session_.last_error(); }

private:
    Result<void> negotiate(const std::string& endpoint, uint64_t total_length, bool creating);

    /// Move to Failed, log and announce; returns the error for propagation
    Error fail(Error error, const UploadDescriptor& descriptor);

    /// Sleep for the backoff delay; false when cancelled meanwhile
    bool wait_backoff(std::chrono::milliseconds delay);

    [[nodiscard]] bool cancelled() const noexcept { return cancel_ && cancel_->is_cancelled(); }

    template<typename EventType>
    void emit(const EventType& event) {
        if (bus_) {
            bus_->emit(event);
        }
    }

    network::Transport& transport_;
    const client::ClientConfig& config_;
    events::EventBus* bus_;
    CancellationToken* cancel_;
    ChunkTransferEngine engine_;
    UploadSession session_;
};

} // namespace tus::upload
