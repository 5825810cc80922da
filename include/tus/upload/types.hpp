#pragma once

#include "tus/core/error.hpp"

#include <cstdint>
#include <string>

namespace tus::upload {

enum class UploadState {
    Idle,
    Creating,
    Resuming,
    Transferring,
    Completed,
    Failed
};

const char* to_string(UploadState state);

/**
 * @brief Result of one chunk attempt, consumed by the state machine
 */
struct TransferOutcome {
    enum class Kind {
        Accepted,         ///< server offset == start + bytes sent
        OffsetMismatch,   ///< server reports a different offset
        Rejected,         ///< protocol-definitive refusal, never retried
        TransportFailure  ///< network-level failure, retryable
    };

    Kind kind = Kind::TransportFailure;
    uint64_t server_offset = 0;  ///< Accepted / OffsetMismatch
    uint64_t bytes_sent = 0;     ///< size of the chunk that was sent
    Error error;                 ///< Rejected / TransportFailure

    static TransferOutcome accepted(uint64_t new_offset, uint64_t bytes_sent) {
        TransferOutcome outcome;
        outcome.kind = Kind::Accepted;
        outcome.server_offset = new_offset;
        outcome.bytes_sent = bytes_sent;
        return outcome;
    }

    static TransferOutcome offset_mismatch(uint64_t server_offset, uint64_t bytes_sent) {
        TransferOutcome outcome;
        outcome.kind = Kind::OffsetMismatch;
        outcome.server_offset = server_offset;
        outcome.bytes_sent = bytes_sent;
        return outcome;
    }

    static TransferOutcome rejected(Error reason) {
        TransferOutcome outcome;
        outcome.kind = Kind::Rejected;
        outcome.error = std::move(reason);
        return outcome;
    }

    static TransferOutcome transport_failure(Error reason) {
        TransferOutcome outcome;
        outcome.kind = Kind::TransportFailure;
        outcome.error = std::move(reason);
        return outcome;
    }
};

const char* to_string(TransferOutcome::Kind kind);

} // namespace tus::upload
