/**
 * @file events.hpp
 * @brief Event types emitted during an upload's lifecycle
 *
 * NAMING CONVENTION:
 * Events are past-tense: UploadCreatedEvent, ChunkAcceptedEvent.
 *
 * PERSISTENCE:
 * Events that carry a descriptor are emitted after the descriptor was
 * successfully mutated, never before. Saving e.descriptor from a handler
 * is therefore always safe for crash recovery.
 */

#pragma once

#include "tus/core/error.hpp"
#include "tus/upload/descriptor.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace tus::events {

using upload::UploadDescriptor;

/**
 * @brief Creation handshake succeeded; descriptor is at offset 0
 *
 * WHO SUBSCRIBES:
 * - Persistence (first save of the resumable record)
 * - Logger, Metrics
 */
struct UploadCreatedEvent {
    UploadDescriptor descriptor;
    std::chrono::system_clock::time_point timestamp;

    explicit UploadCreatedEvent(UploadDescriptor d)
        : descriptor(std::move(d))
        , timestamp(std::chrono::system_clock::now())
    {}
};

/**
 * @brief A chunk was acknowledged and the descriptor advanced
 */
struct ChunkAcceptedEvent {
    UploadDescriptor descriptor;   ///< snapshot after advance()
    uint64_t chunk_offset;         ///< where the chunk started
    uint64_t bytes;                ///< chunk size
    std::chrono::system_clock::time_point timestamp;

    ChunkAcceptedEvent(UploadDescriptor d, uint64_t offset, uint64_t size)
        : descriptor(std::move(d))
        , chunk_offset(offset)
        , bytes(size)
        , timestamp(std::chrono::system_clock::now())
    {}
};

/**
 * @brief The descriptor's offset was overwritten with the server's value
 *
 * Emitted on resume and after an offset mismatch. previous_offset may be
 * above the new one when the server lost a partial write.
 */
struct OffsetReconciledEvent {
    UploadDescriptor descriptor;   ///< snapshot after reconcile()
    uint64_t previous_offset;
    std::string reason;            ///< "resume" or "mismatch"
    std::chrono::system_clock::time_point timestamp;

    OffsetReconciledEvent(UploadDescriptor d, uint64_t previous, std::string why)
        : descriptor(std::move(d))
        , previous_offset(previous)
        , reason(std::move(why))
        , timestamp(std::chrono::system_clock::now())
    {}
};

/**
 * @brief A request failed at transport level and will be retried
 */
struct TransferRetryEvent {
    std::string location;
    uint64_t offset;
    std::size_t attempt;             ///< failures so far for this request
    std::chrono::milliseconds delay; ///< backoff before the next attempt
    Error error;
};

/**
 * @brief confirmed_offset reached total_length
 */
struct UploadCompletedEvent {
    UploadDescriptor descriptor;
    std::chrono::milliseconds duration;
};

/**
 * @brief The session entered the Failed state
 *
 * descriptor holds the last confirmed offset; it is resumable unless
 * is_resumable(error) is false.
 */
struct UploadFailedEvent {
    UploadDescriptor descriptor;
    Error error;
};

} // namespace tus::events
