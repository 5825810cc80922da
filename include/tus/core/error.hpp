#pragma once

#include <string>

namespace tus {

/**
 * @brief Discriminates every failure the library can surface
 *
 * Callers branch on the kind to decide whether a session can be resumed
 * later (transport trouble, cancellation) or has to be recreated.
 */
enum class ErrorKind {
    Configuration,         // invalid chunk size, missing endpoint, bad config file
    InvalidMetadataKey,    // key empty or containing ',' / whitespace
    MalformedMetadata,     // Upload-Metadata value that cannot be decoded
    Transport,             // connection, timeout, 5xx - retryable
    TransferAborted,       // retry ceiling reached
    ProtocolRejection,     // server-definitive refusal
    ChecksumMismatch,      // 460 Checksum Mismatch
    FileTooLarge,          // 413 or above Tus-Max-Size
    SessionGone,           // 404 / 410 on an existing location
    LengthConflict,        // server length differs from the descriptor
    UnsupportedExtension,  // capability requested but not advertised
    RegressiveOffset,      // advance() with a smaller offset
    OffsetExceedsLength,   // offset beyond total_length
    SourceRead,            // local read failure or truncated source
    Cancelled,             // caller cancelled between or during chunks
    InvalidState           // illegal state machine transition
};

enum class ErrorCategory {
    Configuration,
    Encoding,
    Transport,
    Protocol,
    Invariant,
    Io,
    Cancelled
};

struct Error {
    ErrorKind kind = ErrorKind::Transport;
    std::string message;
    int status_code = 0; ///< HTTP status when the error came from a response

    Error() = default;
    Error(ErrorKind k, std::string msg, int status = 0)
        : kind(k), message(std::move(msg)), status_code(status) {}

    std::string to_string() const;
};

const char* to_string(ErrorKind kind);
const char* to_string(ErrorCategory category);

ErrorCategory category_of(ErrorKind kind);

/// True when resuming the same session later can still succeed
bool is_resumable(const Error& error);

/// True for failures the transfer loop retries locally with backoff
bool is_retryable(const Error& error);

} // namespace tus
