#include "tus/core/error.hpp"

namespace tus {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Configuration: return "ConfigurationError";
        case ErrorKind::InvalidMetadataKey: return "InvalidMetadataKey";
        case ErrorKind::MalformedMetadata: return "MalformedMetadata";
        case ErrorKind::Transport: return "TransportFailure";
        case ErrorKind::TransferAborted: return "TransferAborted";
        case ErrorKind::ProtocolRejection: return "ProtocolRejection";
        case ErrorKind::ChecksumMismatch: return "ChecksumMismatch";
        case ErrorKind::FileTooLarge: return "FileTooLarge";
        case ErrorKind::SessionGone: return "SessionGone";
        case ErrorKind::LengthConflict: return "LengthConflict";
        case ErrorKind::UnsupportedExtension: return "UnsupportedExtension";
        case ErrorKind::RegressiveOffset: return "RegressiveOffset";
        case ErrorKind::OffsetExceedsLength: return "OffsetExceedsLength";
        case ErrorKind::SourceRead: return "SourceRead";
        case ErrorKind::Cancelled: return "Cancelled";
        case ErrorKind::InvalidState: return "InvalidState";
    }
    return "Unknown";
}

const char* to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::Configuration: return "configuration";
        case ErrorCategory::Encoding: return "encoding";
        case ErrorCategory::Transport: return "transport";
        case ErrorCategory::Protocol: return "protocol";
        case ErrorCategory::Invariant: return "invariant";
        case ErrorCategory::Io: return "io";
        case ErrorCategory::Cancelled: return "cancelled";
    }
    return "unknown";
}

ErrorCategory category_of(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Configuration:
            return ErrorCategory::Configuration;
        case ErrorKind::InvalidMetadataKey:
        case ErrorKind::MalformedMetadata:
            return ErrorCategory::Encoding;
        case ErrorKind::Transport:
        case ErrorKind::TransferAborted:
            return ErrorCategory::Transport;
        case ErrorKind::ProtocolRejection:
        case ErrorKind::ChecksumMismatch:
        case ErrorKind::FileTooLarge:
        case ErrorKind::SessionGone:
        case ErrorKind::LengthConflict:
        case ErrorKind::UnsupportedExtension:
            return ErrorCategory::Protocol;
        case ErrorKind::RegressiveOffset:
        case ErrorKind::OffsetExceedsLength:
        case ErrorKind::InvalidState:
            return ErrorCategory::Invariant;
        case ErrorKind::SourceRead:
            return ErrorCategory::Io;
        case ErrorKind::Cancelled:
            return ErrorCategory::Cancelled;
    }
    return ErrorCategory::Invariant;
}

bool is_resumable(const Error& error) {
    switch (error.kind) {
        case ErrorKind::Transport:
        case ErrorKind::TransferAborted:
        case ErrorKind::SourceRead:
        case ErrorKind::Cancelled:
            return true;
        default:
            return false;
    }
}

bool is_retryable(const Error& error) {
    return error.kind == ErrorKind::Transport;
}

std::string Error::to_string() const {
    std::string text = tus::to_string(kind);
    if (status_code != 0) {
        text += " (HTTP " + std::to_string(status_code) + ")";
    }
    if (!message.empty()) {
        text += ": " + message;
    }
    return text;
}

} // namespace tus
