#include "tus/upload/state_machine.hpp"
#include "tus/events/events.hpp"
#include "tus/network/url.hpp"
#include "tus/protocol/checksum.hpp"
#include "tus/protocol/headers.hpp"
#include "tus/protocol/metadata_codec.hpp"

#include <spdlog/spdlog.h>

#include <thread>

namespace tus::upload {

namespace {

std::chrono::milliseconds elapsed_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
}

Error cancelled_error(uint64_t offset) {
    return Error(ErrorKind::Cancelled,
        "upload cancelled at offset " + std::to_string(offset));
}

} // namespace

UploadStateMachine::UploadStateMachine(network::Transport& transport,
                                       const client::ClientConfig& config,
                                       events::EventBus* bus,
                                       CancellationToken* cancel)
    : transport_(transport)
    , config_(config)
    , bus_(bus)
    , cancel_(cancel)
    , engine_(transport, config, cancel) {
}

// ════════════════════════════════════════════════════════
// Creation
// ════════════════════════════════════════════════════════

Result<UploadDescriptor> UploadStateMachine::create(io::FileSource& source,
                                                    const std::string& endpoint,
                                                    const Metadata& metadata,
                                                    const std::string& source_path) {
    auto entered = session_.transition_to(UploadState::Creating);
    if (entered.is_error()) {
        return Err<UploadDescriptor>(entered.error());
    }

    const uint64_t total_length = source.size();
    UploadDescriptor pending({}, endpoint, total_length, metadata, source_path, config_.defer_length);

    auto valid = config_.validate();
    if (valid.is_error()) {
        return Err<UploadDescriptor>(fail(valid.error(), pending));
    }

    if (endpoint.empty()) {
        return Err<UploadDescriptor>(fail(
            Error(ErrorKind::Configuration, "no upload endpoint configured"), pending));
    }
    auto endpoint_url = network::Url::parse(endpoint);
    if (endpoint_url.is_error()) {
        return Err<UploadDescriptor>(fail(endpoint_url.error(), pending));
    }

    auto encoded = protocol::encode_metadata(metadata);
    if (encoded.is_error()) {
        return Err<UploadDescriptor>(fail(encoded.error(), pending));
    }

    auto negotiated = negotiate(endpoint, total_length, true);
    if (negotiated.is_error()) {
        return Err<UploadDescriptor>(fail(negotiated.error(), pending));
    }

    if (cancelled()) {
        return Err<UploadDescriptor>(fail(cancelled_error(0), pending));
    }

    spdlog::info("Creating upload at {} for {} ({} bytes{})", endpoint, source.describe(),
                 total_length, config_.defer_length ? ", length deferred" : "");

    const auto request = protocol::make_creation_request(endpoint, total_length,
                                                         config_.defer_length,
                                                         encoded.value(), config_.headers);
    auto response = transport_.execute(request, config_.request_timeout, cancel_);
    if (response.is_error()) {
        return Err<UploadDescriptor>(fail(response.error(), pending));
    }

    const auto& created = response.value();
    if (!created.is_success()) {
        return Err<UploadDescriptor>(fail(
            protocol::error_for_response(created, "POST " + endpoint), pending));
    }

    const std::string location_header = created.get_header(protocol::headers::kLocation);
    if (location_header.empty()) {
        return Err<UploadDescriptor>(fail(Error(ErrorKind::ProtocolRejection,
            "creation response " + std::to_string(created.status_code) + " has no Location header",
            created.status_code), pending));
    }

    auto location = network::Url::resolve(endpoint_url.value(), location_header);
    if (location.is_error()) {
        return Err<UploadDescriptor>(fail(Error(ErrorKind::ProtocolRejection,
            "unusable Location header '" + location_header + "': " + location.error().message,
            created.status_code), pending));
    }

    UploadDescriptor descriptor(location.value().to_string(), endpoint, total_length,
                                metadata, source_path, config_.defer_length);

    auto transferring = session_.transition_to(UploadState::Transferring);
    if (transferring.is_error()) {
        return Err<UploadDescriptor>(fail(transferring.error(), descriptor));
    }

    spdlog::info("Upload created at {}", descriptor.location());
    emit(events::UploadCreatedEvent(descriptor));
    return Ok(std::move(descriptor));
}

// ════════════════════════════════════════════════════════
// Resumption
// ════════════════════════════════════════════════════════

Result<void> UploadStateMachine::resume(UploadDescriptor& descriptor) {
    auto entered = session_.transition_to(UploadState::Resuming);
    if (entered.is_error()) {
        return entered;
    }

    auto valid = config_.validate();
    if (valid.is_error()) {
        return Err<void>(fail(valid.error(), descriptor));
    }
    if (descriptor.location().empty()) {
        return Err<void>(fail(
            Error(ErrorKind::Configuration, "descriptor has no upload location"), descriptor));
    }

    if (config_.checksum_enabled) {
        const std::string& endpoint = descriptor.endpoint().empty()
            ? descriptor.location() : descriptor.endpoint();
        auto negotiated = negotiate(endpoint, descriptor.total_length(), false);
        if (negotiated.is_error()) {
            return Err<void>(fail(negotiated.error(), descriptor));
        }
    }

    spdlog::info("Resuming upload {} from local offset {}",
                 descriptor.location(), descriptor.confirmed_offset());

    auto status = query_status(descriptor.location());
    if (status.is_error()) {
        return Err<void>(fail(status.error(), descriptor));
    }

    const auto& server = status.value();
    if (server.length && *server.length != descriptor.total_length()) {
        return Err<void>(fail(Error(ErrorKind::LengthConflict,
            "server reports Upload-Length " + std::to_string(*server.length) +
            ", descriptor has " + std::to_string(descriptor.total_length())), descriptor));
    }
    if (server.length_deferred && !descriptor.length_deferred()) {
        return Err<void>(fail(Error(ErrorKind::LengthConflict,
            "server reports a deferred length for an upload created with Upload-Length"), descriptor));
    }

    const uint64_t previous = descriptor.confirmed_offset();
    auto reconciled = descriptor.reconcile(server.offset);
    if (reconciled.is_error()) {
        return Err<void>(fail(reconciled.error(), descriptor));
    }
    if (descriptor.length_deferred()) {
        descriptor.set_length_declared(server.length.has_value());
    }

    if (previous != server.offset) {
        spdlog::info("Upload {} offset reconciled {} -> {}", descriptor.location(), previous, server.offset);
    }
    emit(events::OffsetReconciledEvent(descriptor, previous, "resume"));

    auto transferring = session_.transition_to(UploadState::Transferring);
    if (transferring.is_error()) {
        return Err<void>(fail(transferring.error(), descriptor));
    }
    return Ok();
}

// ════════════════════════════════════════════════════════
// Chunk loop
// ════════════════════════════════════════════════════════

Result<void> UploadStateMachine::transfer(UploadDescriptor& descriptor, io::FileSource& source) {
    if (session_.state() != UploadState::Transferring) {
        return Fail<void>(ErrorKind::InvalidState,
            std::string("transfer() requires state Transferring, current state is ") +
            to_string(session_.state()));
    }

    if (source.size() != descriptor.total_length()) {
        return Err<void>(fail(Error(ErrorKind::LengthConflict,
            "source " + source.describe() + " is " + std::to_string(source.size()) +
            " bytes, upload expects " + std::to_string(descriptor.total_length())), descriptor));
    }

    std::size_t transport_failures = 0;
    std::size_t mismatches = 0;

    while (!descriptor.is_complete()) {
        if (cancelled()) {
            return Err<void>(fail(cancelled_error(descriptor.confirmed_offset()), descriptor));
        }

        const uint64_t chunk_offset = descriptor.confirmed_offset();
        auto outcome = engine_.send_chunk(descriptor, source);

        // Whatever comes back once cancel() fired is dropped unapplied
        if (cancelled()) {
            return Err<void>(fail(cancelled_error(chunk_offset), descriptor));
        }

        switch (outcome.kind) {
            case TransferOutcome::Kind::Accepted: {
                auto advanced = descriptor.advance(outcome.server_offset);
                if (advanced.is_error()) {
                    return Err<void>(fail(advanced.error(), descriptor));
                }
                if (!descriptor.length_declared()) {
                    descriptor.set_length_declared(true);
                }
                transport_failures = 0;
                mismatches = 0;

                spdlog::debug("Upload {} chunk accepted: {} bytes at {}, {}/{}",
                              descriptor.location(), outcome.bytes_sent, chunk_offset,
                              descriptor.confirmed_offset(), descriptor.total_length());
                emit(events::ChunkAcceptedEvent(descriptor, chunk_offset, outcome.bytes_sent));
                break;
            }

            case TransferOutcome::Kind::OffsetMismatch: {
                // Only mismatches that leave the server where it was count
                // against the limit; a partial write still made progress
                if (outcome.server_offset > chunk_offset) {
                    mismatches = 0;
                }
                ++mismatches;
                if (mismatches > config_.max_offset_reconciliations) {
                    return Err<void>(fail(Error(ErrorKind::TransferAborted,
                        "offset still inconsistent after " +
                        std::to_string(config_.max_offset_reconciliations) +
                        " reconciliations (server at " + std::to_string(outcome.server_offset) + ")"),
                        descriptor));
                }

                auto reconciled = descriptor.reconcile(outcome.server_offset);
                if (reconciled.is_error()) {
                    return Err<void>(fail(reconciled.error(), descriptor));
                }
                transport_failures = 0;

                spdlog::warn("Upload {} offset mismatch: expected {}, server at {} ({}/{})",
                             descriptor.location(), chunk_offset + outcome.bytes_sent,
                             outcome.server_offset, mismatches, config_.max_offset_reconciliations);
                emit(events::OffsetReconciledEvent(descriptor, chunk_offset, "mismatch"));
                break;
            }

            case TransferOutcome::Kind::TransportFailure: {
                if (!is_retryable(outcome.error)) {
                    return Err<void>(fail(outcome.error, descriptor));
                }

                ++transport_failures;
                if (transport_failures >= config_.max_attempts) {
                    return Err<void>(fail(Error(ErrorKind::TransferAborted,
                        "chunk at offset " + std::to_string(chunk_offset) + " failed " +
                        std::to_string(transport_failures) + " times, last error: " +
                        outcome.error.to_string(), outcome.error.status_code), descriptor));
                }

                const auto delay = config_.backoff.delay_for(transport_failures);
                spdlog::warn("Upload {} chunk at {} failed (attempt {}/{}): {}; retrying in {}ms",
                             descriptor.location(), chunk_offset, transport_failures,
                             config_.max_attempts, outcome.error.to_string(), delay.count());
                emit(events::TransferRetryEvent{descriptor.location(), chunk_offset,
                                                transport_failures, delay, outcome.error});

                if (!wait_backoff(delay)) {
                    return Err<void>(fail(cancelled_error(chunk_offset), descriptor));
                }
                break;
            }

            case TransferOutcome::Kind::Rejected:
                return Err<void>(fail(outcome.error, descriptor));
        }
    }

    auto completed = session_.transition_to(UploadState::Completed);
    if (completed.is_error()) {
        return Err<void>(fail(completed.error(), descriptor));
    }

    const auto duration = elapsed_since(session_.started_at());
    spdlog::info("Upload {} completed: {} bytes in {}ms",
                 descriptor.location(), descriptor.total_length(), duration.count());
    emit(events::UploadCompletedEvent{descriptor, duration});
    return Ok();
}

// ════════════════════════════════════════════════════════
// Server queries
// ════════════════════════════════════════════════════════

Result<protocol::ServerInfo> UploadStateMachine::discover(const std::string& endpoint) {
    const auto request = protocol::make_options_request(endpoint, config_.headers);
    auto response = transport_.execute(request, config_.request_timeout, cancel_);
    if (response.is_error()) {
        return Err<protocol::ServerInfo>(response.error());
    }
    if (!response.value().is_success()) {
        return Err<protocol::ServerInfo>(
            protocol::error_for_response(response.value(), "OPTIONS " + endpoint));
    }
    return protocol::ServerInfo::from_response(response.value());
}

Result<protocol::UploadStatus> UploadStateMachine::query_status(const std::string& location) {
    const auto request = protocol::make_status_request(location, config_.headers);

    for (std::size_t attempt = 1;; ++attempt) {
        if (cancelled()) {
            return Fail<protocol::UploadStatus>(ErrorKind::Cancelled,
                "status query for " + location + " cancelled");
        }

        auto response = transport_.execute(request, config_.request_timeout, cancel_);
        Error error;
        if (response.is_ok()) {
            if (response.value().is_success()) {
                return protocol::parse_status_response(response.value());
            }
            error = protocol::error_for_response(response.value(), "HEAD " + location);
        } else {
            error = response.error();
        }

        if (!is_retryable(error)) {
            return Err<protocol::UploadStatus>(std::move(error));
        }
        if (attempt >= config_.max_attempts) {
            return Fail<protocol::UploadStatus>(ErrorKind::TransferAborted,
                "status query for " + location + " failed " + std::to_string(attempt) +
                " times, last error: " + error.to_string(), error.status_code);
        }

        const auto delay = config_.backoff.delay_for(attempt);
        spdlog::warn("HEAD {} failed (attempt {}/{}): {}; retrying in {}ms",
                     location, attempt, config_.max_attempts, error.to_string(), delay.count());
        emit(events::TransferRetryEvent{location, 0, attempt, delay, error});

        if (!wait_backoff(delay)) {
            return Fail<protocol::UploadStatus>(ErrorKind::Cancelled,
                "status query for " + location + " cancelled");
        }
    }
}

// ════════════════════════════════════════════════════════
// Helpers
// ════════════════════════════════════════════════════════

Result<void> UploadStateMachine::negotiate(const std::string& endpoint,
                                           uint64_t total_length,
                                           bool creating) {
    const bool want_defer = creating && config_.defer_length;
    if (!config_.checksum_enabled && !want_defer) {
        return Ok();
    }

    auto info = discover(endpoint);
    if (info.is_error()) {
        return Err<void>(info.error());
    }
    const auto& server = info.value();

    if (config_.checksum_enabled) {
        if (!server.supports_extension(protocol::headers::kExtChecksum)) {
            return Fail<void>(ErrorKind::UnsupportedExtension,
                std::string("server at ") + endpoint + " does not advertise the " +
                protocol::headers::kExtChecksum + " extension");
        }
        if (!server.checksum_algorithms.empty() && !server.supports_checksum(config_.checksum_algorithm)) {
            return Fail<void>(ErrorKind::UnsupportedExtension,
                "server at " + endpoint + " does not accept checksum algorithm " +
                config_.checksum_algorithm);
        }
    }

    if (want_defer && !server.supports_extension(protocol::headers::kExtDeferLength)) {
        return Fail<void>(ErrorKind::UnsupportedExtension,
            std::string("server at ") + endpoint + " does not advertise the " +
            protocol::headers::kExtDeferLength + " extension");
    }

    if (creating && server.max_size && total_length > *server.max_size) {
        return Fail<void>(ErrorKind::FileTooLarge,
            std::to_string(total_length) + " bytes exceed the server's Tus-Max-Size of " +
            std::to_string(*server.max_size));
    }

    spdlog::debug("Server at {} supports extensions required by this upload", endpoint);
    return Ok();
}

Error UploadStateMachine::fail(Error error, const UploadDescriptor& descriptor) {
    auto marked = session_.mark_failed(error);
    if (marked.is_error()) {
        spdlog::error("Cannot mark upload failed: {}", marked.error().to_string());
    }

    spdlog::error("Upload {} failed at offset {}: {}",
                  descriptor.location().empty() ? descriptor.endpoint() : descriptor.location(),
                  descriptor.confirmed_offset(), error.to_string());
    emit(events::UploadFailedEvent{descriptor, error});
    return error;
}

bool UploadStateMachine::wait_backoff(std::chrono::milliseconds delay) {
    if (cancel_) {
        return !cancel_->wait_for(delay);
    }
    std::this_thread::sleep_for(delay);
    return true;
}

} // namespace tus::upload
