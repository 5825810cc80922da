#include "tus/upload/chunk_engine.hpp"
#include "tus/protocol/checksum.hpp"
#include "tus/protocol/requests.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace tus::upload {

ChunkTransferEngine::ChunkTransferEngine(network::Transport& transport,
                                         const client::ClientConfig& config,
                                         const CancellationToken* cancel)
    : transport_(transport)
    , config_(config)
    , cancel_(cancel) {
}

std::size_t ChunkTransferEngine::next_chunk_size(const UploadDescriptor& descriptor) const noexcept {
    return static_cast<std::size_t>(
        std::min<uint64_t>(config_.chunk_size, descriptor.remaining()));
}

TransferOutcome ChunkTransferEngine::send_chunk(const UploadDescriptor& descriptor,
                                                io::FileSource& source) const {
    const uint64_t offset = descriptor.confirmed_offset();
    const std::size_t length = next_chunk_size(descriptor);

    auto data = source.read(offset, length);
    if (data.is_error()) {
        return TransferOutcome::rejected(data.error());
    }
    if (data.value().size() != length) {
        return TransferOutcome::rejected(Error(ErrorKind::SourceRead,
            "source " + source.describe() + " returned " + std::to_string(data.value().size()) +
            " bytes at offset " + std::to_string(offset) + ", expected " + std::to_string(length)));
    }

    std::optional<std::string> checksum;
    if (config_.checksum_enabled) {
        auto value = protocol::checksum_header_value(config_.checksum_algorithm, data.value());
        if (value.is_error()) {
            return TransferOutcome::rejected(value.error());
        }
        checksum = value.value();
    }

    std::optional<uint64_t> declare_length;
    if (!descriptor.length_declared()) {
        declare_length = descriptor.total_length();
    }

    auto request = protocol::make_patch_request(descriptor.location(), offset,
                                                std::move(data.value()), checksum,
                                                declare_length, config_.headers);

    spdlog::debug("PATCH {} offset={} bytes={}", descriptor.location(), offset, length);

    auto response = transport_.execute(request, config_.request_timeout, cancel_);
    if (response.is_error()) {
        return TransferOutcome::transport_failure(response.error());
    }
    return interpret(descriptor, response.value(), length);
}

TransferOutcome ChunkTransferEngine::interpret(const UploadDescriptor& descriptor,
                                               const network::HttpResponse& response,
                                               uint64_t bytes_sent) const {
    if (response.status_code == static_cast<int>(network::HttpStatus::CONFLICT)) {
        // 409 carries no offset; ask the server where it actually is
        spdlog::warn("PATCH {} rejected with 409 at offset {}, querying server offset",
                     descriptor.location(), descriptor.confirmed_offset());
        return query_server_offset(descriptor, bytes_sent);
    }

    if (!response.is_success()) {
        auto error = protocol::error_for_response(response, "PATCH " + descriptor.location());
        if (is_retryable(error)) {
            return TransferOutcome::transport_failure(std::move(error));
        }
        return TransferOutcome::rejected(std::move(error));
    }

    auto server_offset = protocol::parse_offset(response);
    if (server_offset.is_error()) {
        return TransferOutcome::rejected(server_offset.error());
    }

    const uint64_t expected = descriptor.confirmed_offset() + bytes_sent;
    if (server_offset.value() == expected) {
        return TransferOutcome::accepted(expected, bytes_sent);
    }

    spdlog::warn("PATCH {} acknowledged offset {} but {} was expected",
                 descriptor.location(), server_offset.value(), expected);
    return TransferOutcome::offset_mismatch(server_offset.value(), bytes_sent);
}

TransferOutcome ChunkTransferEngine::query_server_offset(const UploadDescriptor& descriptor,
                                                         uint64_t bytes_sent) const {
    const auto request = protocol::make_status_request(descriptor.location(), config_.headers);
    auto response = transport_.execute(request, config_.request_timeout, cancel_);
    if (response.is_error()) {
        return TransferOutcome::transport_failure(response.error());
    }
    if (!response.value().is_success()) {
        auto error = protocol::error_for_response(response.value(), "HEAD " + descriptor.location());
        if (is_retryable(error)) {
            return TransferOutcome::transport_failure(std::move(error));
        }
        return TransferOutcome::rejected(std::move(error));
    }

    auto server_offset = protocol::parse_offset(response.value());
    if (server_offset.is_error()) {
        return TransferOutcome::rejected(server_offset.error());
    }
    return TransferOutcome::offset_mismatch(server_offset.value(), bytes_sent);
}

} // namespace tus::upload
