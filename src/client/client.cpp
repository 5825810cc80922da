#include "tus/client/client.hpp"
#include "tus/network/http_client.hpp"
#include "tus/protocol/requests.hpp"
#include "tus/upload/state_machine.hpp"

#include <spdlog/spdlog.h>

namespace tus::client {

Client::Client(ClientConfig config, events::EventBus* bus)
    : Client(std::move(config), std::make_shared<network::HttpClient>(), bus) {
}

Client::Client(ClientConfig config,
               std::shared_ptr<network::Transport> transport,
               events::EventBus* bus)
    : config_(std::move(config))
    , transport_(std::move(transport))
    , bus_(bus) {
}

Metadata Client::with_filename(const std::filesystem::path& source, const Metadata& metadata) const {
    Metadata result = metadata;
    if (config_.include_filename && result.find("filename") == result.end()) {
        const auto name = source.filename().string();
        if (!name.empty()) {
            result.emplace("filename", name);
        }
    }
    return result;
}

// ════════════════════════════════════════════════════════
// Creation
// ════════════════════════════════════════════════════════

Result<UploadDescriptor> Client::create(const std::filesystem::path& source,
                                        const std::string& endpoint,
                                        const Metadata& metadata) const {
    auto file = io::LocalFileSource::open(source);
    if (file.is_error()) {
        return Err<UploadDescriptor>(file.error());
    }

    upload::UploadStateMachine machine(*transport_, config_, bus_);
    return machine.create(*file.value(), endpoint, with_filename(source, metadata), source.string());
}

Result<UploadDescriptor> Client::create(io::FileSource& source,
                                        const std::string& endpoint,
                                        const Metadata& metadata) const {
    upload::UploadStateMachine machine(*transport_, config_, bus_);
    return machine.create(source, endpoint, metadata);
}

// ════════════════════════════════════════════════════════
// Upload / resume
// ════════════════════════════════════════════════════════

Result<UploadDescriptor> Client::upload(const std::filesystem::path& source,
                                        const std::string& endpoint,
                                        const Metadata& metadata,
                                        CancellationToken* cancel) const {
    auto file = io::LocalFileSource::open(source);
    if (file.is_error()) {
        return Err<UploadDescriptor>(file.error());
    }

    upload::UploadStateMachine machine(*transport_, config_, bus_, cancel);
    auto created = machine.create(*file.value(), endpoint, with_filename(source, metadata), source.string());
    if (created.is_error()) {
        return created;
    }

    UploadDescriptor descriptor = std::move(created.value());
    auto transferred = machine.transfer(descriptor, *file.value());
    if (transferred.is_error()) {
        return Err<UploadDescriptor>(transferred.error());
    }
    return Ok(std::move(descriptor));
}

Result<UploadDescriptor> Client::upload(io::FileSource& source,
                                        const std::string& endpoint,
                                        const Metadata& metadata,
                                        CancellationToken* cancel) const {
    upload::UploadStateMachine machine(*transport_, config_, bus_, cancel);
    auto created = machine.create(source, endpoint, metadata);
    if (created.is_error()) {
        return created;
    }

    UploadDescriptor descriptor = std::move(created.value());
    auto transferred = machine.transfer(descriptor, source);
    if (transferred.is_error()) {
        return Err<UploadDescriptor>(transferred.error());
    }
    return Ok(std::move(descriptor));
}

Result<void> Client::resume(UploadDescriptor& descriptor, CancellationToken* cancel) const {
    if (descriptor.source_path().empty()) {
        return Fail<void>(ErrorKind::Configuration,
            "descriptor for " + descriptor.location() + " has no source path; pass a FileSource");
    }

    auto file = io::LocalFileSource::open(descriptor.source_path());
    if (file.is_error()) {
        return Err<void>(file.error());
    }
    return resume(descriptor, *file.value(), cancel);
}

Result<void> Client::resume(UploadDescriptor& descriptor,
                            io::FileSource& source,
                            CancellationToken* cancel) const {
    upload::UploadStateMachine machine(*transport_, config_, bus_, cancel);
    auto resumed = machine.resume(descriptor);
    if (resumed.is_error()) {
        return resumed;
    }
    return machine.transfer(descriptor, source);
}

// ════════════════════════════════════════════════════════
// Queries
// ════════════════════════════════════════════════════════

Result<uint64_t> Client::get_offset(const UploadDescriptor& descriptor) const {
    if (auto valid = config_.validate(); valid.is_error()) {
        return Err<uint64_t>(valid.error());
    }
    if (descriptor.location().empty()) {
        return Fail<uint64_t>(ErrorKind::Configuration, "descriptor has no upload location");
    }

    upload::UploadStateMachine machine(*transport_, config_);
    auto status = machine.query_status(descriptor.location());
    if (status.is_error()) {
        return Err<uint64_t>(status.error());
    }
    return Ok(status.value().offset);
}

Result<void> Client::terminate(const UploadDescriptor& descriptor) const {
    if (auto valid = config_.validate(); valid.is_error()) {
        return valid;
    }
    if (descriptor.location().empty()) {
        return Fail<void>(ErrorKind::Configuration, "descriptor has no upload location");
    }

    const auto request = protocol::make_termination_request(descriptor.location(), config_.headers);
    auto response = transport_->execute(request, config_.request_timeout);
    if (response.is_error()) {
        return Err<void>(response.error());
    }

    const auto& result = response.value();
    if (result.is_success()) {
        spdlog::info("Upload {} terminated", descriptor.location());
        return Ok();
    }

    auto error = protocol::error_for_response(result, "DELETE " + descriptor.location());
    if (error.kind == ErrorKind::SessionGone) {
        spdlog::info("Upload {} already gone ({})", descriptor.location(), result.status_code);
        return Ok();
    }
    return Err<void>(std::move(error));
}

Result<protocol::ServerInfo> Client::server_info(const std::string& endpoint) const {
    if (auto valid = config_.validate(); valid.is_error()) {
        return Err<protocol::ServerInfo>(valid.error());
    }
    if (endpoint.empty()) {
        return Fail<protocol::ServerInfo>(ErrorKind::Configuration, "no upload endpoint configured");
    }
    upload::UploadStateMachine machine(*transport_, config_);
    return machine.discover(endpoint);
}

} // namespace tus::client
