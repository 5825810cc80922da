#pragma once

#include "tus/client/config.hpp"
#include "tus/core/cancellation.hpp"
#include "tus/core/result.hpp"
#include "tus/events/event_bus.hpp"
#include "tus/io/file_source.hpp"
#include "tus/network/transport.hpp"
#include "tus/protocol/server_info.hpp"
#include "tus/upload/descriptor.hpp"

#include <filesystem>
#include <memory>
#include <string>

namespace tus::client {

using upload::Metadata;
using upload::UploadDescriptor;

/**
 * @brief Entry point: creates, resumes, queries and terminates tus uploads
 *
 * Every call builds its own UploadStateMachine, so one Client can run
 * several uploads from different threads as long as the Transport is
 * thread-safe (HttpClient is) and each descriptor is used by one call at
 * a time.
 *
 * PERSISTENCE:
 * upload() returns the descriptor only on success. To survive a crash or
 * a failed run, subscribe to the EventBus and save the descriptor carried
 * by UploadCreatedEvent / ChunkAcceptedEvent / OffsetReconciledEvent /
 * UploadFailedEvent, then pass it to resume().
 */
class Client {
public:
    /// Client over the Beast HTTP transport
    explicit Client(ClientConfig config, events::EventBus* bus = nullptr);

    Client(ClientConfig config,
           std::shared_ptr<network::Transport> transport,
           events::EventBus* bus = nullptr);

    /// Creation handshake only; no bytes are sent
    Result<UploadDescriptor> create(const std::filesystem::path& source,
                                    const std::string& endpoint,
                                    const Metadata& metadata = {}) const;
    Result<UploadDescriptor> create(io::FileSource& source,
                                    const std::string& endpoint,
                                    const Metadata& metadata = {}) const;

    /// Create and transfer in one run
    Result<UploadDescriptor> upload(const std::filesystem::path& source,
                                    const std::string& endpoint,
                                    const Metadata& metadata = {},
                                    CancellationToken* cancel = nullptr) const;
    Result<UploadDescriptor> upload(io::FileSource& source,
                                    const std::string& endpoint,
                                    const Metadata& metadata = {},
                                    CancellationToken* cancel = nullptr) const;

    /**
     * @brief Continue a previously created upload
     *
     * The first overload reopens descriptor.source_path(). On success the
     * descriptor is complete; on failure it holds the last confirmed offset.
     */
    Result<void> resume(UploadDescriptor& descriptor, CancellationToken* cancel = nullptr) const;
    Result<void> resume(UploadDescriptor& descriptor,
                        io::FileSource& source,
                        CancellationToken* cancel = nullptr) const;

    /// Server's current Upload-Offset for the descriptor's location
    Result<uint64_t> get_offset(const UploadDescriptor& descriptor) const;

    /// DELETE the upload; an already-gone session counts as terminated
    Result<void> terminate(const UploadDescriptor& descriptor) const;

    /// OPTIONS capability discovery
    Result<protocol::ServerInfo> server_info(const std::string& endpoint) const;

    [[nodiscard]] const ClientConfig& config() const noexcept { return config_; }

private:
    Metadata with_filename(const std::filesystem::path& source, const Metadata& metadata) const;

    ClientConfig config_;
    std::shared_ptr<network::Transport> transport_;
    events::EventBus* bus_;
};

} // namespace tus::client
