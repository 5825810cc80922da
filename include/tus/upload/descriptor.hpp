#pragma once

#include "tus/core/result.hpp"
#include "tus/protocol/metadata_codec.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace tus::upload {

using protocol::Metadata;

/**
 * @brief Persistable record of one upload session
 *
 * This is the only state a caller has to keep to resume after a crash.
 * The location and length are fixed once creation succeeds; the confirmed
 * offset moves only through advance() (chunk acknowledged) and reconcile()
 * (server reported its offset). Both leave the descriptor untouched when
 * they fail.
 *
 * Invariant: 0 <= confirmed_offset() <= total_length()
 */
class UploadDescriptor {
public:
    UploadDescriptor() = default;

    UploadDescriptor(std::string location,
                     std::string endpoint,
                     uint64_t total_length,
                     Metadata metadata,
                     std::string source_path = {},
                     bool length_deferred = false);

    [[nodiscard]] const std::string& location() const noexcept { return location_; }
    [[nodiscard]] const std::string& endpoint() const noexcept { return endpoint_; }
    [[nodiscard]] const std::string& source_path() const noexcept { return source_path_; }
    [[nodiscard]] uint64_t total_length() const noexcept { return total_length_; }
    [[nodiscard]] uint64_t confirmed_offset() const noexcept { return confirmed_offset_; }
    [[nodiscard]] const Metadata& metadata() const noexcept { return metadata_; }

    /// Creation used Upload-Defer-Length
    [[nodiscard]] bool length_deferred() const noexcept { return length_deferred_; }

    /// Server knows total_length (always true unless deferred and not yet sent)
    [[nodiscard]] bool length_declared() const noexcept { return length_declared_; }

    [[nodiscard]] uint64_t remaining() const noexcept { return total_length_ - confirmed_offset_; }

    /// All bytes confirmed and the length is known to the server
    [[nodiscard]] bool is_complete() const noexcept {
        return confirmed_offset_ == total_length_ && length_declared_;
    }

    /**
     * @brief Move the confirmed offset forward after an acknowledged chunk
     *
     * Fails with RegressiveOffset below the current offset and with
     * OffsetExceedsLength beyond total_length.
     */
    Result<void> advance(uint64_t new_offset);

    /**
     * @brief Overwrite the confirmed offset with the server's value
     *
     * The server is authoritative, so the offset may move backwards.
     * Fails with OffsetExceedsLength beyond total_length.
     */
    Result<void> reconcile(uint64_t server_offset);

    /// Record whether the server has been told total_length (deferred uploads)
    void set_length_declared(bool declared) noexcept { length_declared_ = declared; }

    [[nodiscard]] nlohmann::json to_json() const;
    static Result<UploadDescriptor> from_json(const nlohmann::json& j);

    [[nodiscard]] std::string to_string(int indent = 2) const;
    static Result<UploadDescriptor> from_string(const std::string& text);

    bool operator==(const UploadDescriptor& other) const;
    bool operator!=(const UploadDescriptor& other) const { return !(*this == other); }

private:
    std::string location_;
    std::string endpoint_;
    std::string source_path_;
    uint64_t total_length_ = 0;
    uint64_t confirmed_offset_ = 0;
    Metadata metadata_;
    bool length_deferred_ = false;
    bool length_declared_ = true;
};

} // namespace tus::upload
