#pragma once

#include "tus/core/result.hpp"
#include "tus/network/http_types.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

namespace tus::client {

/**
 * @brief Exponential backoff between retries of the same request
 *
 * delay(n) = min(initial_delay * multiplier^(n-1), max_delay) for the
 * n-th consecutive failure (n >= 1).
 */
struct BackoffPolicy {
    std::chrono::milliseconds initial_delay{500};
    double multiplier = 2.0;
    std::chrono::milliseconds max_delay{30000};

    [[nodiscard]] std::chrono::milliseconds delay_for(std::size_t attempt) const;
};

/**
 * @brief Immutable settings shared by every upload a Client runs
 *
 * Build one, validate() it, and hand it to the Client; nothing reads
 * settings from anywhere else.
 */
struct ClientConfig {
    static constexpr std::size_t kDefaultChunkSize = 6 * 1024 * 1024;

    std::size_t chunk_size = kDefaultChunkSize;

    /// Consecutive transport failures tolerated for one request
    std::size_t max_attempts = 3;

    /// Consecutive offset mismatches without progress tolerated before aborting
    std::size_t max_offset_reconciliations = 3;

    BackoffPolicy backoff;

    std::chrono::milliseconds request_timeout{30000};

    /// Send Upload-Checksum with every chunk (requires server support)
    bool checksum_enabled = false;
    std::string checksum_algorithm = "sha1";

    /// Create with Upload-Defer-Length and declare the length on the first PATCH
    bool defer_length = false;

    /// Add the source file name as "filename" metadata when the caller did not
    bool include_filename = true;

    /// Extra headers sent with every request (e.g. Authorization)
    network::HeaderMap headers;

    Result<void> validate() const;

    /**
     * @brief Read settings from a JSON object; missing keys keep defaults
     *
     * Durations are milliseconds: "request_timeout_ms",
     * "backoff": {"initial_delay_ms", "multiplier", "max_delay_ms"}.
     */
    static Result<ClientConfig> from_json(const nlohmann::json& j);
    static Result<ClientConfig> load_from_file(const std::filesystem::path& path);
};

} // namespace tus::client
