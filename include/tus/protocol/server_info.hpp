#pragma once

#include "tus/core/result.hpp"
#include "tus/network/http_types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tus::protocol {

/**
 * @brief Capabilities a server advertises in its OPTIONS response
 */
struct ServerInfo {
    std::string resumable;                        ///< Tus-Resumable (may be empty)
    std::vector<std::string> versions;            ///< Tus-Version
    std::vector<std::string> extensions;          ///< Tus-Extension
    std::optional<uint64_t> max_size;             ///< Tus-Max-Size
    std::vector<std::string> checksum_algorithms; ///< Tus-Checksum-Algorithm

    [[nodiscard]] bool supports_version(const std::string& version) const;
    [[nodiscard]] bool supports_extension(const std::string& extension) const;
    [[nodiscard]] bool supports_checksum(const std::string& algorithm) const;

    /// Build from a 200/204 OPTIONS response; malformed numeric headers fail
    static Result<ServerInfo> from_response(const network::HttpResponse& response);
};

} // namespace tus::protocol
