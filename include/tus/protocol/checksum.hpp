#pragma once

#include "tus/core/result.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace tus::protocol {

/// Algorithms this client can compute for the checksum extension
bool is_supported_checksum_algorithm(const std::string& algorithm);

/**
 * @brief Digest of @p size bytes at @p data, base64 encoded
 *
 * @param algorithm "sha1", "sha256" or "md5" (lower case, as advertised in
 *                  Tus-Checksum-Algorithm)
 */
Result<std::string> compute_checksum(const std::string& algorithm,
                                     const uint8_t* data, std::size_t size);

/// Value for the Upload-Checksum header: "<algorithm> <base64 digest>"
Result<std::string> checksum_header_value(const std::string& algorithm,
                                          const std::vector<uint8_t>& chunk);

} // namespace tus::protocol
