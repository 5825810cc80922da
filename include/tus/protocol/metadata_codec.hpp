#pragma once

#include "tus/core/result.hpp"

#include <map>
#include <string>

namespace tus::protocol {

/// Descriptive key/value pairs sent once in Upload-Metadata (ordered so encoding is deterministic)
using Metadata = std::map<std::string, std::string>;

/**
 * @brief Encode metadata into an Upload-Metadata header value
 *
 * Each pair becomes "key base64(value)" ("key" alone for an empty value),
 * pairs are joined with ','. Fails with InvalidMetadataKey for an empty key
 * or a key containing ',' or whitespace.
 */
Result<std::string> encode_metadata(const Metadata& metadata);

/**
 * @brief Decode an Upload-Metadata header value
 *
 * Exact inverse of encode_metadata(). Any pair that cannot be decoded fails
 * the whole value with MalformedMetadata.
 */
Result<Metadata> decode_metadata(const std::string& encoded);

/// Validate a single key against the encoding rules
Result<void> validate_metadata_key(const std::string& key);

} // namespace tus::protocol
