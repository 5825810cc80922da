#pragma once

#include "tus/core/result.hpp"
#include "tus/network/http_types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tus::protocol {

using network::HeaderMap;
using network::HttpRequest;
using network::HttpResponse;

// ════════════════════════════════════════════════════════
// Request builders
// ════════════════════════════════════════════════════════
//
// Every builder adds Tus-Resumable and then the caller's extra headers;
// protocol headers set afterwards win over extras with the same name.

/// POST to the creation endpoint; Upload-Defer-Length replaces Upload-Length when @p defer_length
HttpRequest make_creation_request(const std::string& endpoint,
                                  uint64_t total_length,
                                  bool defer_length,
                                  const std::string& encoded_metadata,
                                  const HeaderMap& extra_headers);

/// HEAD on the upload location
HttpRequest make_status_request(const std::string& location,
                                const HeaderMap& extra_headers);

/**
 * @brief PATCH carrying one chunk
 *
 * @param checksum       Upload-Checksum value, omitted when empty
 * @param declare_length Upload-Length to send for a deferred-length upload
 */
HttpRequest make_patch_request(const std::string& location,
                               uint64_t offset,
                               std::vector<uint8_t> body,
                               const std::optional<std::string>& checksum,
                               const std::optional<uint64_t>& declare_length,
                               const HeaderMap& extra_headers);

/// DELETE on the upload location (termination extension)
HttpRequest make_termination_request(const std::string& location,
                                     const HeaderMap& extra_headers);

/// OPTIONS on the endpoint (capability discovery)
HttpRequest make_options_request(const std::string& endpoint,
                                 const HeaderMap& extra_headers);

// ════════════════════════════════════════════════════════
// Response interpretation
// ════════════════════════════════════════════════════════

/**
 * @brief Server-side view of an upload returned by HEAD
 */
struct UploadStatus {
    uint64_t offset = 0;
    std::optional<uint64_t> length;   ///< absent while the length is deferred
    bool length_deferred = false;
};

/// Strict decimal parse of a header value (digits only, no overflow)
std::optional<uint64_t> parse_uint64(const std::string& text);

/// Upload-Offset of a successful PATCH/HEAD response
Result<uint64_t> parse_offset(const HttpResponse& response);

/// Offset and length of a successful HEAD response
Result<UploadStatus> parse_status_response(const HttpResponse& response);

/**
 * @brief Map a non-2xx status to the error kind the protocol assigns it
 *
 * 404/410 → SessionGone, 413 → FileTooLarge, 460 → ChecksumMismatch,
 * 400/401/403/409/412/415 → ProtocolRejection; 5xx, 423 and every status
 * without a protocol meaning → Transport (retryable).
 */
ErrorKind classify_status(int status_code);

/// Error for a non-2xx response, with the status and any body text in the message
Error error_for_response(const HttpResponse& response, const std::string& context);

} // namespace tus::protocol
