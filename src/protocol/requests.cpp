#include "tus/protocol/requests.hpp"
#include "tus/protocol/headers.hpp"

#include <charconv>

namespace tus::protocol {

using network::HttpMethod;

namespace {

HttpRequest base_request(HttpMethod method, const std::string& url, const HeaderMap& extra_headers) {
    HttpRequest request;
    request.method = method;
    request.url = url;
    request.headers = extra_headers;
    request.set_header(headers::kTusResumable, headers::kProtocolVersion);
    return request;
}

} // namespace

HttpRequest make_creation_request(const std::string& endpoint,
                                  uint64_t total_length,
                                  bool defer_length,
                                  const std::string& encoded_metadata,
                                  const HeaderMap& extra_headers) {
    auto request = base_request(HttpMethod::POST, endpoint, extra_headers);
    if (defer_length) {
        request.set_header(headers::kUploadDeferLength, "1");
    } else {
        request.set_header(headers::kUploadLength, std::to_string(total_length));
    }
    if (!encoded_metadata.empty()) {
        request.set_header(headers::kUploadMetadata, encoded_metadata);
    }
    return request;
}

HttpRequest make_status_request(const std::string& location, const HeaderMap& extra_headers) {
    return base_request(HttpMethod::HEAD, location, extra_headers);
}

HttpRequest make_patch_request(const std::string& location,
                               uint64_t offset,
                               std::vector<uint8_t> body,
                               const std::optional<std::string>& checksum,
                               const std::optional<uint64_t>& declare_length,
                               const HeaderMap& extra_headers) {
    auto request = base_request(HttpMethod::PATCH, location, extra_headers);
    request.set_header(headers::kContentType, headers::kOffsetOctetStream);
    request.set_header(headers::kUploadOffset, std::to_string(offset));
    if (checksum && !checksum->empty()) {
        request.set_header(headers::kUploadChecksum, *checksum);
    }
    if (declare_length) {
        request.set_header(headers::kUploadLength, std::to_string(*declare_length));
    }
    request.body = std::move(body);
    return request;
}

HttpRequest make_termination_request(const std::string& location, const HeaderMap& extra_headers) {
    return base_request(HttpMethod::DELETE_METHOD, location, extra_headers);
}

HttpRequest make_options_request(const std::string& endpoint, const HeaderMap& extra_headers) {
    // OPTIONS must work without a version so servers can tell us which they speak
    HttpRequest request;
    request.method = HttpMethod::OPTIONS;
    request.url = endpoint;
    request.headers = extra_headers;
    return request;
}

std::optional<uint64_t> parse_uint64(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    uint64_t value = 0;
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc() || ptr != end) {
        return std::nullopt;
    }
    return value;
}

Result<uint64_t> parse_offset(const HttpResponse& response) {
    if (!response.has_header(headers::kUploadOffset)) {
        return Fail<uint64_t>(ErrorKind::ProtocolRejection,
            "response is missing Upload-Offset", response.status_code);
    }
    const auto offset = parse_uint64(response.get_header(headers::kUploadOffset));
    if (!offset) {
        return Fail<uint64_t>(ErrorKind::ProtocolRejection,
            "invalid Upload-Offset: '" + response.get_header(headers::kUploadOffset) + "'",
            response.status_code);
    }
    return Ok(*offset);
}

Result<UploadStatus> parse_status_response(const HttpResponse& response) {
    auto offset = parse_offset(response);
    if (offset.is_error()) {
        return Err<UploadStatus>(offset.error());
    }

    UploadStatus status;
    status.offset = offset.value();

    if (response.has_header(headers::kUploadLength)) {
        const auto length = parse_uint64(response.get_header(headers::kUploadLength));
        if (!length) {
            return Fail<UploadStatus>(ErrorKind::ProtocolRejection,
                "invalid Upload-Length: '" + response.get_header(headers::kUploadLength) + "'",
                response.status_code);
        }
        status.length = *length;
    }
    status.length_deferred = response.get_header(headers::kUploadDeferLength) == "1";
    return Ok(status);
}

ErrorKind classify_status(int status_code) {
    switch (status_code) {
        case 404:
        case 410:
            return ErrorKind::SessionGone;
        case 413:
            return ErrorKind::FileTooLarge;
        case 460:
            return ErrorKind::ChecksumMismatch;
        case 400:
        case 401:
        case 403:
        case 409:
        case 412:
        case 415:
            return ErrorKind::ProtocolRejection;
        default:
            return ErrorKind::Transport;
    }
}

Error error_for_response(const HttpResponse& response, const std::string& context) {
    std::string message = context + " returned HTTP " + std::to_string(response.status_code);
    if (!response.reason_phrase.empty()) {
        message += " " + response.reason_phrase;
    }
    const std::string body = response.body_as_string();
    if (!body.empty() && body.size() <= 512) {
        message += ": " + body;
    }
    return Error(classify_status(response.status_code), std::move(message), response.status_code);
}

} // namespace tus::protocol
