#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#ifdef _WIN32
#include <cstring>
#else
#include <strings.h>
#endif

namespace tus {
namespace network {

/**
 * @brief HTTP request methods used by the tus protocol
 *
 * POST creates an upload, HEAD queries its offset, PATCH appends bytes,
 * DELETE terminates it and OPTIONS discovers server capabilities.
 */
enum class HttpMethod {
    POST,
    PATCH,          // Append bytes at Upload-Offset
    HEAD,           // Query Upload-Offset / Upload-Length
    DELETE_METHOD,  // Terminate (renamed to avoid Windows macro conflict)
    OPTIONS         // Server capability discovery
};

/**
 * @brief Status codes with a defined meaning in tus 1.0.0
 *
 * 460 is not part of RFC 7231; the checksum extension reserves it for
 * "Checksum Mismatch".
 */
enum class HttpStatus {
    OK = 200,
    CREATED = 201,
    NO_CONTENT = 204,
    BAD_REQUEST = 400,
    FORBIDDEN = 403,
    NOT_FOUND = 404,
    CONFLICT = 409,                 // Upload-Offset does not match the server
    GONE = 410,                     // Upload expired or terminated
    PRECONDITION_FAILED = 412,      // Tus-Resumable version not supported
    PAYLOAD_TOO_LARGE = 413,        // Exceeds Tus-Max-Size
    UNSUPPORTED_MEDIA_TYPE = 415,   // Wrong Content-Type on PATCH
    LOCKED = 423,                   // Another request holds the upload
    CHECKSUM_MISMATCH = 460,
    INTERNAL_SERVER_ERROR = 500,
    SERVICE_UNAVAILABLE = 503
};

inline const char* to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::POST: return "POST";
        case HttpMethod::PATCH: return "PATCH";
        case HttpMethod::HEAD: return "HEAD";
        case HttpMethod::DELETE_METHOD: return "DELETE";
        case HttpMethod::OPTIONS: return "OPTIONS";
    }
    return "UNKNOWN";
}

/// Reason phrase for the statuses above, empty for anything else
inline const char* reason_phrase(HttpStatus status) {
    switch (status) {
        case HttpStatus::OK: return "OK";
        case HttpStatus::CREATED: return "Created";
        case HttpStatus::NO_CONTENT: return "No Content";
        case HttpStatus::BAD_REQUEST: return "Bad Request";
        case HttpStatus::FORBIDDEN: return "Forbidden";
        case HttpStatus::NOT_FOUND: return "Not Found";
        case HttpStatus::CONFLICT: return "Conflict";
        case HttpStatus::GONE: return "Gone";
        case HttpStatus::PRECONDITION_FAILED: return "Precondition Failed";
        case HttpStatus::PAYLOAD_TOO_LARGE: return "Payload Too Large";
        case HttpStatus::UNSUPPORTED_MEDIA_TYPE: return "Unsupported Media Type";
        case HttpStatus::LOCKED: return "Locked";
        case HttpStatus::CHECKSUM_MISMATCH: return "Checksum Mismatch";
        case HttpStatus::INTERNAL_SERVER_ERROR: return "Internal Server Error";
        case HttpStatus::SERVICE_UNAVAILABLE: return "Service Unavailable";
    }
    return "";
}

using HeaderMap = std::unordered_map<std::string, std::string>;

/**
 * @brief Headers and body shared by requests and responses
 *
 * Header names keep the casing they were set with; lookups ignore case
 * (RFC 7230) so they do not depend on how a server spells them. The body
 * is a byte vector because PATCH requests carry raw file content.
 */
struct HttpMessage {
    HeaderMap headers;
    std::vector<uint8_t> body;

    [[nodiscard]] const std::string* find_header(const std::string& name) const {
        for (const auto& [key, value] : headers) {
            if (same_name(key, name)) {
                return &value;
            }
        }
        return nullptr;
    }

    [[nodiscard]] std::string get_header(const std::string& name) const {
        const auto* value = find_header(name);
        return value ? *value : std::string();
    }

    [[nodiscard]] bool has_header(const std::string& name) const {
        return find_header(name) != nullptr;
    }

    /// Replaces an existing header regardless of its casing
    void set_header(const std::string& name, const std::string& value) {
        for (auto it = headers.begin(); it != headers.end(); ++it) {
            if (it->first != name && same_name(it->first, name)) {
                headers.erase(it);
                break;
            }
        }
        headers[name] = value;
    }

private:
    static bool same_name(const std::string& a, const std::string& b) {
#ifdef _WIN32
        return _stricmp(a.c_str(), b.c_str()) == 0;
#else
        return strcasecmp(a.c_str(), b.c_str()) == 0;
#endif
    }
};

/**
 * @brief Outgoing request handed to a Transport
 */
struct HttpRequest : HttpMessage {
    HttpMethod method = HttpMethod::HEAD;
    std::string url;          // Absolute URL (http://host:port/target)
};

/**
 * @brief Response returned by a Transport
 */
struct HttpResponse : HttpMessage {
    int status_code = 0;
    std::string reason_phrase;

    HttpResponse() = default;

    explicit HttpResponse(HttpStatus status)
        : status_code(static_cast<int>(status))
        , reason_phrase(network::reason_phrase(status)) {
    }

    [[nodiscard]] bool is_success() const { return status_code >= 200 && status_code < 300; }

    /// Body as text, for error descriptions
    [[nodiscard]] std::string body_as_string() const {
        return std::string(body.begin(), body.end());
    }
};

} // namespace network
} // namespace tus
