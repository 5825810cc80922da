#pragma once

namespace tus::protocol::headers {

/// Protocol version sent on every request
inline constexpr const char* kProtocolVersion = "1.0.0";

inline constexpr const char* kTusResumable = "Tus-Resumable";
inline constexpr const char* kTusVersion = "Tus-Version";
inline constexpr const char* kTusExtension = "Tus-Extension";
inline constexpr const char* kTusMaxSize = "Tus-Max-Size";
inline constexpr const char* kTusChecksumAlgorithm = "Tus-Checksum-Algorithm";

inline constexpr const char* kUploadOffset = "Upload-Offset";
inline constexpr const char* kUploadLength = "Upload-Length";
inline constexpr const char* kUploadDeferLength = "Upload-Defer-Length";
inline constexpr const char* kUploadMetadata = "Upload-Metadata";
inline constexpr const char* kUploadChecksum = "Upload-Checksum";

inline constexpr const char* kLocation = "Location";
inline constexpr const char* kContentType = "Content-Type";
inline constexpr const char* kContentLength = "Content-Length";

inline constexpr const char* kOffsetOctetStream = "application/offset+octet-stream";

// Extension names as advertised in Tus-Extension
inline constexpr const char* kExtCreation = "creation";
inline constexpr const char* kExtDeferLength = "creation-defer-length";
inline constexpr const char* kExtChecksum = "checksum";
inline constexpr const char* kExtTermination = "termination";

} // namespace tus::protocol::headers
