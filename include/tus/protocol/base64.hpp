#pragma once

#include "tus/core/result.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace tus::protocol {

/// Standard (RFC 4648 section 4) base64 with padding
std::string base64_encode(const uint8_t* data, std::size_t size);
std::string base64_encode(const std::string& data);

/// Strict decode: rejects whitespace, missing padding and stray characters
Result<std::vector<uint8_t>> base64_decode(const std::string& encoded);

} // namespace tus::protocol
