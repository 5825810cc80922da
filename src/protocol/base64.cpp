#include "tus/protocol/base64.hpp"

#include <openssl/evp.h>

#include <climits>

namespace tus::protocol {
namespace {

bool is_base64_char(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
           (c >= '0' && c <= '9') || c == '+' || c == '/';
}

} // namespace

std::string base64_encode(const uint8_t* data, std::size_t size) {
    if (size == 0) {
        return {};
    }
    std::string out(4 * ((size + 2) / 3) + 1, '\0');
    const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                        data, static_cast<int>(size));
    out.resize(static_cast<std::size_t>(written));
    return out;
}

std::string base64_encode(const std::string& data) {
    return base64_encode(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

Result<std::vector<uint8_t>> base64_decode(const std::string& encoded) {
    if (encoded.empty()) {
        return Ok(std::vector<uint8_t>{});
    }
    if (encoded.size() % 4 != 0 || encoded.size() > static_cast<std::size_t>(INT_MAX)) {
        return Fail<std::vector<uint8_t>>(ErrorKind::MalformedMetadata,
            "base64 length is not a multiple of 4");
    }

    std::size_t padding = 0;
    for (std::size_t i = 0; i < encoded.size(); ++i) {
        const char c = encoded[i];
        if (c == '=') {
            // '=' only in the last two positions, and never followed by data
            if (i < encoded.size() - 2) {
                return Fail<std::vector<uint8_t>>(ErrorKind::MalformedMetadata,
                    "base64 padding in the middle of the input");
            }
            ++padding;
        } else if (!is_base64_char(c) || padding > 0) {
            return Fail<std::vector<uint8_t>>(ErrorKind::MalformedMetadata,
                "invalid base64 character");
        }
    }

    std::vector<uint8_t> out(encoded.size() / 4 * 3);
    const int decoded = EVP_DecodeBlock(out.data(),
                                        reinterpret_cast<const unsigned char*>(encoded.data()),
                                        static_cast<int>(encoded.size()));
    if (decoded < 0 || static_cast<std::size_t>(decoded) < padding) {
        return Fail<std::vector<uint8_t>>(ErrorKind::MalformedMetadata, "base64 decode failed");
    }
    // EVP_DecodeBlock counts padding as zero bytes
    out.resize(static_cast<std::size_t>(decoded) - padding);
    return Ok(std::move(out));
}

} // namespace tus::protocol
