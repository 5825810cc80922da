#include "tus/protocol/checksum.hpp"
#include "tus/protocol/base64.hpp"

#include <openssl/evp.h>

namespace tus::protocol {
namespace {

const EVP_MD* digest_for(const std::string& algorithm) {
    if (algorithm == "sha1") return EVP_sha1();
    if (algorithm == "sha256") return EVP_sha256();
    if (algorithm == "md5") return EVP_md5();
    return nullptr;
}

} // namespace

bool is_supported_checksum_algorithm(const std::string& algorithm) {
    return digest_for(algorithm) != nullptr;
}

Result<std::string> compute_checksum(const std::string& algorithm,
                                     const uint8_t* data, std::size_t size) {
    const EVP_MD* md = digest_for(algorithm);
    if (md == nullptr) {
        return Fail<std::string>(ErrorKind::Configuration,
            "unsupported checksum algorithm: " + algorithm);
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_Digest(data, size, digest, &digest_len, md, nullptr) != 1) {
        return Fail<std::string>(ErrorKind::Configuration,
            "digest computation failed for " + algorithm);
    }
    return Ok(base64_encode(digest, digest_len));
}

Result<std::string> checksum_header_value(const std::string& algorithm,
                                          const std::vector<uint8_t>& chunk) {
    auto digest = compute_checksum(algorithm, chunk.data(), chunk.size());
    if (digest.is_error()) {
        return digest;
    }
    return Ok(algorithm + " " + digest.value());
}

} // namespace tus::protocol
