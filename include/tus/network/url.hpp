#pragma once

#include "tus/core/result.hpp"

#include <cstdint>
#include <string>

namespace tus::network {

/**
 * @brief Minimal absolute URL: scheme://host[:port]/target
 *
 * Only what the tus client needs: splitting an endpoint into the parts a
 * TCP connection and a request line require, and resolving the Location
 * header the server returns on creation (absolute, scheme-relative,
 * absolute-path or relative-path references).
 */
struct Url {
    std::string scheme;   // "http" or "https", lower case
    std::string host;
    uint16_t port = 0;
    std::string target;   // path plus optional query, always starts with '/'

    static Result<Url> parse(const std::string& text);

    /// Resolve @p reference against @p base (RFC 3986 section 5.2, without dot-segment removal)
    static Result<Url> resolve(const Url& base, const std::string& reference);

    [[nodiscard]] bool has_default_port() const noexcept;
    [[nodiscard]] std::string host_header() const;
    [[nodiscard]] std::string to_string() const;
};

} // namespace tus::network
