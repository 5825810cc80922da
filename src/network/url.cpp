#include "tus/network/url.hpp"

#include <algorithm>
#include <cctype>

namespace tus::network {
namespace {

uint16_t default_port(const std::string& scheme) {
    return scheme == "https" ? 443 : 80;
}

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

} // namespace

Result<Url> Url::parse(const std::string& text) {
    const auto scheme_end = text.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) {
        return Fail<Url>(ErrorKind::Configuration, "URL is missing a scheme: " + text);
    }

    Url url;
    url.scheme = to_lower(text.substr(0, scheme_end));
    if (url.scheme != "http" && url.scheme != "https") {
        return Fail<Url>(ErrorKind::Configuration, "Unsupported URL scheme: " + url.scheme);
    }

    const auto authority_begin = scheme_end + 3;
    const auto path_begin = text.find_first_of("/?", authority_begin);
    const std::string authority = text.substr(authority_begin,
        path_begin == std::string::npos ? std::string::npos : path_begin - authority_begin);

    if (authority.empty()) {
        return Fail<Url>(ErrorKind::Configuration, "URL has no host: " + text);
    }
    if (authority.find('@') != std::string::npos) {
        return Fail<Url>(ErrorKind::Configuration, "Credentials in URLs are not supported");
    }

    std::string host = authority;
    url.port = default_port(url.scheme);

    // IPv6 literals keep their brackets in host, the port follows "]:"
    const auto bracket = authority.rfind(']');
    const auto colon = authority.rfind(':');
    if (colon != std::string::npos && (bracket == std::string::npos || colon > bracket)) {
        host = authority.substr(0, colon);
        const std::string port_text = authority.substr(colon + 1);
        if (port_text.empty() || port_text.size() > 5 ||
            !std::all_of(port_text.begin(), port_text.end(),
                         [](unsigned char c) { return std::isdigit(c); })) {
            return Fail<Url>(ErrorKind::Configuration, "Invalid port in URL: " + text);
        }
        const unsigned long port = std::stoul(port_text);
        if (port == 0 || port > 65535) {
            return Fail<Url>(ErrorKind::Configuration, "Port out of range in URL: " + text);
        }
        url.port = static_cast<uint16_t>(port);
    }

    if (host.empty()) {
        return Fail<Url>(ErrorKind::Configuration, "URL has no host: " + text);
    }
    url.host = to_lower(host);

    if (path_begin == std::string::npos) {
        url.target = "/";
    } else {
        url.target = text.substr(path_begin);
        if (url.target.front() == '?') {
            url.target.insert(url.target.begin(), '/');
        }
    }

    // Fragments never reach the server
    const auto fragment = url.target.find('#');
    if (fragment != std::string::npos) {
        url.target.erase(fragment);
    }

    return Ok(std::move(url));
}

Result<Url> Url::resolve(const Url& base, const std::string& reference) {
    if (reference.empty()) {
        return Fail<Url>(ErrorKind::ProtocolRejection, "Empty URL reference");
    }

    if (reference.find("://") != std::string::npos) {
        return parse(reference);
    }

    if (reference.rfind("//", 0) == 0) {
        return parse(base.scheme + ":" + reference);
    }

    Url resolved = base;
    if (reference.front() == '/') {
        resolved.target = reference;
    } else {
        std::string base_path = base.target.substr(0, base.target.find('?'));
        const auto last_slash = base_path.rfind('/');
        base_path = last_slash == std::string::npos ? "/" : base_path.substr(0, last_slash + 1);
        resolved.target = base_path + reference;
    }

    const auto fragment = resolved.target.find('#');
    if (fragment != std::string::npos) {
        resolved.target.erase(fragment);
    }
    return Ok(std::move(resolved));
}

bool Url::has_default_port() const noexcept {
    return port == default_port(scheme);
}

std::string Url::host_header() const {
    return has_default_port() ? host : host + ":" + std::to_string(port);
}

std::string Url::to_string() const {
    return scheme + "://" + host_header() + target;
}

} // namespace tus::network
