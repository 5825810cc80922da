#include "tus/protocol/server_info.hpp"
#include "tus/protocol/headers.hpp"
#include "tus/protocol/requests.hpp"

#include <algorithm>

namespace tus::protocol {
namespace {

std::vector<std::string> split_list(const std::string& value) {
    std::vector<std::string> items;
    std::size_t start = 0;
    while (start <= value.size()) {
        auto end = value.find(',', start);
        if (end == std::string::npos) {
            end = value.size();
        }
        std::string item = value.substr(start, end - start);
        const auto first = item.find_first_not_of(" \t");
        const auto last = item.find_last_not_of(" \t");
        if (first != std::string::npos) {
            items.push_back(item.substr(first, last - first + 1));
        }
        start = end + 1;
    }
    return items;
}

bool contains(const std::vector<std::string>& list, const std::string& item) {
    return std::find(list.begin(), list.end(), item) != list.end();
}

} // namespace

bool ServerInfo::supports_version(const std::string& version) const {
    return contains(versions, version) || resumable == version;
}

bool ServerInfo::supports_extension(const std::string& extension) const {
    return contains(extensions, extension);
}

bool ServerInfo::supports_checksum(const std::string& algorithm) const {
    return supports_extension(headers::kExtChecksum) && contains(checksum_algorithms, algorithm);
}

Result<ServerInfo> ServerInfo::from_response(const network::HttpResponse& response) {
    if (response.status_code != 200 && response.status_code != 204) {
        return Err<ServerInfo>(error_for_response(response, "OPTIONS"));
    }

    ServerInfo info;
    info.resumable = response.get_header(headers::kTusResumable);
    info.versions = split_list(response.get_header(headers::kTusVersion));
    info.extensions = split_list(response.get_header(headers::kTusExtension));
    info.checksum_algorithms = split_list(response.get_header(headers::kTusChecksumAlgorithm));

    if (response.has_header(headers::kTusMaxSize)) {
        const auto max_size = parse_uint64(response.get_header(headers::kTusMaxSize));
        if (!max_size) {
            return Fail<ServerInfo>(ErrorKind::ProtocolRejection,
                "invalid Tus-Max-Size: '" + response.get_header(headers::kTusMaxSize) + "'");
        }
        info.max_size = *max_size;
    }
    return Ok(std::move(info));
}

} // namespace tus::protocol
