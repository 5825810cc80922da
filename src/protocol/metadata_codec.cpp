#include "tus/protocol/metadata_codec.hpp"
#include "tus/protocol/base64.hpp"

#include <cctype>
#include <sstream>
#include <vector>

namespace tus::protocol {
namespace {

constexpr char kPairDelimiter = ',';
constexpr char kKeyValueDelimiter = ' ';

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string trim_spaces(const std::string& text) {
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && text[begin] == ' ') {
        ++begin;
    }
    while (end > begin && text[end - 1] == ' ') {
        --end;
    }
    return text.substr(begin, end - begin);
}

std::vector<std::string> split(const std::string& text, char delimiter) {
    std::vector<std::string> parts;
    std::size_t start = 0;
    while (true) {
        const auto pos = text.find(delimiter, start);
        if (pos == std::string::npos) {
            parts.push_back(text.substr(start));
            break;
        }
        parts.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

} // namespace

Result<void> validate_metadata_key(const std::string& key) {
    if (key.empty()) {
        return Err<void>(Error(ErrorKind::InvalidMetadataKey, "metadata key is empty"));
    }
    for (char c : key) {
        if (c == kPairDelimiter || is_space(c)) {
            return Err<void>(Error(ErrorKind::InvalidMetadataKey,
                "metadata key contains ',' or whitespace: '" + key + "'"));
        }
    }
    return Ok();
}

Result<std::string> encode_metadata(const Metadata& metadata) {
    std::ostringstream oss;
    bool first = true;
    for (const auto& [key, value] : metadata) {
        if (auto res = validate_metadata_key(key); res.is_error()) {
            return Err<std::string>(res.error());
        }
        if (!first) {
            oss << kPairDelimiter;
        }
        first = false;

        oss << key;
        if (!value.empty()) {
            oss << kKeyValueDelimiter << base64_encode(value);
        }
    }
    return Ok(oss.str());
}

Result<Metadata> decode_metadata(const std::string& encoded) {
    Metadata metadata;
    if (trim_spaces(encoded).empty()) {
        return Ok(std::move(metadata));
    }

    for (const auto& raw_pair : split(encoded, kPairDelimiter)) {
        const std::string pair = trim_spaces(raw_pair);
        if (pair.empty()) {
            return Fail<Metadata>(ErrorKind::MalformedMetadata, "empty metadata pair");
        }

        const auto separator = pair.find(kKeyValueDelimiter);
        const std::string key = pair.substr(0, separator);
        std::string value;

        if (separator != std::string::npos) {
            const std::string encoded_value = pair.substr(separator + 1);
            if (encoded_value.find(kKeyValueDelimiter) != std::string::npos) {
                return Fail<Metadata>(ErrorKind::MalformedMetadata,
                    "metadata pair has more than one separator: '" + pair + "'");
            }
            auto decoded = base64_decode(encoded_value);
            if (decoded.is_error()) {
                return Fail<Metadata>(ErrorKind::MalformedMetadata,
                    "metadata value for '" + key + "' is not valid base64");
            }
            value.assign(decoded.value().begin(), decoded.value().end());
        }

        if (validate_metadata_key(key).is_error()) {
            return Fail<Metadata>(ErrorKind::MalformedMetadata, "invalid metadata key: '" + key + "'");
        }
        if (!metadata.emplace(key, std::move(value)).second) {
            return Fail<Metadata>(ErrorKind::MalformedMetadata, "duplicate metadata key: '" + key + "'");
        }
    }

    return Ok(std::move(metadata));
}

} // namespace tus::protocol
