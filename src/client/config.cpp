#include "tus/client/config.hpp"
#include "tus/protocol/checksum.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>

namespace tus::client {

using json = nlohmann::json;

namespace {

// Reads a strictly positive integer, rejecting zero, negatives and non-integers
Result<uint64_t> positive_integer(const json& j, const char* key) {
    const auto& value = j.at(key);
    if (!value.is_number_integer()) {
        return Fail<uint64_t>(ErrorKind::Configuration, std::string(key) + " must be an integer");
    }
    if (value.is_number_unsigned()) {
        const auto number = value.get<uint64_t>();
        if (number > 0) {
            return Ok(number);
        }
    }
    return Fail<uint64_t>(ErrorKind::Configuration, std::string(key) + " must be positive");
}

Result<uint64_t> non_negative_integer(const json& j, const char* key) {
    const auto& value = j.at(key);
    if (!value.is_number_unsigned()) {
        return Fail<uint64_t>(ErrorKind::Configuration, std::string(key) + " must be a non-negative integer");
    }
    return Ok(value.get<uint64_t>());
}

std::chrono::milliseconds to_millis(uint64_t value) {
    return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(value));
}

} // namespace

std::chrono::milliseconds BackoffPolicy::delay_for(std::size_t attempt) const {
    if (attempt == 0) {
        return std::chrono::milliseconds{0};
    }
    const double scaled = static_cast<double>(initial_delay.count()) *
                          std::pow(multiplier, static_cast<double>(attempt - 1));
    const double capped = std::min(scaled, static_cast<double>(max_delay.count()));
    return std::chrono::milliseconds{static_cast<std::chrono::milliseconds::rep>(capped)};
}

Result<void> ClientConfig::validate() const {
    if (chunk_size == 0) {
        return Err<void>(Error(ErrorKind::Configuration, "chunk_size must be > 0"));
    }
    if (max_attempts == 0) {
        return Err<void>(Error(ErrorKind::Configuration, "max_attempts must be >= 1"));
    }
    if (request_timeout.count() <= 0) {
        return Err<void>(Error(ErrorKind::Configuration, "request_timeout must be positive"));
    }
    if (backoff.initial_delay.count() < 0 || backoff.max_delay.count() < 0) {
        return Err<void>(Error(ErrorKind::Configuration, "backoff delays must not be negative"));
    }
    if (!(backoff.multiplier >= 1.0)) {
        return Err<void>(Error(ErrorKind::Configuration, "backoff multiplier must be >= 1"));
    }
    if (checksum_enabled && !protocol::is_supported_checksum_algorithm(checksum_algorithm)) {
        return Err<void>(Error(ErrorKind::Configuration,
            "unsupported checksum algorithm: " + checksum_algorithm));
    }
    for (const auto& [name, value] : headers) {
        if (name.empty() || name.find_first_of(" \t\r\n:") != std::string::npos ||
            value.find_first_of("\r\n") != std::string::npos) {
            return Err<void>(Error(ErrorKind::Configuration, "invalid custom header: '" + name + "'"));
        }
    }
    return Ok();
}

Result<ClientConfig> ClientConfig::from_json(const json& j) {
    if (!j.is_object()) {
        return Fail<ClientConfig>(ErrorKind::Configuration, "configuration must be a JSON object");
    }

    ClientConfig config;
    try {
        if (j.contains("chunk_size")) {
            auto value = positive_integer(j, "chunk_size");
            if (value.is_error()) return Err<ClientConfig>(value.error());
            config.chunk_size = static_cast<std::size_t>(value.value());
        }
        if (j.contains("max_attempts")) {
            auto value = positive_integer(j, "max_attempts");
            if (value.is_error()) return Err<ClientConfig>(value.error());
            config.max_attempts = static_cast<std::size_t>(value.value());
        }
        if (j.contains("max_offset_reconciliations")) {
            auto value = non_negative_integer(j, "max_offset_reconciliations");
            if (value.is_error()) return Err<ClientConfig>(value.error());
            config.max_offset_reconciliations = static_cast<std::size_t>(value.value());
        }
        if (j.contains("request_timeout_ms")) {
            auto value = positive_integer(j, "request_timeout_ms");
            if (value.is_error()) return Err<ClientConfig>(value.error());
            config.request_timeout = to_millis(value.value());
        }
        if (j.contains("backoff")) {
            const auto& backoff = j.at("backoff");
            if (!backoff.is_object()) {
                return Fail<ClientConfig>(ErrorKind::Configuration, "backoff must be an object");
            }
            if (backoff.contains("initial_delay_ms")) {
                auto value = non_negative_integer(backoff, "initial_delay_ms");
                if (value.is_error()) return Err<ClientConfig>(value.error());
                config.backoff.initial_delay = to_millis(value.value());
            }
            if (backoff.contains("max_delay_ms")) {
                auto value = non_negative_integer(backoff, "max_delay_ms");
                if (value.is_error()) return Err<ClientConfig>(value.error());
                config.backoff.max_delay = to_millis(value.value());
            }
            config.backoff.multiplier = backoff.value("multiplier", config.backoff.multiplier);
        }
        config.checksum_enabled = j.value("checksum_enabled", config.checksum_enabled);
        config.checksum_algorithm = j.value("checksum_algorithm", config.checksum_algorithm);
        config.defer_length = j.value("defer_length", config.defer_length);
        config.include_filename = j.value("include_filename", config.include_filename);
        if (j.contains("headers")) {
            config.headers = j.at("headers").get<network::HeaderMap>();
        }
    } catch (const json::exception& e) {
        return Fail<ClientConfig>(ErrorKind::Configuration, std::string("invalid configuration: ") + e.what());
    }

    if (auto res = config.validate(); res.is_error()) {
        return Err<ClientConfig>(res.error());
    }
    return Ok(std::move(config));
}

Result<ClientConfig> ClientConfig::load_from_file(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        return Fail<ClientConfig>(ErrorKind::Configuration, "Failed to open config file: " + path.string());
    }
    const json j = json::parse(input, nullptr, false);
    if (j.is_discarded()) {
        return Fail<ClientConfig>(ErrorKind::Configuration, "Config file is not valid JSON: " + path.string());
    }
    return from_json(j);
}

} // namespace tus::client
