#include "tus/upload/descriptor.hpp"

namespace tus::upload {

using json = nlohmann::json;

UploadDescriptor::UploadDescriptor(std::string location,
                                   std::string endpoint,
                                   uint64_t total_length,
                                   Metadata metadata,
                                   std::string source_path,
                                   bool length_deferred)
    : location_(std::move(location))
    , endpoint_(std::move(endpoint))
    , source_path_(std::move(source_path))
    , total_length_(total_length)
    , confirmed_offset_(0)
    , metadata_(std::move(metadata))
    , length_deferred_(length_deferred)
    , length_declared_(!length_deferred) {
}

Result<void> UploadDescriptor::advance(uint64_t new_offset) {
    if (new_offset < confirmed_offset_) {
        return Err<void>(Error(ErrorKind::RegressiveOffset,
            "offset " + std::to_string(new_offset) + " is below confirmed offset " +
            std::to_string(confirmed_offset_)));
    }
    if (new_offset > total_length_) {
        return Err<void>(Error(ErrorKind::OffsetExceedsLength,
            "offset " + std::to_string(new_offset) + " exceeds length " +
            std::to_string(total_length_)));
    }
    confirmed_offset_ = new_offset;
    return Ok();
}

Result<void> UploadDescriptor::reconcile(uint64_t server_offset) {
    if (server_offset > total_length_) {
        return Err<void>(Error(ErrorKind::OffsetExceedsLength,
            "server offset " + std::to_string(server_offset) + " exceeds length " +
            std::to_string(total_length_)));
    }
    confirmed_offset_ = server_offset;
    return Ok();
}

json UploadDescriptor::to_json() const {
    json j;
    j["location"] = location_;
    j["endpoint"] = endpoint_;
    j["source_path"] = source_path_;
    j["total_length"] = total_length_;
    j["confirmed_offset"] = confirmed_offset_;
    j["length_deferred"] = length_deferred_;
    j["length_declared"] = length_declared_;
    j["metadata"] = metadata_;
    return j;
}

Result<UploadDescriptor> UploadDescriptor::from_json(const json& j) {
    if (!j.is_object()) {
        return Fail<UploadDescriptor>(ErrorKind::Configuration, "descriptor must be a JSON object");
    }

    for (const char* field : {"total_length", "confirmed_offset"}) {
        if (!j.contains(field) || !j.at(field).is_number_unsigned()) {
            return Fail<UploadDescriptor>(ErrorKind::Configuration,
                std::string("descriptor field '") + field + "' must be a non-negative integer");
        }
    }

    try {
        UploadDescriptor descriptor;
        descriptor.location_ = j.at("location").get<std::string>();
        descriptor.endpoint_ = j.value("endpoint", std::string{});
        descriptor.source_path_ = j.value("source_path", std::string{});
        descriptor.total_length_ = j.at("total_length").get<uint64_t>();
        descriptor.confirmed_offset_ = j.at("confirmed_offset").get<uint64_t>();
        descriptor.length_deferred_ = j.value("length_deferred", false);
        descriptor.length_declared_ = j.value("length_declared", !descriptor.length_deferred_);
        if (j.contains("metadata")) {
            descriptor.metadata_ = j.at("metadata").get<Metadata>();
        }

        if (descriptor.location_.empty()) {
            return Fail<UploadDescriptor>(ErrorKind::Configuration, "descriptor has an empty location");
        }
        if (descriptor.confirmed_offset_ > descriptor.total_length_) {
            return Fail<UploadDescriptor>(ErrorKind::OffsetExceedsLength,
                "descriptor offset " + std::to_string(descriptor.confirmed_offset_) +
                " exceeds length " + std::to_string(descriptor.total_length_));
        }
        for (const auto& [key, value] : descriptor.metadata_) {
            if (auto res = protocol::validate_metadata_key(key); res.is_error()) {
                return Err<UploadDescriptor>(res.error());
            }
        }
        return Ok(std::move(descriptor));
    } catch (const json::exception& e) {
        return Fail<UploadDescriptor>(ErrorKind::Configuration,
            std::string("invalid descriptor: ") + e.what());
    }
}

std::string UploadDescriptor::to_string(int indent) const {
    return to_json().dump(indent);
}

Result<UploadDescriptor> UploadDescriptor::from_string(const std::string& text) {
    const json j = json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        return Fail<UploadDescriptor>(ErrorKind::Configuration, "descriptor is not valid JSON");
    }
    return from_json(j);
}

bool UploadDescriptor::operator==(const UploadDescriptor& other) const {
    return location_ == other.location_ &&
           endpoint_ == other.endpoint_ &&
           source_path_ == other.source_path_ &&
           total_length_ == other.total_length_ &&
           confirmed_offset_ == other.confirmed_offset_ &&
           metadata_ == other.metadata_ &&
           length_deferred_ == other.length_deferred_ &&
           length_declared_ == other.length_declared_;
}

} // namespace tus::upload
