#include "tus/io/file_source.hpp"

#include <algorithm>
#include <memory>

namespace tus::io {
namespace fs = std::filesystem;

Result<std::unique_ptr<LocalFileSource>> LocalFileSource::open(const fs::path& path) {
    using Ptr = std::unique_ptr<LocalFileSource>;

    std::error_code ec;
    const auto status = fs::status(path, ec);
    if (ec || !fs::exists(status)) {
        return Fail<Ptr>(ErrorKind::SourceRead, "File not found: " + path.string());
    }
    if (fs::is_directory(status)) {
        return Fail<Ptr>(ErrorKind::SourceRead, "Source is a directory: " + path.string());
    }

    const auto size = fs::file_size(path, ec);
    if (ec) {
        return Fail<Ptr>(ErrorKind::SourceRead, "Cannot stat " + path.string() + ": " + ec.message());
    }

    std::ifstream stream(path, std::ios::binary);
    if (!stream) {
        return Fail<Ptr>(ErrorKind::SourceRead, "Failed to open source file: " + path.string());
    }

    return Ok(std::make_unique<LocalFileSource>(OpenKey{}, path, std::move(stream),
                                                static_cast<uint64_t>(size)));
}

LocalFileSource::LocalFileSource(OpenKey, fs::path path, std::ifstream stream, uint64_t size)
    : path_(std::move(path))
    , stream_(std::move(stream))
    , size_(size) {
}

Result<std::vector<uint8_t>> LocalFileSource::read(uint64_t offset, std::size_t length) {
    if (offset > size_) {
        return Fail<std::vector<uint8_t>>(ErrorKind::SourceRead,
            "read offset " + std::to_string(offset) + " is past the end of " + path_.string());
    }

    std::lock_guard lock(mutex_);
    const auto wanted = static_cast<std::size_t>(std::min<uint64_t>(length, size_ - offset));
    std::vector<uint8_t> buffer(wanted);

    stream_.clear();
    stream_.seekg(static_cast<std::streamoff>(offset));
    if (!stream_) {
        return Fail<std::vector<uint8_t>>(ErrorKind::SourceRead,
            "seek to " + std::to_string(offset) + " failed for " + path_.string());
    }

    stream_.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(wanted));
    buffer.resize(static_cast<std::size_t>(stream_.gcount()));
    if (stream_.bad()) {
        return Fail<std::vector<uint8_t>>(ErrorKind::SourceRead, "I/O error reading " + path_.string());
    }
    return Ok(std::move(buffer));
}

MemorySource::MemorySource(std::vector<uint8_t> data, std::string name)
    : data_(std::move(data))
    , name_(std::move(name)) {
}

MemorySource::MemorySource(const std::string& data, std::string name)
    : data_(data.begin(), data.end())
    , name_(std::move(name)) {
}

Result<std::vector<uint8_t>> MemorySource::read(uint64_t offset, std::size_t length) {
    if (offset > data_.size()) {
        return Fail<std::vector<uint8_t>>(ErrorKind::SourceRead,
            "read offset " + std::to_string(offset) + " is past the end of " + name_);
    }
    const auto begin = data_.begin() + static_cast<std::ptrdiff_t>(offset);
    const auto count = std::min<std::size_t>(length, data_.size() - static_cast<std::size_t>(offset));
    return Ok(std::vector<uint8_t>(begin, begin + static_cast<std::ptrdiff_t>(count)));
}

} // namespace tus::io
