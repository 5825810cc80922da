#pragma once

#include "tus/core/result.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace tus::io {

/**
 * @brief Random-access byte source an upload reads its chunks from
 */
class FileSource {
public:
    virtual ~FileSource() = default;

    /// Total length in bytes
    [[nodiscard]] virtual uint64_t size() const = 0;

    /**
     * @brief Read up to @p length bytes starting at @p offset
     *
     * Returns fewer bytes only at end of source; an offset past the end
     * fails with SourceRead.
     */
    virtual Result<std::vector<uint8_t>> read(uint64_t offset, std::size_t length) = 0;

    /// Human-readable origin used in log lines
    [[nodiscard]] virtual std::string describe() const = 0;
};

/**
 * @brief FileSource over a file on disk
 *
 * The size is captured at open time; a file that shrinks afterwards shows
 * up as a short read, which the transfer engine reports as SourceRead.
 */
class LocalFileSource : public FileSource {
    // Only open() can name the key, so it is the sole way to construct one
    struct OpenKey {
        explicit OpenKey() = default;
    };

public:
    static Result<std::unique_ptr<LocalFileSource>> open(const std::filesystem::path& path);

    LocalFileSource(OpenKey, std::filesystem::path path, std::ifstream stream, uint64_t size);

    [[nodiscard]] uint64_t size() const override { return size_; }
    Result<std::vector<uint8_t>> read(uint64_t offset, std::size_t length) override;
    [[nodiscard]] std::string describe() const override { return path_.string(); }

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
    std::ifstream stream_;
    uint64_t size_;
    std::mutex mutex_;
};

/**
 * @brief FileSource over an in-memory buffer
 */
class MemorySource : public FileSource {
public:
    explicit MemorySource(std::vector<uint8_t> data, std::string name = "memory");
    explicit MemorySource(const std::string& data, std::string name = "memory");

    [[nodiscard]] uint64_t size() const override { return data_.size(); }
    Result<std::vector<uint8_t>> read(uint64_t offset, std::size_t length) override;
    [[nodiscard]] std::string describe() const override { return name_; }

private:
    std::vector<uint8_t> data_;
    std::string name_;
};

} // namespace tus::io
