#pragma once

#include "hash.hpp"
#include <expected>
#include <filesystem>
#include <memory>
#include <span>
#include <string>

namespace hubxfer {

struct StreamError {
    std::string message;
    int code = 0;
};

// Pull-based content handed from a source download to a destination upload.
// Size and digest are known up front so LFS uploads can announce the object.
class ByteStream {
public:
    virtual ~ByteStream() = default;

    // Returns 0 at end of stream
    virtual std::expected<size_t, StreamError> read(std::span<char> buffer) = 0;
    virtual std::expected<void, StreamError> seek(size_t offset) = 0;
    virtual size_t size() const = 0;
    virtual const std::string& sha256() const = 0;
};

// Anonymous temp file that receives a download chunk by chunk.
// Unlinked on creation, so the content disappears with the descriptor.
class SpoolFile : public ByteStream {
public:
    ~SpoolFile() override;

    SpoolFile(const SpoolFile&) = delete;
    SpoolFile& operator=(const SpoolFile&) = delete;

    static std::expected<std::unique_ptr<SpoolFile>, StreamError> create(
        const std::filesystem::path& dir = std::filesystem::temp_directory_path()
    );

    std::expected<void, StreamError> append(std::span<const char> data);
    // Finalises the digest and rewinds for reading
    void seal();

    std::expected<size_t, StreamError> read(std::span<char> buffer) override;
    std::expected<void, StreamError> seek(size_t offset) override;
    size_t size() const override { return size_; }
    const std::string& sha256() const override { return sha256_; }

private:
    explicit SpoolFile(int fd);

    int fd_;
    size_t size_ = 0;
    size_t read_pos_ = 0;
    bool sealed_ = false;
    Sha256 hasher_;
    std::string sha256_;
};

class MemoryStream : public ByteStream {
public:
    explicit MemoryStream(std::string data);

    std::expected<size_t, StreamError> read(std::span<char> buffer) override;
    std::expected<void, StreamError> seek(size_t offset) override;
    size_t size() const override { return data_.size(); }
    const std::string& sha256() const override { return sha256_; }

    const std::string& data() const { return data_; }

private:
    std::string data_;
    size_t pos_ = 0;
    std::string sha256_;
};

// Reads the remainder of a stream; fails if it is larger than limit
std::expected<std::string, StreamError> read_all(ByteStream& stream, size_t limit);

} // namespace hubxfer
