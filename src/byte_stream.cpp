#include "hubxfer/byte_stream.hpp"
#include <fcntl.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <format>

namespace hubxfer {

SpoolFile::SpoolFile(int fd) : fd_(fd) {}

SpoolFile::~SpoolFile() {
    if (fd_ != -1) ::close(fd_);
}

std::expected<std::unique_ptr<SpoolFile>, StreamError> SpoolFile::create(
    const std::filesystem::path& dir
) {
    std::string tmpl = (dir / "hubxfer-spool-XXXXXX").string();
    int fd = ::mkstemp(tmpl.data());
    if (fd == -1) {
        return std::unexpected(StreamError{
            std::format("Cannot create spool file in {}: {}", dir.string(), strerror(errno)), errno
        });
    }
    ::unlink(tmpl.c_str());
    return std::unique_ptr<SpoolFile>(new SpoolFile(fd));
}

std::expected<void, StreamError> SpoolFile::append(std::span<const char> data) {
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::pwrite(fd_, data.data() + written, data.size() - written,
                             static_cast<off_t>(size_ + written));
        if (n < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(StreamError{std::format("Spool write failed: {}", strerror(errno)), errno});
        }
        written += static_cast<size_t>(n);
    }
    hasher_.update(data);
    size_ += data.size();
    return {};
}

void SpoolFile::seal() {
    if (!sealed_) {
        sha256_ = hasher_.finish();
        sealed_ = true;
    }
    read_pos_ = 0;
}

std::expected<size_t, StreamError> SpoolFile::read(std::span<char> buffer) {
    if (read_pos_ >= size_ || buffer.empty()) return 0;
    size_t want = std::min(buffer.size(), size_ - read_pos_);
    while (true) {
        ssize_t n = ::pread(fd_, buffer.data(), want, static_cast<off_t>(read_pos_));
        if (n < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(StreamError{std::format("Spool read failed: {}", strerror(errno)), errno});
        }
        read_pos_ += static_cast<size_t>(n);
        return static_cast<size_t>(n);
    }
}

std::expected<void, StreamError> SpoolFile::seek(size_t offset) {
    if (offset > size_) {
        return std::unexpected(StreamError{std::format("Seek past end ({} > {})", offset, size_), EINVAL});
    }
    read_pos_ = offset;
    return {};
}

MemoryStream::MemoryStream(std::string data)
    : data_(std::move(data)), sha256_(Sha256::of(data_)) {}

std::expected<size_t, StreamError> MemoryStream::read(std::span<char> buffer) {
    size_t n = std::min(buffer.size(), data_.size() - pos_);
    std::memcpy(buffer.data(), data_.data() + pos_, n);
    pos_ += n;
    return n;
}

std::expected<void, StreamError> MemoryStream::seek(size_t offset) {
    if (offset > data_.size()) {
        return std::unexpected(StreamError{std::format("Seek past end ({} > {})", offset, data_.size()), EINVAL});
    }
    pos_ = offset;
    return {};
}

std::expected<std::string, StreamError> read_all(ByteStream& stream, size_t limit) {
    std::string out;
    char buf[64 * 1024];
    while (true) {
        auto n = stream.read(std::span<char>(buf, sizeof(buf)));
        if (!n) return std::unexpected(n.error());
        if (*n == 0) break;
        if (out.size() + *n > limit) {
            return std::unexpected(StreamError{std::format("Stream exceeds {} bytes", limit), EFBIG});
        }
        out.append(buf, *n);
    }
    return out;
}

} // namespace hubxfer
