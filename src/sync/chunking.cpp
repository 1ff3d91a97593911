#include "ddsync/sync/chunking.hpp"

#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>

namespace fs = std::filesystem;

namespace ddsync::sync {

ChunkSpan chunk_span(uint64_t file_size, uint64_t chunk_size, uint64_t index) {
    ChunkSpan span;
    if (chunk_size == 0) {
        return span;
    }
    span.offset = std::min(file_size, index * chunk_size);
    span.length = std::min(chunk_size, file_size - span.offset);
    return span;
}

Result<std::vector<uint8_t>> read_chunk(const fs::path& source, const ChunkSpan& span) {
    std::ifstream input(source, std::ios::binary);
    if (!input) {
        return Err<std::vector<uint8_t>>(Error::filesystem("cannot open " + source.string()));
    }

    std::vector<uint8_t> buffer(span.length);
    input.seekg(static_cast<std::streamoff>(span.offset));
    input.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(span.length));
    if (static_cast<uint64_t>(input.gcount()) != span.length) {
        return Err<std::vector<uint8_t>>(Error::filesystem(
            "short read of " + source.string() + " at offset " + std::to_string(span.offset) +
            " (file changed during upload?)"));
    }
    return Ok(std::move(buffer));
}

// ----------------------------------------------------------------------------
// DestinationFile
// ----------------------------------------------------------------------------

Result<DestinationFile> DestinationFile::open(const fs::path& final_path, uint64_t size) {
    fs::path partial = final_path;
    partial += kPartialSuffix;

    const int fd = ::open(partial.c_str(), O_RDWR | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        return Err<DestinationFile>(Error::filesystem(
            "cannot create " + partial.string() + ": " + std::strerror(errno)));
    }

    DestinationFile file(fd, final_path, partial, size);
    if (::ftruncate(fd, static_cast<off_t>(size)) != 0) {
        return Err<DestinationFile>(Error::filesystem(
            "cannot size " + partial.string() + ": " + std::strerror(errno)));
    }
    return Ok(std::move(file));
}

DestinationFile::DestinationFile(int fd, fs::path final_path, fs::path partial_path, uint64_t size)
    : fd_(fd), final_path_(std::move(final_path)), partial_path_(std::move(partial_path)), size_(size) {}

DestinationFile::DestinationFile(DestinationFile&& other) noexcept
    : fd_(other.fd_),
      final_path_(std::move(other.final_path_)),
      partial_path_(std::move(other.partial_path_)),
      size_(other.size_),
      settled_(other.settled_) {
    other.fd_ = -1;
    other.settled_ = true;
}

DestinationFile& DestinationFile::operator=(DestinationFile&& other) noexcept {
    if (this != &other) {
        discard();
        fd_ = other.fd_;
        final_path_ = std::move(other.final_path_);
        partial_path_ = std::move(other.partial_path_);
        size_ = other.size_;
        settled_ = other.settled_;
        other.fd_ = -1;
        other.settled_ = true;
    }
    return *this;
}

DestinationFile::~DestinationFile() {
    discard();
}

void DestinationFile::close_fd() {
    if (fd_ >= 0) {
        if (::close(fd_) != 0) {
            spdlog::warn("close({}) failed: {}", partial_path_.string(), std::strerror(errno));
        }
        fd_ = -1;
    }
}

Result<void> DestinationFile::write_at(uint64_t offset, const std::vector<uint8_t>& data) const {
    if (fd_ < 0) {
        return Err<void>(Error::filesystem("write to closed file " + partial_path_.string()));
    }
    if (offset + data.size() > size_) {
        return Err<void>(Error::validation("range past the end of " + partial_path_.string()));
    }

    size_t written = 0;
    while (written < data.size()) {
        const ssize_t n = ::pwrite(fd_, data.data() + written, data.size() - written,
                                   static_cast<off_t>(offset + written));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return Err<void>(Error::filesystem(
                "write to " + partial_path_.string() + " failed: " + std::strerror(errno)));
        }
        written += static_cast<size_t>(n);
    }
    return Ok();
}

Result<content::Fingerprint> DestinationFile::fingerprint() const {
    if (fd_ < 0) {
        return Err<content::Fingerprint>(Error::filesystem("hash of closed file " + partial_path_.string()));
    }

    content::FingerprintBuilder builder;
    std::vector<uint8_t> block(64 * 1024);
    uint64_t offset = 0;
    while (offset < size_) {
        const ssize_t n = ::pread(fd_, block.data(), block.size(), static_cast<off_t>(offset));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return Err<content::Fingerprint>(Error::filesystem(
                "read of " + partial_path_.string() + " failed: " + std::strerror(errno)));
        }
        if (n == 0) {
            break;
        }
        builder.update(block.data(), static_cast<size_t>(n));
        offset += static_cast<uint64_t>(n);
    }
    return Ok(builder.finish());
}

Result<void> DestinationFile::commit() {
    if (settled_) {
        return Err<void>(Error::validation("destination already committed or discarded: " + final_path_.string()));
    }
    if (fd_ >= 0 && ::fsync(fd_) != 0) {
        return Err<void>(Error::filesystem("fsync of " + partial_path_.string() + " failed: " + std::strerror(errno)));
    }
    close_fd();

    std::error_code ec;
    fs::rename(partial_path_, final_path_, ec);
    if (ec) {
        return Err<void>(Error::filesystem("cannot move " + partial_path_.string() + " into place: " + ec.message()));
    }
    settled_ = true;
    return Ok();
}

void DestinationFile::discard() {
    close_fd();
    if (settled_) {
        return;
    }
    std::error_code ec;
    fs::remove(partial_path_, ec);
    if (ec) {
        spdlog::warn("Could not remove partial file {}: {}", partial_path_.string(), ec.message());
    }
    settled_ = true;
}

} // namespace ddsync::sync
