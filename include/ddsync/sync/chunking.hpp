#pragma once

#include "ddsync/content/fingerprint.hpp"
#include "ddsync/core/result.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace ddsync::sync {

struct ChunkSpan {
    uint64_t offset = 0;
    uint64_t length = 0;
};

/// Byte range of chunk index in a file split into chunk_size pieces
ChunkSpan chunk_span(uint64_t file_size, uint64_t chunk_size, uint64_t index);

/// Reads exactly span.length bytes; a short read means the file changed under us
Result<std::vector<uint8_t>> read_chunk(const std::filesystem::path& source, const ChunkSpan& span);

/**
 * @brief Download target written by concurrent range writers
 *
 * Bytes land in "<final>.ddsync-partial", opened once and sized up front so
 * workers can write disjoint ranges with pwrite. commit() renames it into
 * place. Anything not committed is removed when the object goes away, so a
 * failed download never leaves a file that looks complete.
 */
class DestinationFile {
public:
    static Result<DestinationFile> open(const std::filesystem::path& final_path, uint64_t size);

    DestinationFile(DestinationFile&& other) noexcept;
    DestinationFile& operator=(DestinationFile&& other) noexcept;
    ~DestinationFile();

    DestinationFile(const DestinationFile&) = delete;
    DestinationFile& operator=(const DestinationFile&) = delete;

    /// Safe to call from several threads for disjoint ranges
    Result<void> write_at(uint64_t offset, const std::vector<uint8_t>& data) const;

    /// Hashes what was written so far
    Result<content::Fingerprint> fingerprint() const;

    Result<void> commit();

    /// Removes the partial file
    void discard();

    const std::filesystem::path& partial_path() const { return partial_path_; }
    const std::filesystem::path& final_path() const { return final_path_; }
    uint64_t size() const { return size_; }

private:
    DestinationFile(int fd, std::filesystem::path final_path, std::filesystem::path partial_path, uint64_t size);

    void close_fd();

    int fd_ = -1;
    std::filesystem::path final_path_;
    std::filesystem::path partial_path_;
    uint64_t size_ = 0;
    bool settled_ = false;
};

inline constexpr const char* kPartialSuffix = ".ddsync-partial";

} // namespace ddsync::sync
