#pragma once

#include "ddsync/core/result.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

struct evp_md_ctx_st;

namespace ddsync::content {

inline constexpr const char* kFingerprintAlgorithm = "md5";

/**
 * @brief Content hash of a file's bytes
 *
 * Two fingerprints are equal only when both the algorithm and the hex value
 * match. Metadata such as mtime or permissions never contributes.
 */
struct Fingerprint {
    std::string algorithm = kFingerprintAlgorithm;
    std::string value; ///< Lowercase hex digest

    bool operator==(const Fingerprint& other) const {
        return algorithm == other.algorithm && value == other.value;
    }
    bool operator!=(const Fingerprint& other) const { return !(*this == other); }

    std::string to_string() const { return algorithm + ":" + value; }
};

/// Incremental MD5 over OpenSSL EVP
class FingerprintBuilder {
public:
    FingerprintBuilder();
    ~FingerprintBuilder();

    FingerprintBuilder(const FingerprintBuilder&) = delete;
    FingerprintBuilder& operator=(const FingerprintBuilder&) = delete;

    void update(const uint8_t* data, size_t length);
    void update(const std::vector<uint8_t>& data) { update(data.data(), data.size()); }

    /// Produces the digest; the builder must not be updated afterwards
    Fingerprint finish();

private:
    struct ContextDeleter {
        void operator()(evp_md_ctx_st* ctx) const;
    };
    std::unique_ptr<evp_md_ctx_st, ContextDeleter> ctx_;
};

/// Streams a file through the hash in fixed-size blocks
Result<Fingerprint> fingerprint_file(const std::filesystem::path& path);

Fingerprint fingerprint_bytes(const std::vector<uint8_t>& data);
Fingerprint fingerprint_bytes(const std::string& data);

} // namespace ddsync::content
