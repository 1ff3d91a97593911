#include "ddsync/content/fingerprint.hpp"

#include <openssl/evp.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <stdexcept>

namespace ddsync::content {
namespace {

constexpr size_t kReadBlockSize = 64 * 1024;

std::string to_hex(const unsigned char* digest, unsigned int length) {
    static const char* digits = "0123456789abcdef";
    std::string hex;
    hex.reserve(length * 2);
    for (unsigned int i = 0; i < length; ++i) {
        hex.push_back(digits[digest[i] >> 4]);
        hex.push_back(digits[digest[i] & 0x0f]);
    }
    return hex;
}

} // namespace

void FingerprintBuilder::ContextDeleter::operator()(evp_md_ctx_st* ctx) const {
    EVP_MD_CTX_free(ctx);
}

FingerprintBuilder::FingerprintBuilder() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_ || EVP_DigestInit_ex(ctx_.get(), EVP_md5(), nullptr) != 1) {
        throw std::runtime_error("failed to initialise md5 digest");
    }
}

FingerprintBuilder::~FingerprintBuilder() = default;

void FingerprintBuilder::update(const uint8_t* data, size_t length) {
    if (length > 0) {
        EVP_DigestUpdate(ctx_.get(), data, length);
    }
}

Fingerprint FingerprintBuilder::finish() {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int length = 0;
    EVP_DigestFinal_ex(ctx_.get(), digest.data(), &length);

    Fingerprint fp;
    fp.algorithm = kFingerprintAlgorithm;
    fp.value = to_hex(digest.data(), length);
    return fp;
}

Result<Fingerprint> fingerprint_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Err<Fingerprint>(Error::filesystem("cannot open " + path.string() + ": " + std::strerror(errno)));
    }

    FingerprintBuilder builder;
    std::vector<char> block(kReadBlockSize);
    while (in) {
        in.read(block.data(), static_cast<std::streamsize>(block.size()));
        const auto got = in.gcount();
        if (got > 0) {
            builder.update(reinterpret_cast<const uint8_t*>(block.data()), static_cast<size_t>(got));
        }
    }
    if (in.bad()) {
        return Err<Fingerprint>(Error::filesystem("read failed for " + path.string()));
    }
    return Ok(builder.finish());
}

Fingerprint fingerprint_bytes(const std::vector<uint8_t>& data) {
    FingerprintBuilder builder;
    builder.update(data);
    return builder.finish();
}

Fingerprint fingerprint_bytes(const std::string& data) {
    FingerprintBuilder builder;
    builder.update(reinterpret_cast<const uint8_t*>(data.data()), data.size());
    return builder.finish();
}

} // namespace ddsync::content
