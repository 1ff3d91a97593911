#include "ddsync/content/fingerprint.hpp"

#include "support/temp_dir.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <string>

namespace fs = std::filesystem;
using namespace ddsync;
using ddsync::content::Fingerprint;
using ddsync::content::FingerprintBuilder;
using ddsync::test_support::create_temp_dir;
using ddsync::test_support::write_file;

TEST(Fingerprint, Md5OfKnownInputs) {
    EXPECT_EQ(content::fingerprint_bytes(std::string("hello")).value, "5d41402abc4b2a76b9719d911017c592");
    EXPECT_EQ(content::fingerprint_bytes(std::string()).value, "d41d8cd98f00b204e9800998ecf8427e");
    EXPECT_EQ(content::fingerprint_bytes(std::string("hello")).algorithm, "md5");
}

TEST(Fingerprint, IncrementalUpdatesMatchOneShot) {
    FingerprintBuilder builder;
    const std::string first = "hel";
    const std::string second = "lo";
    builder.update(reinterpret_cast<const uint8_t*>(first.data()), first.size());
    builder.update(reinterpret_cast<const uint8_t*>(second.data()), second.size());
    EXPECT_EQ(builder.finish(), content::fingerprint_bytes(std::string("hello")));
}

TEST(Fingerprint, EqualityNeedsAlgorithmAndValue) {
    const Fingerprint md5{"md5", "abc"};
    EXPECT_EQ(md5, (Fingerprint{"md5", "abc"}));
    EXPECT_NE(md5, (Fingerprint{"sha256", "abc"}));
    EXPECT_NE(md5, (Fingerprint{"md5", "abd"}));
    EXPECT_EQ(md5.to_string(), "md5:abc");
}

TEST(Fingerprint, FileSpanningSeveralReadBlocks) {
    const auto dir = create_temp_dir();
    const std::string content(200 * 1024 + 17, 'z');
    write_file(dir / "big.bin", content);

    auto fingerprint = content::fingerprint_file(dir / "big.bin");
    ASSERT_TRUE(fingerprint.is_ok());
    EXPECT_EQ(fingerprint.value(), content::fingerprint_bytes(content));
    fs::remove_all(dir);
}

TEST(Fingerprint, MissingFileIsFilesystemError) {
    const auto dir = create_temp_dir();
    auto fingerprint = content::fingerprint_file(dir / "absent");
    ASSERT_TRUE(fingerprint.is_error());
    EXPECT_EQ(fingerprint.error().kind, ErrorKind::Filesystem);
    fs::remove_all(dir);
}
