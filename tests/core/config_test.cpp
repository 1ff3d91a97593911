#include "ddsync/core/config.hpp"

#include "support/temp_dir.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <map>
#include <string>

namespace fs = std::filesystem;
using namespace ddsync;
using ddsync::test_support::create_temp_dir;
using ddsync::test_support::write_file;

namespace {

EnvLookup fake_environment(const std::map<std::string, std::string>& values) {
    return [values](const char* name) -> const char* {
        auto it = values.find(name);
        return it == values.end() ? nullptr : it->second.c_str();
    };
}

} // namespace

TEST(ParseSize, AcceptsPlainNumbersAndBinarySuffixes) {
    EXPECT_EQ(parse_size("1048576").value(), 1048576u);
    EXPECT_EQ(parse_size("12B").value(), 12u);
    EXPECT_EQ(parse_size("512KB").value(), 512u * 1024u);
    EXPECT_EQ(parse_size("100MB").value(), 100u * kMiB);
    EXPECT_EQ(parse_size(" 2gb ").value(), 2048u * kMiB);
}

TEST(ParseSize, RejectsZeroMalformedAndOverflow) {
    for (const std::string bad : {"0", "0MB", "", "MB", "12XB", "-5", "1.5MB", "99999999999999999999", "17179869184GB"}) {
        auto parsed = parse_size(bad);
        ASSERT_TRUE(parsed.is_error()) << bad;
        EXPECT_EQ(parsed.error().kind, ErrorKind::Validation);
    }
}

TEST(ConfigYaml, MergesOnlyKeysThatArePresent) {
    Config config;
    config.auth = "keep-me";

    auto applied = apply_config_yaml(config,
        "url: http://localhost:8080/api\n"
        "upload_workers: 3\n"
        "upload_bytes_per_chunk: 8MB\n"
        "retry_attempts: 7\n"
        "retry_initial_backoff_ms: 5\n"
        "log_level: debug\n",
        "test.yaml");
    ASSERT_TRUE(applied.is_ok()) << applied.error().describe();

    EXPECT_EQ(config.url, "http://localhost:8080/api");
    EXPECT_EQ(config.auth, "keep-me");
    EXPECT_EQ(config.upload_workers, 3u);
    EXPECT_EQ(config.upload_bytes_per_chunk, 8 * kMiB);
    EXPECT_EQ(config.download_bytes_per_chunk, 20 * kMiB);
    EXPECT_EQ(config.retry.max_attempts, 7u);
    EXPECT_EQ(config.retry.initial_backoff, std::chrono::milliseconds(5));
    EXPECT_EQ(config.retry.max_backoff, std::chrono::milliseconds(30000));
    EXPECT_EQ(config.log_level, "debug");
}

TEST(ConfigYaml, BadValuesAreValidationErrors) {
    const std::string documents[] = {
        "upload_workers: 0\n",
        "download_bytes_per_chunk: 0\n",
        "upload_workers: many\n",
        "log_level: chatty\n",
        "- just\n- a list\n",
        "url: [unterminated\n",
    };
    for (const auto& document : documents) {
        Config config;
        auto applied = apply_config_yaml(config, document, "bad.yaml");
        ASSERT_TRUE(applied.is_error()) << document;
        EXPECT_EQ(applied.error().kind, ErrorKind::Validation) << document;
    }
}

TEST(ConfigYaml, UnknownKeysAreIgnored) {
    Config config;
    auto applied = apply_config_yaml(config, "colour: blue\ndownload_workers: 2\n", "extra.yaml");
    ASSERT_TRUE(applied.is_ok());
    EXPECT_EQ(config.download_workers, 2u);
}

TEST(ConfigEnvironment, UrlAlwaysWinsAuthOnlyFillsGaps) {
    Config config;
    config.auth = "from-file";
    apply_environment(config, fake_environment({{"DDSYNC_URL", "http://env"}, {"DDSYNC_AUTH", "from-env"}}));
    EXPECT_EQ(config.url, "http://env");
    EXPECT_EQ(config.auth, "from-file");

    Config empty;
    apply_environment(empty, fake_environment({{"DDSYNC_AUTH", "from-env"}}));
    EXPECT_EQ(empty.auth, "from-env");
    EXPECT_EQ(empty.url, kDefaultServiceUrl);
}

TEST(ConfigFiles, UserFileFromEnvironmentOrHome) {
    auto with_conf = default_config_files(fake_environment({{"DDSYNC_CONF", "/opt/ddsync.yaml"}, {"HOME", "/home/u"}}));
    EXPECT_EQ(with_conf, (std::vector<std::string>{"/etc/ddsync.conf", "/opt/ddsync.yaml"}));

    auto with_home = default_config_files(fake_environment({{"HOME", "/home/u"}}));
    EXPECT_EQ(with_home, (std::vector<std::string>{"/etc/ddsync.conf", "/home/u/.ddsync"}));
}

TEST(ConfigFiles, LaterFilesOverrideEarlierOnesAndMissingFilesAreSkipped) {
    const auto dir = create_temp_dir();
    write_file(dir / "system.yaml", "url: http://system\nupload_workers: 2\nauth: system-token\n");
    write_file(dir / "user.yaml", "upload_workers: 6\n");

    auto config = load_config({(dir / "system.yaml").string(), (dir / "absent.yaml").string(),
                               (dir / "user.yaml").string()},
                              fake_environment({}));
    ASSERT_TRUE(config.is_ok()) << config.error().describe();
    EXPECT_EQ(config.value().url, "http://system");
    EXPECT_EQ(config.value().upload_workers, 6u);
    EXPECT_EQ(config.value().auth, "system-token");
    fs::remove_all(dir);
}

TEST(ConfigFiles, InvalidExcludeRegexIsRejected) {
    const auto dir = create_temp_dir();
    write_file(dir / "bad.yaml", "file_exclude_regex: \"([\"\n");

    auto config = load_config({(dir / "bad.yaml").string()}, fake_environment({}));
    ASSERT_TRUE(config.is_error());
    EXPECT_EQ(config.error().kind, ErrorKind::Validation);
    fs::remove_all(dir);
}

TEST(ConfigFiles, MalformedFileIsValidationError) {
    const auto dir = create_temp_dir();
    write_file(dir / "broken.yaml", "retry_attempts: [1, 2\n");

    auto config = load_config({(dir / "broken.yaml").string()}, fake_environment({}));
    ASSERT_TRUE(config.is_error());
    EXPECT_EQ(config.error().kind, ErrorKind::Validation);
    fs::remove_all(dir);
}
