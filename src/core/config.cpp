#include "ddsync/core/config.hpp"

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <regex>
#include <sstream>
#include <thread>

namespace fs = std::filesystem;

namespace ddsync {
namespace {

const std::vector<std::string> kKnownKeys = {
    "url", "auth", "upload_workers", "download_workers",
    "upload_bytes_per_chunk", "download_bytes_per_chunk", "file_exclude_regex",
    "retry_attempts", "retry_initial_backoff_ms", "retry_max_backoff_ms",
    "request_timeout_seconds", "log_level"
};

const std::vector<std::string> kLogLevels = {
    "trace", "debug", "info", "warn", "warning", "error", "critical", "off"
};

std::string trim(const std::string& text) {
    auto begin = std::find_if_not(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(text.rbegin(), text.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

Result<uint64_t> read_positive(const YAML::Node& node, const std::string& key, const std::string& origin) {
    const auto value = node.as<long long>();
    if (value <= 0) {
        return Err<uint64_t>(Error::validation(origin + ": '" + key + "' must be positive"));
    }
    return Ok(static_cast<uint64_t>(value));
}

Result<uint64_t> read_size(const YAML::Node& node, const std::string& key, const std::string& origin) {
    auto parsed = parse_size(node.as<std::string>());
    if (parsed.is_error()) {
        return Err<uint64_t>(Error::validation(origin + ": '" + key + "': " + parsed.error().message));
    }
    return parsed;
}

} // namespace

size_t default_worker_count() {
    const unsigned int cpus = std::thread::hardware_concurrency();
    return cpus == 0 ? 1 : cpus;
}

EnvLookup process_environment() {
    return [](const char* name) -> const char* { return std::getenv(name); };
}

Result<uint64_t> parse_size(const std::string& text) {
    const std::string value = trim(text);
    size_t digits = 0;
    while (digits < value.size() && std::isdigit(static_cast<unsigned char>(value[digits]))) {
        ++digits;
    }
    if (digits == 0) {
        return Err<uint64_t>(Error::validation("invalid size '" + text + "'"));
    }

    std::string suffix = trim(value.substr(digits));
    std::transform(suffix.begin(), suffix.end(), suffix.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    uint64_t multiplier = 0;
    if (suffix.empty() || suffix == "B") {
        multiplier = 1;
    } else if (suffix == "KB") {
        multiplier = 1024ull;
    } else if (suffix == "MB") {
        multiplier = kMiB;
    } else if (suffix == "GB") {
        multiplier = 1024ull * kMiB;
    } else {
        return Err<uint64_t>(Error::validation("unknown size suffix in '" + text + "'"));
    }

    uint64_t number = 0;
    for (size_t i = 0; i < digits; ++i) {
        const uint64_t digit = static_cast<uint64_t>(value[i] - '0');
        if (number > (std::numeric_limits<uint64_t>::max() - digit) / 10) {
            return Err<uint64_t>(Error::validation("size '" + text + "' is too large"));
        }
        number = number * 10 + digit;
    }
    if (number == 0) {
        return Err<uint64_t>(Error::validation("size must be greater than zero"));
    }
    if (number > std::numeric_limits<uint64_t>::max() / multiplier) {
        return Err<uint64_t>(Error::validation("size '" + text + "' is too large"));
    }
    return Ok(number * multiplier);
}

Result<void> apply_config_yaml(Config& config, const std::string& yaml_text, const std::string& origin) {
    try {
        const YAML::Node root = YAML::Load(yaml_text);
        if (root.IsNull()) {
            return Ok();
        }
        if (!root.IsMap()) {
            return Err<void>(Error::validation(origin + ": expected a mapping of settings"));
        }

        for (const auto& entry : root) {
            const auto key = entry.first.as<std::string>();
            if (std::find(kKnownKeys.begin(), kKnownKeys.end(), key) == kKnownKeys.end()) {
                spdlog::warn("{}: ignoring unknown setting '{}'", origin, key);
            }
        }

        if (root["url"]) config.url = root["url"].as<std::string>();
        if (root["auth"]) config.auth = root["auth"].as<std::string>();
        if (root["file_exclude_regex"]) config.file_exclude_regex = root["file_exclude_regex"].as<std::string>();

        if (root["upload_workers"]) {
            auto workers = read_positive(root["upload_workers"], "upload_workers", origin);
            if (workers.is_error()) return Err<void>(workers.error());
            config.upload_workers = static_cast<size_t>(workers.value());
        }
        if (root["download_workers"]) {
            auto workers = read_positive(root["download_workers"], "download_workers", origin);
            if (workers.is_error()) return Err<void>(workers.error());
            config.download_workers = static_cast<size_t>(workers.value());
        }
        if (root["upload_bytes_per_chunk"]) {
            auto size = read_size(root["upload_bytes_per_chunk"], "upload_bytes_per_chunk", origin);
            if (size.is_error()) return Err<void>(size.error());
            config.upload_bytes_per_chunk = size.value();
        }
        if (root["download_bytes_per_chunk"]) {
            auto size = read_size(root["download_bytes_per_chunk"], "download_bytes_per_chunk", origin);
            if (size.is_error()) return Err<void>(size.error());
            config.download_bytes_per_chunk = size.value();
        }
        if (root["retry_attempts"]) {
            auto attempts = read_positive(root["retry_attempts"], "retry_attempts", origin);
            if (attempts.is_error()) return Err<void>(attempts.error());
            config.retry.max_attempts = static_cast<uint32_t>(attempts.value());
        }
        if (root["retry_initial_backoff_ms"]) {
            const auto ms = root["retry_initial_backoff_ms"].as<long long>();
            if (ms < 0) {
                return Err<void>(Error::validation(origin + ": 'retry_initial_backoff_ms' must not be negative"));
            }
            config.retry.initial_backoff = std::chrono::milliseconds(ms);
        }
        if (root["retry_max_backoff_ms"]) {
            const auto ms = root["retry_max_backoff_ms"].as<long long>();
            if (ms < 0) {
                return Err<void>(Error::validation(origin + ": 'retry_max_backoff_ms' must not be negative"));
            }
            config.retry.max_backoff = std::chrono::milliseconds(ms);
        }
        if (root["request_timeout_seconds"]) {
            auto seconds = read_positive(root["request_timeout_seconds"], "request_timeout_seconds", origin);
            if (seconds.is_error()) return Err<void>(seconds.error());
            config.request_timeout = std::chrono::seconds(seconds.value());
        }
        if (root["log_level"]) {
            const auto level = root["log_level"].as<std::string>();
            if (std::find(kLogLevels.begin(), kLogLevels.end(), level) == kLogLevels.end()) {
                return Err<void>(Error::validation(origin + ": unknown log_level '" + level + "'"));
            }
            config.log_level = level;
        }
    } catch (const YAML::Exception& e) {
        return Err<void>(Error::validation(origin + ": " + e.what()));
    }
    return Ok();
}

void apply_environment(Config& config, const EnvLookup& env) {
    if (const char* url = env("DDSYNC_URL"); url != nullptr && *url != '\0') {
        config.url = url;
    }
    if (config.auth.empty()) {
        if (const char* token = env("DDSYNC_AUTH"); token != nullptr) {
            config.auth = token;
        }
    }
}

std::vector<std::string> default_config_files(const EnvLookup& env) {
    std::vector<std::string> files{"/etc/ddsync.conf"};
    if (const char* user_file = env("DDSYNC_CONF"); user_file != nullptr && *user_file != '\0') {
        files.emplace_back(user_file);
    } else if (const char* home = env("HOME"); home != nullptr && *home != '\0') {
        files.push_back((fs::path(home) / ".ddsync").string());
    }
    return files;
}

Result<Config> load_config(const std::vector<std::string>& files, const EnvLookup& env) {
    Config config;

    for (const auto& file : files) {
        std::error_code ec;
        if (!fs::exists(file, ec)) {
            spdlog::debug("Config file {} not present", file);
            continue;
        }

        std::ifstream in(file, std::ios::binary);
        if (!in) {
            return Err<Config>(Error::filesystem("cannot read config file " + file));
        }
        std::ostringstream buffer;
        buffer << in.rdbuf();

        auto applied = apply_config_yaml(config, buffer.str(), file);
        if (applied.is_error()) {
            return Err<Config>(applied.error());
        }
        spdlog::debug("Loaded config file {}", file);
    }

    apply_environment(config, env);

    if (config.url.empty()) {
        return Err<Config>(Error::validation("service url is empty"));
    }
    try {
        std::regex check(config.file_exclude_regex);
        (void)check;
    } catch (const std::regex_error& e) {
        return Err<Config>(Error::validation("invalid file_exclude_regex: " + std::string(e.what())));
    }
    return Ok(std::move(config));
}

} // namespace ddsync
