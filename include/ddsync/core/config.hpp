#pragma once

#include "ddsync/core/result.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace ddsync {

inline constexpr const char* kDefaultServiceUrl = "https://api.dataservice.example.org/api/v1";
inline constexpr const char* kDefaultExcludeRegex = "^\\.DS_Store$|^\\.ddsync$|^\\._";
inline constexpr uint64_t kMiB = 1024ull * 1024ull;

/// Returns the number of available processors, never less than one
size_t default_worker_count();

struct RetrySettings {
    uint32_t max_attempts = 5; ///< Total attempts, including the first one
    std::chrono::milliseconds initial_backoff{1000};
    std::chrono::milliseconds max_backoff{30000};
};

/**
 * @brief Settings for one invocation
 *
 * Loaded once before a run starts and handed by const reference to every
 * component that needs it. Nothing re-reads configuration mid-operation.
 */
struct Config {
    std::string url = kDefaultServiceUrl;
    std::string auth;
    size_t upload_workers = default_worker_count();
    size_t download_workers = default_worker_count();
    uint64_t upload_bytes_per_chunk = 100 * kMiB;
    uint64_t download_bytes_per_chunk = 20 * kMiB;
    std::string file_exclude_regex = kDefaultExcludeRegex;
    RetrySettings retry;
    std::chrono::seconds request_timeout{60};
    std::string log_level = "info";
};

/// Environment lookup, std::getenv in production and a map in tests
using EnvLookup = std::function<const char*(const char*)>;

EnvLookup process_environment();

/**
 * @brief Parses "1048576", "512KB", "100MB", "2GB" (binary multiples)
 *
 * Zero, negative, malformed or overflowing values are Validation errors.
 */
Result<uint64_t> parse_size(const std::string& text);

/**
 * @brief Merges the keys present in a YAML document into config
 *
 * Keys absent from the document keep their current value, so calling this
 * once per file applies later files on top of earlier ones.
 */
Result<void> apply_config_yaml(Config& config, const std::string& yaml_text,
                               const std::string& origin = "<string>");

/// Applies DDSYNC_URL (always wins) and DDSYNC_AUTH (only when no token is configured)
void apply_environment(Config& config, const EnvLookup& env);

/// System file first, then the user file (DDSYNC_CONF or ~/.ddsync)
std::vector<std::string> default_config_files(const EnvLookup& env);

/**
 * @brief Builds the configuration for one run
 *
 * Reads every existing file in order, then applies the environment and
 * validates the result. Missing files are skipped silently.
 */
Result<Config> load_config(const std::vector<std::string>& files, const EnvLookup& env);

} // namespace ddsync
