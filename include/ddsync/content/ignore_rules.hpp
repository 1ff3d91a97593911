#pragma once

#include "ddsync/core/result.hpp"

#include <filesystem>
#include <regex>
#include <string>
#include <vector>

namespace ddsync::content {

inline constexpr const char* kIgnoreFileName = ".ddsignore";

/**
 * @brief Decides which local entries never enter the tree
 *
 * Two sources: the configured name regex, tested against the entry's own
 * name, and the shell patterns read from .ddsignore files, each anchored at
 * the directory that holds the file.
 */
class IgnoreRules {
public:
    static Result<IgnoreRules> create(const std::string& exclude_regex);

    /// Reads <directory>/.ddsignore if present and keeps its patterns
    Result<void> load_directory(const std::filesystem::path& directory);

    bool is_excluded(const std::filesystem::path& entry) const;

    size_t pattern_count() const { return patterns_.size(); }

private:
    IgnoreRules() = default;

    bool has_regex_ = false;
    std::regex name_regex_;
    std::vector<std::string> patterns_;
};

} // namespace ddsync::content
