#pragma once

#include "ddsync/content/ignore_rules.hpp"
#include "ddsync/content/node.hpp"
#include "ddsync/core/config.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace ddsync::content {

/**
 * @brief Builds a Project tree from the local filesystem
 *
 * Directories become Folders, regular files become Files with their size
 * taken from filesystem metadata. Fingerprints are left to be computed on
 * demand. Entries are visited in name order so the tree is deterministic.
 *
 * Failures (all Filesystem errors): unreadable paths, dangling symlinks,
 * symlink cycles and entries that are neither regular files nor directories.
 */
class LocalTreeBuilder {
public:
    LocalTreeBuilder(const Config& config, bool follow_symlinks);

    /// The entries of root become the project's direct children
    Result<NodePtr> build(const std::string& project_name, const std::filesystem::path& root) const;

    /// Each path becomes one direct child of the project
    Result<NodePtr> build_from_paths(const std::string& project_name,
                                     const std::vector<std::filesystem::path>& paths) const;

private:
    using WalkStack = std::vector<std::filesystem::path>;

    /// nullptr result means the entry was skipped
    Result<NodePtr> build_entry(const std::filesystem::path& path, IgnoreRules& rules, WalkStack& stack) const;

    Result<void> add_directory_entries(ContentNode& parent, const std::filesystem::path& directory,
                                       IgnoreRules& rules, WalkStack& stack) const;

    const Config& config_;
    bool follow_symlinks_;
};

} // namespace ddsync::content
