#pragma once

#include "ddsync/core/result.hpp"

#include <set>
#include <string>
#include <vector>

namespace ddsync::content {

/**
 * @brief Restricts a download to part of the remote tree
 *
 * Paths are project-relative ("data/raw"). In include mode a path passes when
 * it is an included path, lies below one, or is an ancestor of one (so the
 * containers leading to it are created). In exclude mode a path passes unless
 * it is an excluded path or lies below one.
 */
class PathFilter {
public:
    /// Accepts everything
    PathFilter() = default;

    /// Validation error when both lists are non-empty
    static Result<PathFilter> create(std::vector<std::string> include, std::vector<std::string> exclude);

    bool accepts(const std::string& path) const;

    /// Filter paths that matched nothing so far
    std::vector<std::string> unused_paths() const;

    bool empty() const { return include_.empty() && exclude_.empty(); }

private:
    std::vector<std::string> include_;
    std::vector<std::string> exclude_;
    mutable std::set<std::string> used_;
};

} // namespace ddsync::content
