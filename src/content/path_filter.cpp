#include "ddsync/content/path_filter.hpp"

namespace ddsync::content {
namespace {

std::string strip_slashes(std::string path) {
    while (!path.empty() && path.front() == '/') {
        path.erase(path.begin());
    }
    while (!path.empty() && path.back() == '/') {
        path.pop_back();
    }
    return path;
}

bool is_at_or_below(const std::string& path, const std::string& prefix) {
    return path == prefix ||
           (path.size() > prefix.size() && path.compare(0, prefix.size(), prefix) == 0 &&
            path[prefix.size()] == '/');
}

} // namespace

Result<PathFilter> PathFilter::create(std::vector<std::string> include, std::vector<std::string> exclude) {
    if (!include.empty() && !exclude.empty()) {
        return Err<PathFilter>(Error::validation("include and exclude paths cannot be combined"));
    }

    PathFilter filter;
    for (auto& path : include) {
        path = strip_slashes(std::move(path));
        if (path.empty()) {
            return Err<PathFilter>(Error::validation("empty include path"));
        }
        filter.include_.push_back(path);
    }
    for (auto& path : exclude) {
        path = strip_slashes(std::move(path));
        if (path.empty()) {
            return Err<PathFilter>(Error::validation("empty exclude path"));
        }
        filter.exclude_.push_back(path);
    }
    return Ok(std::move(filter));
}

bool PathFilter::accepts(const std::string& raw_path) const {
    const std::string path = strip_slashes(raw_path);
    if (path.empty()) {
        return true;
    }

    if (!include_.empty()) {
        bool accepted = false;
        for (const auto& included : include_) {
            if (is_at_or_below(path, included)) {
                used_.insert(included);
                accepted = true;
            } else if (is_at_or_below(included, path)) {
                accepted = true;
            }
        }
        return accepted;
    }

    for (const auto& excluded : exclude_) {
        if (is_at_or_below(path, excluded)) {
            used_.insert(excluded);
            return false;
        }
    }
    return true;
}

std::vector<std::string> PathFilter::unused_paths() const {
    std::vector<std::string> unused;
    for (const auto& path : include_.empty() ? exclude_ : include_) {
        if (used_.count(path) == 0) {
            unused.push_back(path);
        }
    }
    return unused;
}

} // namespace ddsync::content
