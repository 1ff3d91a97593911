#include "ddsync/content/local_tree.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>

namespace fs = std::filesystem;

namespace ddsync::content {
namespace {

fs::path normalized(const fs::path& path) {
    std::error_code ec;
    fs::path absolute = fs::absolute(path, ec);
    if (ec) {
        absolute = path;
    }
    absolute = absolute.lexically_normal();
    if (!absolute.has_filename() && absolute.has_parent_path()) {
        absolute = absolute.parent_path();
    }
    return absolute;
}

Error fs_error(const std::string& what, const fs::path& path, const std::error_code& ec) {
    return Error::filesystem(what + " " + path.string() + (ec ? ": " + ec.message() : std::string()));
}

} // namespace

LocalTreeBuilder::LocalTreeBuilder(const Config& config, bool follow_symlinks)
    : config_(config), follow_symlinks_(follow_symlinks) {}

Result<NodePtr> LocalTreeBuilder::build(const std::string& project_name, const fs::path& root) const {
    if (project_name.empty()) {
        return Err<NodePtr>(Error::validation("project name must not be empty"));
    }

    const fs::path dir = normalized(root);
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return Err<NodePtr>(fs_error("not a directory:", dir, ec));
    }

    auto rules = IgnoreRules::create(config_.file_exclude_regex);
    if (rules.is_error()) {
        return Err<NodePtr>(rules.error());
    }

    auto project = ContentNode::make_project(project_name);
    project->set_local_path(dir);

    const fs::path canonical = fs::canonical(dir, ec);
    if (ec) {
        return Err<NodePtr>(fs_error("cannot resolve", dir, ec));
    }
    WalkStack stack{canonical};

    auto added = add_directory_entries(*project, dir, rules.value(), stack);
    if (added.is_error()) {
        return Err<NodePtr>(added.error());
    }

    spdlog::debug("Scanned {}: {} file(s), {} folder(s), {} bytes",
        dir.string(), project->file_count(), project->folder_count(), project->size());
    return Ok(std::move(project));
}

Result<NodePtr> LocalTreeBuilder::build_from_paths(const std::string& project_name,
                                                   const std::vector<fs::path>& paths) const {
    if (project_name.empty()) {
        return Err<NodePtr>(Error::validation("project name must not be empty"));
    }
    if (paths.empty()) {
        return Err<NodePtr>(Error::validation("no local paths given"));
    }

    auto rules = IgnoreRules::create(config_.file_exclude_regex);
    if (rules.is_error()) {
        return Err<NodePtr>(rules.error());
    }

    auto project = ContentNode::make_project(project_name);

    for (const auto& raw : paths) {
        const fs::path path = normalized(raw);
        std::error_code ec;
        if (!fs::exists(fs::symlink_status(path, ec))) {
            return Err<NodePtr>(fs_error("no such file or directory:", path, ec));
        }

        WalkStack stack;
        auto entry = build_entry(path, rules.value(), stack);
        if (entry.is_error()) {
            return Err<NodePtr>(entry.error());
        }
        if (!entry.value()) {
            continue;
        }

        auto attached = project->add_child(std::move(entry.value()));
        if (attached.is_error()) {
            return Err<NodePtr>(attached.error());
        }
    }

    spdlog::debug("Scanned {} path(s): {} file(s), {} folder(s), {} bytes",
        paths.size(), project->file_count(), project->folder_count(), project->size());
    return Ok(std::move(project));
}

Result<NodePtr> LocalTreeBuilder::build_entry(const fs::path& path, IgnoreRules& rules, WalkStack& stack) const {
    std::error_code ec;
    const fs::file_status link_status = fs::symlink_status(path, ec);
    if (ec) {
        return Err<NodePtr>(fs_error("cannot stat", path, ec));
    }

    fs::file_status status = link_status;
    const bool is_link = fs::is_symlink(link_status);
    if (is_link) {
        status = fs::status(path, ec);
        if (ec || !fs::exists(status)) {
            return Err<NodePtr>(Error::filesystem("dangling symlink " + path.string()));
        }
    }

    const std::string name = path.filename().string();

    if (fs::is_regular_file(status)) {
        const auto size = fs::file_size(path, ec);
        if (ec) {
            return Err<NodePtr>(fs_error("cannot read size of", path, ec));
        }
        std::ifstream probe(path, std::ios::binary);
        if (!probe) {
            return Err<NodePtr>(Error::filesystem("unreadable file " + path.string()));
        }

        auto file = ContentNode::make_file(name, size);
        file->set_local_path(path);
        return Ok(std::move(file));
    }

    if (fs::is_directory(status)) {
        if (is_link && !follow_symlinks_) {
            spdlog::warn("Skipping symlinked directory {} (use --follow-symlinks to include it)", path.string());
            return Ok(NodePtr());
        }

        const fs::path canonical = fs::canonical(path, ec);
        if (ec) {
            return Err<NodePtr>(fs_error("cannot resolve", path, ec));
        }
        if (std::find(stack.begin(), stack.end(), canonical) != stack.end()) {
            return Err<NodePtr>(Error::filesystem(
                "symlink cycle at " + path.string() + " (revisits " + canonical.string() + ")"));
        }

        auto folder = ContentNode::make_folder(name);
        folder->set_local_path(path);

        stack.push_back(canonical);
        auto added = add_directory_entries(*folder, path, rules, stack);
        stack.pop_back();
        if (added.is_error()) {
            return Err<NodePtr>(added.error());
        }
        return Ok(std::move(folder));
    }

    return Err<NodePtr>(Error::filesystem(
        "unsupported entry type (not a regular file or directory): " + path.string()));
}

Result<void> LocalTreeBuilder::add_directory_entries(ContentNode& parent, const fs::path& directory,
                                                     IgnoreRules& rules, WalkStack& stack) const {
    auto loaded = rules.load_directory(directory);
    if (loaded.is_error()) {
        return loaded;
    }

    std::error_code ec;
    fs::directory_iterator it(directory, ec);
    if (ec) {
        return Err<void>(fs_error("cannot read directory", directory, ec));
    }

    std::vector<fs::path> entries;
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        entries.push_back(it->path());
    }
    if (ec) {
        return Err<void>(fs_error("cannot list", directory, ec));
    }
    std::sort(entries.begin(), entries.end());

    for (const auto& entry : entries) {
        if (rules.is_excluded(entry)) {
            spdlog::debug("Excluded {}", entry.string());
            continue;
        }

        auto node = build_entry(entry, rules, stack);
        if (node.is_error()) {
            return Err<void>(node.error());
        }
        if (!node.value()) {
            continue;
        }

        auto attached = parent.add_child(std::move(node.value()));
        if (attached.is_error()) {
            return Err<void>(attached.error());
        }
    }
    return Ok();
}

} // namespace ddsync::content
