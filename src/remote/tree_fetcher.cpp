#include "ddsync/remote/tree_fetcher.hpp"

#include <spdlog/spdlog.h>

#include <unordered_map>
#include <unordered_set>

namespace ddsync::remote {

using content::ContentNode;
using content::NodeKind;
using content::NodePtr;

namespace {

using ChildIndex = std::unordered_map<std::string, std::vector<const RemoteEntry*>>;

Result<size_t> attach_children(ContentNode& parent, const std::string& parent_id, const ChildIndex& index) {
    auto it = index.find(parent_id);
    if (it == index.end()) {
        return Ok(size_t{0});
    }

    size_t attached_count = 0;
    for (const RemoteEntry* entry : it->second) {
        NodePtr node;
        switch (entry->kind) {
            case NodeKind::Project:
                return Err<size_t>(Error::service(0,
                    "listing nests project '" + entry->name + "' under '" + parent.display_path() + "'"));
            case NodeKind::Folder:
                node = ContentNode::make_folder(entry->name);
                break;
            case NodeKind::File:
                node = ContentNode::make_file(entry->name, entry->size);
                if (entry->fingerprint) {
                    node->set_fingerprint(*entry->fingerprint);
                }
                break;
        }
        node->set_remote_id(entry->id);

        auto attached = parent.add_child(std::move(node));
        if (attached.is_error()) {
            return Err<size_t>(Error::service(0, "inconsistent listing: " + attached.error().message));
        }
        ++attached_count;

        auto nested = attach_children(*attached.value(), entry->id, index);
        if (nested.is_error()) {
            return nested;
        }
        attached_count += nested.value();
    }
    return Ok(attached_count);
}

} // namespace

Result<NodePtr> RemoteTreeFetcher::fetch(const std::string& project_name) const {
    auto project_id = service_.find_project(project_name);
    if (project_id.is_error()) {
        return Err<NodePtr>(project_id.error());
    }
    if (!project_id.value()) {
        spdlog::debug("Remote project '{}' does not exist", project_name);
        return Ok(NodePtr());
    }
    const std::string id = *project_id.value();

    auto entries = service_.list_project_tree(id);
    if (entries.is_error()) {
        return Err<NodePtr>(entries.error());
    }

    ChildIndex index;
    std::unordered_set<std::string> seen_ids;
    for (const auto& entry : entries.value()) {
        if (entry.id.empty() || entry.id == id || !seen_ids.insert(entry.id).second) {
            return Err<NodePtr>(Error::service(0, "listing repeats node id '" + entry.id + "'"));
        }
        index[entry.parent_id].push_back(&entry);
    }

    auto project = ContentNode::make_project(project_name);
    project->set_remote_id(id);

    auto attached = attach_children(*project, id, index);
    if (attached.is_error()) {
        return Err<NodePtr>(attached.error());
    }
    if (attached.value() != entries.value().size()) {
        return Err<NodePtr>(Error::service(0,
            std::to_string(entries.value().size() - attached.value()) + " listed node(s) have no path to the project"));
    }

    spdlog::debug("Fetched remote project '{}': {} file(s), {} folder(s)",
        project_name, project->file_count(), project->folder_count());
    return Ok(std::move(project));
}

} // namespace ddsync::remote
