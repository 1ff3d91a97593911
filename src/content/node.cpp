#include "ddsync/content/node.hpp"

namespace ddsync::content {

const char* to_string(NodeKind kind) noexcept {
    switch (kind) {
        case NodeKind::Project: return "project";
        case NodeKind::Folder: return "folder";
        case NodeKind::File: return "file";
    }
    return "unknown";
}

bool is_container(NodeKind kind) noexcept {
    switch (kind) {
        case NodeKind::Project:
        case NodeKind::Folder:
            return true;
        case NodeKind::File:
            return false;
    }
    return false;
}

std::string join_path(const std::vector<std::string>& components) {
    std::string joined;
    for (const auto& component : components) {
        if (!joined.empty()) {
            joined += '/';
        }
        joined += component;
    }
    return joined;
}

// ----------------------------------------------------------------------------
// LazyFingerprint
// ----------------------------------------------------------------------------

void LazyFingerprint::preset(Fingerprint fingerprint) {
    std::lock_guard lock(mutex_);
    value_ = std::move(fingerprint);
    error_.reset();
}

Result<Fingerprint> LazyFingerprint::get(const std::optional<std::filesystem::path>& source) const {
    std::lock_guard lock(mutex_);
    if (value_) {
        return Ok(*value_);
    }
    if (error_) {
        return Err<Fingerprint>(*error_);
    }
    if (!source) {
        return Err<Fingerprint>(Error::not_found("no fingerprint recorded and no local content to hash"));
    }

    auto computed = fingerprint_file(*source);
    if (computed.is_error()) {
        error_ = computed.error();
        return computed;
    }
    value_ = computed.value();
    return computed;
}

std::optional<Fingerprint> LazyFingerprint::peek() const {
    std::lock_guard lock(mutex_);
    return value_;
}

// ----------------------------------------------------------------------------
// ContentNode
// ----------------------------------------------------------------------------

ContentNode::ContentNode(NodeKind kind, std::string name)
    : kind_(kind), name_(std::move(name)) {
    switch (kind_) {
        case NodeKind::Project:
        case NodeKind::Folder:
            body_.emplace<ContainerBody>();
            break;
        case NodeKind::File:
            body_.emplace<FileBody>().fingerprint = std::make_unique<LazyFingerprint>();
            break;
    }
}

NodePtr ContentNode::make_project(std::string name) {
    return NodePtr(new ContentNode(NodeKind::Project, std::move(name)));
}

NodePtr ContentNode::make_folder(std::string name) {
    return NodePtr(new ContentNode(NodeKind::Folder, std::move(name)));
}

NodePtr ContentNode::make_file(std::string name, uint64_t size) {
    NodePtr node(new ContentNode(NodeKind::File, std::move(name)));
    std::get<FileBody>(node->body_).size = size;
    return node;
}

std::string ContentNode::path_string() const {
    return join_path(path_);
}

std::string ContentNode::display_path() const {
    return path_.empty() ? std::string("/") : path_string();
}

uint64_t ContentNode::size() const {
    if (const auto* file = std::get_if<FileBody>(&body_)) {
        return file->size;
    }
    return std::get<ContainerBody>(body_).total_size;
}

uint64_t ContentNode::file_count() const {
    if (std::holds_alternative<FileBody>(body_)) {
        return 1;
    }
    return std::get<ContainerBody>(body_).file_count;
}

uint64_t ContentNode::folder_count() const {
    if (std::holds_alternative<FileBody>(body_)) {
        return 0;
    }
    return std::get<ContainerBody>(body_).folder_count;
}

const std::vector<NodePtr>& ContentNode::children() const {
    static const std::vector<NodePtr> kNoChildren;
    if (const auto* container = std::get_if<ContainerBody>(&body_)) {
        return container->children;
    }
    return kNoChildren;
}

const ContentNode* ContentNode::child(const std::string& name) const {
    const auto* container = std::get_if<ContainerBody>(&body_);
    if (!container) {
        return nullptr;
    }
    auto it = container->index.find(name);
    return it == container->index.end() ? nullptr : container->children[it->second].get();
}

const ContentNode* ContentNode::find(const std::vector<std::string>& relative_path) const {
    const ContentNode* current = this;
    for (const auto& name : relative_path) {
        current = current->child(name);
        if (!current) {
            return nullptr;
        }
    }
    return current;
}

Result<ContentNode*> ContentNode::add_child(NodePtr child) {
    if (!child) {
        return Err<ContentNode*>(Error::validation("cannot attach an empty node"));
    }

    auto* container = std::get_if<ContainerBody>(&body_);
    if (!container) {
        return Err<ContentNode*>(Error::validation(
            "file '" + display_path() + "' cannot hold child '" + child->name() + "'"));
    }

    switch (child->kind()) {
        case NodeKind::Project:
            return Err<ContentNode*>(Error::validation(
                "project '" + child->name() + "' cannot be nested under '" + display_path() + "'"));
        case NodeKind::Folder:
        case NodeKind::File:
            break;
    }

    const std::string& name = child->name();
    if (name.empty() || name == "." || name == ".." || name.find('/') != std::string::npos) {
        return Err<ContentNode*>(Error::validation("invalid node name '" + name + "'"));
    }
    if (container->index.count(name) > 0) {
        return Err<ContentNode*>(Error::validation(
            "duplicate name '" + name + "' under '" + display_path() + "'"));
    }

    child->parent_ = this;
    child->rebase(path_);

    const uint64_t added_size = child->size();
    const uint64_t added_files = child->kind() == NodeKind::File ? 1 : child->file_count();
    const uint64_t added_folders = child->folder_count() + (child->kind() == NodeKind::Folder ? 1 : 0);

    container->index.emplace(name, container->children.size());
    container->children.push_back(std::move(child));
    ContentNode* attached = container->children.back().get();

    propagate(added_size, added_files, added_folders);
    return Ok(attached);
}

void ContentNode::rebase(const std::vector<std::string>& parent_path) {
    path_ = parent_path;
    path_.push_back(name_);
    if (auto* container = std::get_if<ContainerBody>(&body_)) {
        for (auto& grandchild : container->children) {
            grandchild->rebase(path_);
        }
    }
}

void ContentNode::propagate(uint64_t size, uint64_t files, uint64_t folders) {
    for (ContentNode* node = this; node != nullptr; node = node->parent_) {
        auto& container = std::get<ContainerBody>(node->body_);
        container.total_size += size;
        container.file_count += files;
        container.folder_count += folders;
    }
}

Result<Fingerprint> ContentNode::fingerprint() const {
    const auto* file = std::get_if<FileBody>(&body_);
    if (!file) {
        return Err<Fingerprint>(Error::validation(
            std::string(to_string(kind_)) + " '" + display_path() + "' has no fingerprint"));
    }
    return file->fingerprint->get(local_path_);
}

std::optional<Fingerprint> ContentNode::known_fingerprint() const {
    const auto* file = std::get_if<FileBody>(&body_);
    return file ? file->fingerprint->peek() : std::nullopt;
}

void ContentNode::set_fingerprint(Fingerprint fingerprint) {
    if (auto* file = std::get_if<FileBody>(&body_)) {
        file->fingerprint->preset(std::move(fingerprint));
    }
}

void walk(const ContentNode& root, const NodeVisitor& visit) {
    std::vector<std::pair<const ContentNode*, const ContentNode*>> stack{{&root, nullptr}};
    while (!stack.empty()) {
        auto [node, parent] = stack.back();
        stack.pop_back();
        visit(*node, parent);

        const auto& children = node->children();
        for (auto it = children.rbegin(); it != children.rend(); ++it) {
            stack.emplace_back(it->get(), node);
        }
    }
}

} // namespace ddsync::content
