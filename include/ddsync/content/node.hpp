/**
 * @file node.hpp
 * @brief Tree model shared by the local and remote sides of a sync
 *
 * A tree is a snapshot: the local builder produces one from a filesystem walk
 * and the remote fetcher produces one from the service listing. Both are read
 * by the differ and then discarded at the end of the run.
 *
 * SHAPE:
 *   Project            (always the root, never a child)
 *     ├── Folder       (container, may nest)
 *     │     └── File
 *     └── File
 *
 * Children keep insertion order and sibling names are unique. Containers carry
 * aggregate size and counts that are updated as children are attached, so a
 * finished tree is always consistent with its leaves.
 */

#pragma once

#include "ddsync/content/fingerprint.hpp"
#include "ddsync/core/result.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace ddsync::content {

enum class NodeKind {
    Project,
    Folder,
    File
};

const char* to_string(NodeKind kind) noexcept;

/// Project and Folder hold children, File holds bytes
bool is_container(NodeKind kind) noexcept;

class ContentNode;
using NodePtr = std::unique_ptr<ContentNode>;

/**
 * @brief File fingerprint computed at most once per snapshot
 *
 * Either preset (remote trees report it) or computed on first request by
 * streaming the backing file. The first outcome, success or failure, sticks.
 */
class LazyFingerprint {
public:
    void preset(Fingerprint fingerprint);

    Result<Fingerprint> get(const std::optional<std::filesystem::path>& source) const;

    /// Value if already known, without triggering a computation
    std::optional<Fingerprint> peek() const;

private:
    mutable std::mutex mutex_;
    mutable std::optional<Fingerprint> value_;
    mutable std::optional<Error> error_;
};

class ContentNode {
public:
    static NodePtr make_project(std::string name);
    static NodePtr make_folder(std::string name);
    static NodePtr make_file(std::string name, uint64_t size);

    ContentNode(const ContentNode&) = delete;
    ContentNode& operator=(const ContentNode&) = delete;

    NodeKind kind() const { return kind_; }
    bool is_container() const { return content::is_container(kind_); }
    const std::string& name() const { return name_; }

    /// Names from the project root down to this node; empty for the root
    const std::vector<std::string>& path() const { return path_; }

    /// "docs/a.txt" style key, empty for the root
    std::string path_string() const;

    /// path_string(), with the root shown as "/"
    std::string display_path() const;

    const ContentNode* parent() const { return parent_; }

    /// File byte length, or the sum of descendant file sizes for containers
    uint64_t size() const;

    /// Descendant file count (1 for a file)
    uint64_t file_count() const;

    /// Descendant folder count (0 for a file)
    uint64_t folder_count() const;

    /// Children in insertion order; always empty for files
    const std::vector<NodePtr>& children() const;

    const ContentNode* child(const std::string& name) const;

    /// Descends by relative path components, nullptr when absent
    const ContentNode* find(const std::vector<std::string>& relative_path) const;

    /**
     * @brief Attaches a child and returns a pointer to it
     *
     * Rejects a Project child, a File parent, an invalid name and a name
     * already used by a sibling. Aggregates of every ancestor are updated.
     */
    Result<ContentNode*> add_child(NodePtr child);

    const std::optional<std::string>& remote_id() const { return remote_id_; }
    void set_remote_id(std::string id) { remote_id_ = std::move(id); }

    const std::optional<std::filesystem::path>& local_path() const { return local_path_; }
    void set_local_path(std::filesystem::path path) { local_path_ = std::move(path); }

    /// Computes on first call for local files; Validation error for containers
    Result<Fingerprint> fingerprint() const;

    std::optional<Fingerprint> known_fingerprint() const;

    /// Records a fingerprint reported by the remote side (files only)
    void set_fingerprint(Fingerprint fingerprint);

private:
    struct ContainerBody {
        ContainerBody() {}
        std::vector<NodePtr> children;
        std::unordered_map<std::string, size_t> index;
        uint64_t total_size = 0;
        uint64_t file_count = 0;
        uint64_t folder_count = 0;
    };

    struct FileBody {
        FileBody() {}
        uint64_t size = 0;
        std::unique_ptr<LazyFingerprint> fingerprint;
    };

    ContentNode(NodeKind kind, std::string name);

    void rebase(const std::vector<std::string>& parent_path);
    void propagate(uint64_t size, uint64_t files, uint64_t folders);

    NodeKind kind_;
    std::string name_;
    std::vector<std::string> path_;
    ContentNode* parent_ = nullptr;
    std::variant<ContainerBody, FileBody> body_;
    std::optional<std::string> remote_id_;
    std::optional<std::filesystem::path> local_path_;
};

using NodeVisitor = std::function<void(const ContentNode& node, const ContentNode* parent)>;

/// Pre-order traversal: a container is always visited before its children
void walk(const ContentNode& root, const NodeVisitor& visit);

std::string join_path(const std::vector<std::string>& components);

} // namespace ddsync::content
