#pragma once

#include "ddsync/content/node.hpp"
#include "ddsync/content/path_filter.hpp"
#include "ddsync/core/config.hpp"
#include "ddsync/sync/plan.hpp"

#include <filesystem>

namespace ddsync::sync {

/**
 * @brief Compares two trees by path and decides what to transfer
 *
 * Nodes are matched by their full path, never by remote id: the same content
 * under another path is a different node. A file whose fingerprint and size
 * both match is skipped. A fingerprint match with a different size is treated
 * as a collision and uploaded again.
 */
class Differ {
public:
    explicit Differ(const Config& config) : config_(config) {}

    /**
     * @brief Plan for pushing a local tree
     *
     * @param local  Local snapshot (Project root)
     * @param remote Remote snapshot, nullptr when the project does not exist
     */
    Result<OperationPlan> plan_upload(const content::ContentNode& local,
                                      const content::ContentNode* remote) const;

    /**
     * @brief Plan for pulling a remote tree into destination
     *
     * @param local  Snapshot of the destination, nullptr when it does not exist.
     *               Every local entry must have a remote counterpart of the same
     *               kind and every local file must match the remote content.
     * @param filter Optional include/exclude restriction on remote paths
     */
    Result<OperationPlan> plan_download(const content::ContentNode& remote,
                                        const content::ContentNode* local,
                                        const std::filesystem::path& destination,
                                        const content::PathFilter* filter = nullptr) const;

private:
    Result<void> plan_upload_children(const content::ContentNode& local, const content::ContentNode* remote,
                                      size_t parent, OperationPlan& plan) const;

    Result<void> plan_download_children(const content::ContentNode& remote, const content::ContentNode* local,
                                        size_t parent, const std::filesystem::path& destination,
                                        const content::PathFilter* filter, OperationPlan& plan) const;

    const Config& config_;
};

} // namespace ddsync::sync
