#pragma once

#include "ddsync/content/fingerprint.hpp"
#include "ddsync/content/node.hpp"
#include "ddsync/sync/types.hpp"

#include <cstdint>
#include <filesystem>
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace ddsync::sync {

inline constexpr size_t kNoParent = std::numeric_limits<size_t>::max();

/**
 * @brief One decision of the differ
 *
 * Operations hold copies of everything the transfer layer needs, so the
 * trees the plan was computed from are never touched by workers.
 */
struct PlannedOperation {
    OperationKind kind = OperationKind::Skip;
    content::NodeKind node_kind = content::NodeKind::File;
    std::vector<std::string> path; ///< Empty for the project root
    std::string display_path;
    std::string name;
    size_t parent = kNoParent;     ///< Index of the parent container's operation

    /// Existing remote node: the container to reuse, the file to replace or the file to fetch
    std::optional<std::string> remote_id;

    uint64_t size = 0;
    std::optional<content::Fingerprint> fingerprint;
    uint64_t chunk_count = 0;

    /// Upload source or download destination
    std::optional<std::filesystem::path> local_path;
};

/**
 * @brief Ordered operations for one run
 *
 * Index 0 is always the project root and every container appears before
 * any of its descendants.
 */
struct OperationPlan {
    Direction direction = Direction::Upload;
    std::string project_name;
    std::vector<PlannedOperation> operations;

    size_t count(OperationKind kind) const;

    /// Bytes of every file whose content moves
    uint64_t transfer_bytes() const;

    /// For each operation, the indexes of its direct children
    std::vector<std::vector<size_t>> children_index() const;

    const PlannedOperation* find(const std::string& display_path) const;
};

/// Number of chunks for a file of the given size; 0 for an empty file
uint64_t chunk_count(uint64_t size, uint64_t chunk_size);

} // namespace ddsync::sync
