#pragma once

#include "ddsync/content/node.hpp"
#include "ddsync/core/error.hpp"
#include "ddsync/sync/plan.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ddsync::sync {

enum class OutcomeStatus {
    Pending,
    Planned,   ///< Dry run: nothing was executed
    Succeeded,
    Skipped,
    Failed,
    Cancelled
};

const char* to_string(OutcomeStatus status) noexcept;

struct NodeOutcome {
    std::string path;
    content::NodeKind node_kind = content::NodeKind::File;
    OperationKind operation = OperationKind::Skip;
    OutcomeStatus status = OutcomeStatus::Pending;
    std::optional<Error> error;
    std::optional<std::string> remote_id;
    uint64_t bytes = 0;                   ///< Bytes actually moved
    std::vector<uint32_t> chunk_attempts; ///< Attempts per chunk number
};

/**
 * @brief Per-node result of a run, indexed like the plan it came from
 *
 * Only the run coordinator writes to it, one entry per planned operation.
 */
class TransferReport {
public:
    TransferReport() = default;
    explicit TransferReport(const OperationPlan& plan);

    NodeOutcome& at(size_t index) { return outcomes_.at(index); }
    const NodeOutcome& at(size_t index) const { return outcomes_.at(index); }

    const std::vector<NodeOutcome>& outcomes() const { return outcomes_; }
    size_t size() const { return outcomes_.size(); }

    size_t count(OutcomeStatus status) const;

    /// Any node failed or was cancelled
    bool has_failures() const;

    uint64_t bytes_transferred() const;

    const NodeOutcome* find(const std::string& path) const;

    std::chrono::milliseconds duration{0};

private:
    std::vector<NodeOutcome> outcomes_;
};

} // namespace ddsync::sync
