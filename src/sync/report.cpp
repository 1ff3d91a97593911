#include "ddsync/sync/report.hpp"

#include <algorithm>

namespace ddsync::sync {

const char* to_string(OutcomeStatus status) noexcept {
    switch (status) {
        case OutcomeStatus::Pending: return "pending";
        case OutcomeStatus::Planned: return "planned";
        case OutcomeStatus::Succeeded: return "ok";
        case OutcomeStatus::Skipped: return "unchanged";
        case OutcomeStatus::Failed: return "failed";
        case OutcomeStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

TransferReport::TransferReport(const OperationPlan& plan) {
    outcomes_.reserve(plan.operations.size());
    for (const auto& op : plan.operations) {
        NodeOutcome outcome;
        outcome.path = op.display_path;
        outcome.node_kind = op.node_kind;
        outcome.operation = op.kind;
        outcome.remote_id = op.remote_id;
        outcomes_.push_back(std::move(outcome));
    }
}

size_t TransferReport::count(OutcomeStatus status) const {
    return static_cast<size_t>(std::count_if(outcomes_.begin(), outcomes_.end(),
        [status](const NodeOutcome& outcome) { return outcome.status == status; }));
}

bool TransferReport::has_failures() const {
    return count(OutcomeStatus::Failed) > 0 || count(OutcomeStatus::Cancelled) > 0;
}

uint64_t TransferReport::bytes_transferred() const {
    uint64_t total = 0;
    for (const auto& outcome : outcomes_) {
        total += outcome.bytes;
    }
    return total;
}

const NodeOutcome* TransferReport::find(const std::string& path) const {
    auto it = std::find_if(outcomes_.begin(), outcomes_.end(),
        [&path](const NodeOutcome& outcome) { return outcome.path == path; });
    return it == outcomes_.end() ? nullptr : &*it;
}

} // namespace ddsync::sync
