#include "ddsync/sync/plan.hpp"

#include <algorithm>

namespace ddsync::sync {

size_t OperationPlan::count(OperationKind kind) const {
    return static_cast<size_t>(std::count_if(operations.begin(), operations.end(),
        [kind](const PlannedOperation& op) { return op.kind == kind; }));
}

uint64_t OperationPlan::transfer_bytes() const {
    uint64_t total = 0;
    for (const auto& op : operations) {
        if (is_transfer(op.kind)) {
            total += op.size;
        }
    }
    return total;
}

std::vector<std::vector<size_t>> OperationPlan::children_index() const {
    std::vector<std::vector<size_t>> children(operations.size());
    for (size_t i = 0; i < operations.size(); ++i) {
        if (operations[i].parent != kNoParent) {
            children[operations[i].parent].push_back(i);
        }
    }
    return children;
}

const PlannedOperation* OperationPlan::find(const std::string& display_path) const {
    auto it = std::find_if(operations.begin(), operations.end(),
        [&display_path](const PlannedOperation& op) { return op.display_path == display_path; });
    return it == operations.end() ? nullptr : &*it;
}

uint64_t chunk_count(uint64_t size, uint64_t chunk_size) {
    if (size == 0 || chunk_size == 0) {
        return 0;
    }
    return (size + chunk_size - 1) / chunk_size;
}

} // namespace ddsync::sync
