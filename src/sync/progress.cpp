#include "ddsync/sync/progress.hpp"

#include <spdlog/spdlog.h>

namespace ddsync::sync {

using namespace ddsync::events;

ProgressAggregator::ProgressAggregator(EventBus& bus) : bus_(bus) {
    plan_ready_ = bus_.subscribe<PlanReadyEvent>([this](const PlanReadyEvent& e) {
        counters_.total_files += e.transfer_files;
        counters_.total_bytes += e.transfer_bytes;
    });

    chunk_transferred_ = bus_.subscribe<ChunkTransferredEvent>([this](const ChunkTransferredEvent& e) {
        counters_.bytes_done += e.bytes;
    });

    chunk_retry_ = bus_.subscribe<ChunkRetryEvent>([this](const ChunkRetryEvent&) {
        counters_.retries++;
    });

    file_transferred_ = bus_.subscribe<FileTransferredEvent>([this](const FileTransferredEvent&) {
        counters_.files_done++;
    });

    file_skipped_ = bus_.subscribe<FileSkippedEvent>([this](const FileSkippedEvent&) {
        counters_.files_skipped++;
    });

    node_failed_ = bus_.subscribe<NodeFailedEvent>([this](const NodeFailedEvent&) {
        counters_.nodes_failed++;
    });
}

ProgressAggregator::~ProgressAggregator() {
    bus_.unsubscribe<PlanReadyEvent>(plan_ready_);
    bus_.unsubscribe<ChunkTransferredEvent>(chunk_transferred_);
    bus_.unsubscribe<ChunkRetryEvent>(chunk_retry_);
    bus_.unsubscribe<FileTransferredEvent>(file_transferred_);
    bus_.unsubscribe<FileSkippedEvent>(file_skipped_);
    bus_.unsubscribe<NodeFailedEvent>(node_failed_);
}

ProgressSnapshot ProgressAggregator::snapshot() const {
    ProgressSnapshot snap;
    snap.total_files = counters_.total_files.load();
    snap.total_bytes = counters_.total_bytes.load();
    snap.files_done = counters_.files_done.load();
    snap.bytes_done = counters_.bytes_done.load();
    snap.files_skipped = counters_.files_skipped.load();
    snap.nodes_failed = counters_.nodes_failed.load();
    snap.retries = counters_.retries.load();
    return snap;
}

void ProgressAggregator::reset() {
    counters_.total_files = 0;
    counters_.total_bytes = 0;
    counters_.files_done = 0;
    counters_.bytes_done = 0;
    counters_.files_skipped = 0;
    counters_.nodes_failed = 0;
    counters_.retries = 0;
}

void ProgressAggregator::print_stats() const {
    const auto snap = snapshot();
    spdlog::info("Progress: {}/{} file(s), {}/{} bytes ({:.1f}%), {} unchanged, {} failed, {} retries",
        snap.files_done, snap.total_files, snap.bytes_done, snap.total_bytes, snap.percent(),
        snap.files_skipped, snap.nodes_failed, snap.retries);
}

} // namespace ddsync::sync
