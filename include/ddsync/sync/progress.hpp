#pragma once

#include "ddsync/events/event_bus.hpp"
#include "ddsync/events/events.hpp"

#include <atomic>
#include <cstdint>

namespace ddsync::sync {

struct ProgressSnapshot {
    uint64_t total_files = 0;
    uint64_t total_bytes = 0;
    uint64_t files_done = 0;
    uint64_t bytes_done = 0;
    uint64_t files_skipped = 0;
    uint64_t nodes_failed = 0;
    uint64_t retries = 0;

    /// Bytes completed against bytes planned, 100 when nothing needs moving
    double percent() const {
        return total_bytes == 0 ? 100.0 : 100.0 * static_cast<double>(bytes_done) / static_cast<double>(total_bytes);
    }
};

/**
 * @brief Counts completed work by listening to transfer events
 *
 * Every counter is an atomic updated from worker threads, so snapshot() can
 * be called from any thread while a run is in progress.
 *
 * USAGE:
 * ProgressAggregator progress(bus);
 * // run ...
 * auto snap = progress.snapshot();
 */
class ProgressAggregator {
public:
    explicit ProgressAggregator(events::EventBus& bus);
    ~ProgressAggregator();

    ProgressAggregator(const ProgressAggregator&) = delete;
    ProgressAggregator& operator=(const ProgressAggregator&) = delete;

    ProgressSnapshot snapshot() const;

    void reset();

    void print_stats() const;

private:
    struct Counters {
        std::atomic<uint64_t> total_files{0};
        std::atomic<uint64_t> total_bytes{0};
        std::atomic<uint64_t> files_done{0};
        std::atomic<uint64_t> bytes_done{0};
        std::atomic<uint64_t> files_skipped{0};
        std::atomic<uint64_t> nodes_failed{0};
        std::atomic<uint64_t> retries{0};
    };

    events::EventBus& bus_;
    Counters counters_;
    size_t plan_ready_ = 0;
    size_t chunk_transferred_ = 0;
    size_t chunk_retry_ = 0;
    size_t file_transferred_ = 0;
    size_t file_skipped_ = 0;
    size_t node_failed_ = 0;
};

} // namespace ddsync::sync
