#pragma once

#include "ddsync/sync/task_queue.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <thread>
#include <vector>

namespace ddsync::sync {

/**
 * @brief Fixed set of threads draining a bounded task queue
 *
 * submit() blocks while the queue is full, which keeps the number of
 * buffered chunks (and their memory) bounded. A task that throws is logged
 * and the worker moves on; tasks are expected to report their own outcome.
 */
class WorkerPool {
public:
    using Task = std::function<void()>;

    /// capacity 0 selects twice the worker count
    explicit WorkerPool(size_t workers, size_t capacity = 0);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /// false once the pool is shutting down
    bool submit(Task task);

    /// Stops accepting tasks, runs what is queued, joins the workers
    void shutdown();

    size_t worker_count() const { return threads_.size(); }
    size_t queue_capacity() const { return tasks_.capacity(); }
    uint64_t completed() const { return completed_.load(); }

private:
    void worker_loop();

    BoundedQueue<Task> tasks_;
    std::vector<std::thread> threads_;
    std::atomic<uint64_t> completed_{0};
};

} // namespace ddsync::sync
