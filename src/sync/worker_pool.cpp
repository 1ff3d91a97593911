#include "ddsync/sync/worker_pool.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace ddsync::sync {

WorkerPool::WorkerPool(size_t workers, size_t capacity)
    : tasks_(capacity == 0 ? std::max<size_t>(workers, 1) * 2 : capacity) {
    const size_t count = std::max<size_t>(workers, 1);
    threads_.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        threads_.emplace_back([this]() { worker_loop(); });
    }
    spdlog::debug("Worker pool started: {} worker(s), queue capacity {}", count, tasks_.capacity());
}

WorkerPool::~WorkerPool() {
    shutdown();
}

bool WorkerPool::submit(Task task) {
    return tasks_.push(std::move(task));
}

void WorkerPool::shutdown() {
    tasks_.close();
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

void WorkerPool::worker_loop() {
    while (auto task = tasks_.pop()) {
        try {
            (*task)();
        } catch (const std::exception& e) {
            spdlog::error("Transfer task threw: {}", e.what());
        }
        completed_++;
    }
}

} // namespace ddsync::sync
