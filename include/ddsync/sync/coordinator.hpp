#pragma once

#include "ddsync/core/config.hpp"
#include "ddsync/events/event_bus.hpp"
#include "ddsync/sync/plan.hpp"
#include "ddsync/sync/report.hpp"
#include "ddsync/sync/retry.hpp"
#include "ddsync/sync/task_queue.hpp"
#include "ddsync/sync/worker_pool.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace ddsync::sync {

enum class Stage {
    Container, ///< Create a remote folder/project, or a local directory
    Begin,     ///< Declare a file upload
    Chunk,     ///< Move one byte range
    Finish     ///< Finalize an upload, or verify and commit a download
};

/// What a worker hands back to the coordinator after running one task
struct TaskOutcome {
    Stage stage;
    size_t index;   ///< Operation index in the plan
    uint64_t chunk; ///< Chunk number for Stage::Chunk
    Result<std::string> result;
    uint32_t attempts;
};

/**
 * @brief Single-threaded coordinator in front of a worker pool
 *
 * The coordinator is the only place that enqueues tasks and the only writer
 * of the report. Workers run one network or disk step each and push a
 * TaskOutcome onto the results queue; the coordinator reacts by recording
 * the outcome and scheduling whatever became ready. In particular, the
 * children of a container are only scheduled after the container's own
 * task has succeeded.
 *
 * FAILURE SCOPE:
 * - container fails  -> every not-yet-started node below it is Cancelled
 * - file fails       -> the file's remaining chunks are cancelled
 * - Auth anywhere    -> the whole run is aborted
 */
class TransferCoordinator {
public:
    virtual ~TransferCoordinator();

    TransferCoordinator(const TransferCoordinator&) = delete;
    TransferCoordinator& operator=(const TransferCoordinator&) = delete;

    /// Executes the plan to completion; may only be called once
    TransferReport run();

protected:
    using TaskBody = std::function<Result<std::string>(uint32_t& attempts)>;

    struct FileProgress {
        uint64_t pending = 0;
        bool failed = false;
        std::shared_ptr<std::atomic<bool>> cancelled = std::make_shared<std::atomic<bool>>(false);
    };

    TransferCoordinator(const OperationPlan& plan, size_t workers, const RetrySettings& retry,
                        RetryPolicy::Sleeper sleeper, events::EventBus& bus);

    virtual void start() = 0;
    virtual void handle(TaskOutcome& outcome) = 0;

    /// Called after every task finished and the workers were joined
    virtual void finish() {}

    void dispatch(Stage stage, size_t index, uint64_t chunk, TaskBody body);

    /// Records the failure, cancels what depends on the node, aborts on Auth
    void fail(size_t index, const Error& error);

    void cancel_subtree(size_t index, const std::string& reason);

    void abort(const Error& cause);

    bool aborted() const { return abort_flag_.load(); }

    RetryPolicy::RetryObserver retry_observer(std::string what) const;

    const OperationPlan& plan_;
    const std::vector<std::vector<size_t>> children_;
    TransferReport report_;
    std::vector<FileProgress> files_;
    events::EventBus& bus_;
    RetryPolicy retry_;
    std::atomic<bool> abort_flag_{false};

private:
    BoundedQueue<TaskOutcome> results_;
    size_t outstanding_ = 0;
    bool ran_ = false;
    WorkerPool pool_;
};

} // namespace ddsync::sync
