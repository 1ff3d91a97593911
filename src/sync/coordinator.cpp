#include "ddsync/sync/coordinator.hpp"

#include "ddsync/events/events.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <stdexcept>

namespace ddsync::sync {

namespace {

Result<std::string> run_body(const std::function<Result<std::string>(uint32_t&)>& body, uint32_t& attempts) {
    try {
        return body(attempts);
    } catch (const std::exception& e) {
        return Err<std::string>(Error::service(0, std::string("unexpected failure: ") + e.what()));
    }
}

bool is_terminal(OutcomeStatus status) {
    switch (status) {
        case OutcomeStatus::Pending:
            return false;
        case OutcomeStatus::Planned:
        case OutcomeStatus::Succeeded:
        case OutcomeStatus::Skipped:
        case OutcomeStatus::Failed:
        case OutcomeStatus::Cancelled:
            return true;
    }
    return true;
}

} // namespace

TransferCoordinator::TransferCoordinator(const OperationPlan& plan, size_t workers, const RetrySettings& retry,
                                         RetryPolicy::Sleeper sleeper, events::EventBus& bus)
    : plan_(plan),
      children_(plan.children_index()),
      report_(plan),
      files_(plan.operations.size()),
      bus_(bus),
      retry_(retry, std::move(sleeper)),
      pool_(workers) {}

TransferCoordinator::~TransferCoordinator() {
    pool_.shutdown();
}

TransferReport TransferCoordinator::run() {
    if (ran_) {
        throw std::logic_error("transfer coordinator can only run once");
    }
    ran_ = true;

    const auto started = std::chrono::steady_clock::now();
    start();

    while (outstanding_ > 0) {
        auto outcome = results_.pop();
        if (!outcome) {
            break;
        }
        --outstanding_;
        handle(*outcome);
    }

    pool_.shutdown();
    finish();

    for (size_t i = 0; i < report_.size(); ++i) {
        auto& outcome = report_.at(i);
        if (outcome.status == OutcomeStatus::Pending) {
            outcome.status = OutcomeStatus::Cancelled;
            outcome.error = Error::cancelled(aborted() ? "run aborted" : "never scheduled");
        }
    }

    report_.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    return std::move(report_);
}

void TransferCoordinator::dispatch(Stage stage, size_t index, uint64_t chunk, TaskBody body) {
    ++outstanding_;
    const bool queued = pool_.submit([this, stage, index, chunk, body = std::move(body)]() {
        uint32_t attempts = 0;
        Result<std::string> result = run_body(body, attempts);
        results_.push(TaskOutcome{stage, index, chunk, std::move(result), attempts});
    });
    if (!queued) {
        results_.push(TaskOutcome{stage, index, chunk,
            Err<std::string>(Error::cancelled("worker pool stopped")), 0});
    }
}

void TransferCoordinator::fail(size_t index, const Error& error) {
    auto& outcome = report_.at(index);
    auto& file = files_.at(index);
    file.failed = true;
    file.cancelled->store(true);

    if (!is_terminal(outcome.status)) {
        outcome.status = error.kind == ErrorKind::Cancelled ? OutcomeStatus::Cancelled : OutcomeStatus::Failed;
        outcome.error = error;
        if (outcome.status == OutcomeStatus::Failed) {
            bus_.emit(events::NodeFailedEvent{outcome.path, outcome.node_kind, error});
        }
    }

    if (content::is_container(plan_.operations[index].node_kind)) {
        cancel_subtree(index, "parent '" + outcome.path + "' was not created");
    }
    if (error.kind == ErrorKind::Auth) {
        abort(error);
    }
}

void TransferCoordinator::cancel_subtree(size_t index, const std::string& reason) {
    for (size_t child : children_[index]) {
        auto& outcome = report_.at(child);
        files_[child].cancelled->store(true);
        if (outcome.status == OutcomeStatus::Pending) {
            outcome.status = OutcomeStatus::Cancelled;
            outcome.error = Error::cancelled(reason);
        }
        cancel_subtree(child, reason);
    }
}

void TransferCoordinator::abort(const Error& cause) {
    if (abort_flag_.exchange(true)) {
        return;
    }
    spdlog::error("Aborting run: {}", cause.describe());
    for (auto& file : files_) {
        file.cancelled->store(true);
    }
}

RetryPolicy::RetryObserver TransferCoordinator::retry_observer(std::string what) const {
    return [this, what = std::move(what)](uint32_t attempt, const Error& error, std::chrono::milliseconds delay) {
        bus_.emit(events::ChunkRetryEvent{what, attempt, error, delay});
    };
}

} // namespace ddsync::sync
