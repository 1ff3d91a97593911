#include "ddsync/sync/downloader.hpp"

#include "ddsync/events/events.hpp"
#include "ddsync/sync/chunking.hpp"
#include "ddsync/sync/coordinator.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <memory>

namespace fs = std::filesystem;

namespace ddsync::sync {

namespace {

class DownloadRun : public TransferCoordinator {
public:
    DownloadRun(const Config& config, remote::RemoteService& service, const OperationPlan& plan,
                events::EventBus& bus, RetryPolicy::Sleeper sleeper)
        : TransferCoordinator(plan, config.download_workers, config.retry, std::move(sleeper), bus),
          config_(config),
          service_(service),
          destinations_(plan.operations.size()) {}

protected:
    void start() override {
        const auto& root = plan_.operations.front();
        switch (root.kind) {
            case OperationKind::FetchContainer:
                make_directory(0);
                break;
            case OperationKind::Skip:
                report_.at(0).status = OutcomeStatus::Skipped;
                schedule_children(0);
                break;
            case OperationKind::CreateContainer:
            case OperationKind::UploadFile:
            case OperationKind::FetchFile:
                fail(0, Error::validation("project root cannot be a " + std::string(to_string(root.kind)) + " operation"));
                break;
        }
    }

    void handle(TaskOutcome& outcome) override {
        switch (outcome.stage) {
            case Stage::Container: on_directory(outcome); break;
            case Stage::Chunk: on_range(outcome); break;
            case Stage::Finish: on_verified(outcome); break;
            case Stage::Begin:
                fail(outcome.index, Error::validation("unexpected begin stage in a download"));
                break;
        }
    }

    void finish() override {
        for (auto& destination : destinations_) {
            if (destination) {
                destination->discard();
                destination.reset();
            }
        }
    }

private:
    void schedule_children(size_t index) {
        for (size_t child : children_[index]) {
            if (aborted()) {
                cancel_subtree(index, "run aborted");
                return;
            }

            const auto& op = plan_.operations[child];
            switch (op.kind) {
                case OperationKind::FetchContainer:
                    make_directory(child);
                    break;

                case OperationKind::Skip:
                    report_.at(child).status = OutcomeStatus::Skipped;
                    if (content::is_container(op.node_kind)) {
                        schedule_children(child);
                    } else {
                        bus_.emit(events::FileSkippedEvent{op.display_path, op.size});
                    }
                    break;

                case OperationKind::FetchFile:
                    open_file(child);
                    break;

                case OperationKind::CreateContainer:
                case OperationKind::UploadFile:
                    fail(child, Error::validation(std::string(to_string(op.kind)) + " in a download plan"));
                    break;
            }
        }
    }

    void make_directory(size_t index) {
        const auto& op = plan_.operations[index];
        if (!op.local_path) {
            fail(index, Error::validation("folder '" + op.display_path + "' has no destination"));
            return;
        }

        dispatch(Stage::Container, index, 0, [target = *op.local_path](uint32_t& attempts) -> Result<std::string> {
            attempts = 1;
            std::error_code ec;
            fs::create_directory(target, ec);
            if (ec || !fs::is_directory(target, ec)) {
                return Err<std::string>(Error::filesystem(
                    "cannot create directory " + target.string() + (ec ? ": " + ec.message() : std::string())));
            }
            return Ok(std::string());
        });
    }

    void open_file(size_t index) {
        const auto& op = plan_.operations[index];
        if (!op.local_path || !op.remote_id || !op.fingerprint) {
            fail(index, Error::validation("file '" + op.display_path + "' lacks a destination, id or fingerprint"));
            return;
        }

        auto opened = DestinationFile::open(*op.local_path, op.size);
        if (opened.is_error()) {
            fail(index, opened.error());
            return;
        }
        destinations_[index] = std::make_shared<DestinationFile>(std::move(opened.value()));
        report_.at(index).chunk_attempts.assign(op.chunk_count, 0);

        if (op.chunk_count == 0) {
            verify(index);
            return;
        }

        auto& file = files_[index];
        file.pending = op.chunk_count;
        for (uint64_t number = 0; number < op.chunk_count; ++number) {
            const ChunkSpan span = chunk_span(op.size, config_.download_bytes_per_chunk, number);
            const std::string what = "fetch chunk " + std::to_string(number) + " of " + op.display_path;

            dispatch(Stage::Chunk, index, number,
                [this, destination = destinations_[index], file_id = *op.remote_id, span, what,
                 cancelled = file.cancelled](uint32_t& attempts) -> Result<std::string> {
                    auto data = retry_.run(what, [&]() -> Result<std::vector<uint8_t>> {
                        auto fetched = service_.fetch_range(file_id, span.offset, span.length);
                        if (fetched.is_ok() && fetched.value().size() != span.length) {
                            return Err<std::vector<uint8_t>>(Error::network(
                                "expected " + std::to_string(span.length) + " bytes, received " +
                                std::to_string(fetched.value().size())));
                        }
                        return fetched;
                    }, &attempts, cancelled.get(), retry_observer(what));
                    if (data.is_error()) {
                        return Err<std::string>(data.error());
                    }

                    auto written = destination->write_at(span.offset, data.value());
                    if (written.is_error()) {
                        return Err<std::string>(written.error());
                    }
                    return Ok(std::string());
                });
        }
    }

    void verify(size_t index) {
        const auto& op = plan_.operations[index];
        dispatch(Stage::Finish, index, 0,
            [destination = destinations_[index], expected = *op.fingerprint, size = op.size,
             path = op.display_path](uint32_t& attempts) -> Result<std::string> {
                attempts = 1;
                auto observed = destination->fingerprint();
                if (observed.is_error()) {
                    return Err<std::string>(observed.error());
                }
                if (observed.value() != expected || destination->size() != size) {
                    return Err<std::string>(Error::integrity(
                        "downloaded '" + path + "' does not match: expected " + expected.to_string() +
                        " (" + std::to_string(size) + " bytes), observed " + observed.value().to_string() +
                        " (" + std::to_string(destination->size()) + " bytes)"));
                }
                return Ok(observed.value().to_string());
            });
    }

    void on_directory(TaskOutcome& outcome) {
        if (outcome.result.is_error()) {
            fail(outcome.index, outcome.result.error());
            return;
        }

        const auto& op = plan_.operations[outcome.index];
        report_.at(outcome.index).status = OutcomeStatus::Succeeded;
        bus_.emit(events::ContainerReadyEvent{op.display_path, std::string()});
        schedule_children(outcome.index);
    }

    void on_range(TaskOutcome& outcome) {
        const auto& op = plan_.operations[outcome.index];
        auto& file = files_[outcome.index];
        auto& node = report_.at(outcome.index);
        if (file.pending > 0) {
            --file.pending;
        }
        if (outcome.chunk < node.chunk_attempts.size()) {
            node.chunk_attempts[outcome.chunk] = outcome.attempts;
        }

        if (outcome.result.is_error()) {
            if (!file.failed) {
                fail(outcome.index, outcome.result.error());
            }
        } else {
            const uint64_t bytes = chunk_span(op.size, config_.download_bytes_per_chunk, outcome.chunk).length;
            node.bytes += bytes;
            bus_.emit(events::ChunkTransferredEvent{op.display_path, outcome.chunk, op.chunk_count, bytes, outcome.attempts});
        }

        if (file.pending > 0) {
            return;
        }
        if (file.failed) {
            release(outcome.index);
        } else {
            verify(outcome.index);
        }
    }

    void on_verified(TaskOutcome& outcome) {
        const auto& op = plan_.operations[outcome.index];
        if (outcome.result.is_ok()) {
            auto committed = destinations_[outcome.index]->commit();
            if (committed.is_ok()) {
                report_.at(outcome.index).status = OutcomeStatus::Succeeded;
                bus_.emit(events::FileTransferredEvent{Direction::Download, op.display_path, op.size,
                                                       outcome.result.value()});
                destinations_[outcome.index].reset();
                return;
            }
            fail(outcome.index, committed.error());
        } else {
            fail(outcome.index, outcome.result.error());
        }
        release(outcome.index);
    }

    /// Drops a failed file's partial data once no worker still writes to it
    void release(size_t index) {
        if (destinations_[index]) {
            destinations_[index]->discard();
            destinations_[index].reset();
        }
    }

    const Config& config_;
    remote::RemoteService& service_;
    std::vector<std::shared_ptr<DestinationFile>> destinations_;
};

} // namespace

DownloadScheduler::DownloadScheduler(const Config& config, remote::RemoteService& service, events::EventBus& bus,
                                     RetryPolicy::Sleeper sleeper)
    : config_(config), service_(service), bus_(bus), sleeper_(std::move(sleeper)) {}

Result<TransferReport> DownloadScheduler::run(const OperationPlan& plan) {
    if (plan.direction != Direction::Download) {
        return Err<TransferReport>(Error::validation("not a download plan"));
    }
    if (plan.operations.empty()) {
        return Err<TransferReport>(Error::validation("download plan is empty"));
    }
    if (config_.download_bytes_per_chunk == 0) {
        return Err<TransferReport>(Error::validation("download_bytes_per_chunk must be positive"));
    }

    spdlog::debug("Downloading '{}' with {} worker(s), {} byte ranges",
        plan.project_name, config_.download_workers, config_.download_bytes_per_chunk);

    DownloadRun run(config_, service_, plan, bus_, sleeper_);
    return Ok(run.run());
}

} // namespace ddsync::sync
