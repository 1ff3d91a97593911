#include "ddsync/sync/uploader.hpp"

#include "ddsync/events/events.hpp"
#include "ddsync/sync/chunking.hpp"
#include "ddsync/sync/coordinator.hpp"

#include <spdlog/spdlog.h>

#include <optional>

namespace ddsync::sync {

using content::NodeKind;
using remote::ParentRef;

namespace {

class UploadRun : public TransferCoordinator {
public:
    UploadRun(const Config& config, remote::RemoteService& service, const OperationPlan& plan,
              events::EventBus& bus, RetryPolicy::Sleeper sleeper)
        : TransferCoordinator(plan, config.upload_workers, config.retry, std::move(sleeper), bus),
          config_(config),
          service_(service),
          remote_ids_(plan.operations.size()),
          upload_ids_(plan.operations.size()) {}

protected:
    void start() override {
        const auto& root = plan_.operations.front();
        switch (root.kind) {
            case OperationKind::CreateContainer:
                create_container(0);
                break;
            case OperationKind::Skip:
                if (!root.remote_id) {
                    fail(0, Error::validation("existing project has no remote id"));
                    return;
                }
                remote_ids_[0] = root.remote_id;
                report_.at(0).status = OutcomeStatus::Skipped;
                schedule_children(0);
                break;
            case OperationKind::UploadFile:
            case OperationKind::FetchContainer:
            case OperationKind::FetchFile:
                fail(0, Error::validation("project root cannot be a " + std::string(to_string(root.kind)) + " operation"));
                break;
        }
    }

    void handle(TaskOutcome& outcome) override {
        switch (outcome.stage) {
            case Stage::Container: on_container(outcome); break;
            case Stage::Begin: on_begin(outcome); break;
            case Stage::Chunk: on_chunk(outcome); break;
            case Stage::Finish: on_finish(outcome); break;
        }
    }

private:
    ParentRef parent_ref(size_t index) const {
        const auto& parent = plan_.operations[index];
        return ParentRef{parent.node_kind, remote_ids_[index].value_or(std::string())};
    }

    void schedule_children(size_t index) {
        for (size_t child : children_[index]) {
            if (aborted()) {
                cancel_subtree(index, "run aborted");
                return;
            }

            const auto& op = plan_.operations[child];
            switch (op.kind) {
                case OperationKind::CreateContainer:
                    create_container(child);
                    break;

                case OperationKind::Skip:
                    if (content::is_container(op.node_kind)) {
                        if (!op.remote_id) {
                            fail(child, Error::validation("existing folder '" + op.display_path + "' has no remote id"));
                            break;
                        }
                        remote_ids_[child] = op.remote_id;
                        report_.at(child).status = OutcomeStatus::Skipped;
                        schedule_children(child);
                    } else {
                        report_.at(child).status = OutcomeStatus::Skipped;
                        bus_.emit(events::FileSkippedEvent{op.display_path, op.size});
                    }
                    break;

                case OperationKind::UploadFile:
                    begin_upload(child);
                    break;

                case OperationKind::FetchContainer:
                case OperationKind::FetchFile:
                    fail(child, Error::validation(std::string(to_string(op.kind)) + " in an upload plan"));
                    break;
            }
        }
    }

    void create_container(size_t index) {
        const auto& op = plan_.operations[index];
        const bool is_project = op.node_kind == NodeKind::Project;
        const std::optional<ParentRef> parent = is_project ? std::nullopt : std::optional<ParentRef>(parent_ref(op.parent));
        const std::string name = is_project ? plan_.project_name : op.name;
        const std::string what = "create " + std::string(content::to_string(op.node_kind)) + " " + op.display_path;

        dispatch(Stage::Container, index, 0, [this, parent, name, what](uint32_t& attempts) {
            return retry_.run(what, [&]() {
                return parent ? service_.create_folder(*parent, name) : service_.create_project(name);
            }, &attempts, &abort_flag_, retry_observer(what));
        });
    }

    void begin_upload(size_t index) {
        const auto& op = plan_.operations[index];
        if (!op.fingerprint || !op.local_path) {
            fail(index, Error::validation("upload of '" + op.display_path + "' lacks a fingerprint or source"));
            return;
        }

        remote::UploadRequest request;
        request.project_id = remote_ids_[0].value_or(std::string());
        request.parent = parent_ref(op.parent);
        request.name = op.name;
        request.size = op.size;
        request.chunk_count = op.chunk_count;
        request.fingerprint = *op.fingerprint;

        report_.at(index).chunk_attempts.assign(op.chunk_count, 0);
        const std::string what = "begin upload of " + op.display_path;

        dispatch(Stage::Begin, index, 0, [this, request, what](uint32_t& attempts) {
            return retry_.run(what, [&]() { return service_.initiate_upload(request); },
                              &attempts, &abort_flag_, retry_observer(what));
        });
    }

    void send_chunks(size_t index) {
        const auto& op = plan_.operations[index];
        auto& file = files_[index];
        file.pending = op.chunk_count;

        for (uint64_t number = 0; number < op.chunk_count; ++number) {
            const ChunkSpan span = chunk_span(op.size, config_.upload_bytes_per_chunk, number);
            const std::string what = "upload chunk " + std::to_string(number) + " of " + op.display_path;

            dispatch(Stage::Chunk, index, number,
                [this, upload_id = upload_ids_[index], source = *op.local_path, span, number, what,
                 cancelled = file.cancelled](uint32_t& attempts) -> Result<std::string> {
                    if (cancelled->load()) {
                        return Err<std::string>(Error::cancelled(what + " cancelled"));
                    }
                    auto data = read_chunk(source, span);
                    if (data.is_error()) {
                        return Err<std::string>(data.error());
                    }
                    const auto chunk_fingerprint = content::fingerprint_bytes(data.value());

                    auto sent = retry_.run(what, [&]() {
                        return service_.upload_chunk(upload_id, number, data.value(), chunk_fingerprint);
                    }, &attempts, cancelled.get(), retry_observer(what));
                    if (sent.is_error()) {
                        return Err<std::string>(sent.error());
                    }
                    return Ok(std::string());
                });
        }
    }

    void finalize(size_t index) {
        const auto& op = plan_.operations[index];
        const std::string what = "finalize " + op.display_path;

        dispatch(Stage::Finish, index, 0,
            [this, upload_id = upload_ids_[index], parent = parent_ref(op.parent), fingerprint = *op.fingerprint,
             replaces = op.remote_id, what](uint32_t& attempts) {
                return retry_.run(what, [&]() {
                    return service_.finalize_upload(upload_id, parent, fingerprint, replaces);
                }, &attempts, &abort_flag_, retry_observer(what));
            });
    }

    void on_container(TaskOutcome& outcome) {
        if (outcome.result.is_error()) {
            fail(outcome.index, outcome.result.error());
            return;
        }

        const auto& op = plan_.operations[outcome.index];
        remote_ids_[outcome.index] = outcome.result.value();
        auto& node = report_.at(outcome.index);
        node.status = OutcomeStatus::Succeeded;
        node.remote_id = outcome.result.value();
        bus_.emit(events::ContainerReadyEvent{op.display_path, outcome.result.value()});

        schedule_children(outcome.index);
    }

    void on_begin(TaskOutcome& outcome) {
        if (outcome.result.is_error()) {
            fail(outcome.index, outcome.result.error());
            return;
        }
        if (files_[outcome.index].cancelled->load()) {
            fail(outcome.index, Error::cancelled("run aborted"));
            return;
        }

        upload_ids_[outcome.index] = outcome.result.value();
        if (plan_.operations[outcome.index].chunk_count == 0) {
            finalize(outcome.index);
        } else {
            send_chunks(outcome.index);
        }
    }

    void on_chunk(TaskOutcome& outcome) {
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
            return;
        }

        const uint64_t bytes = chunk_span(op.size, config_.upload_bytes_per_chunk, outcome.chunk).length;
        node.bytes += bytes;
        bus_.emit(events::ChunkTransferredEvent{op.display_path, outcome.chunk, op.chunk_count, bytes, outcome.attempts});

        if (file.pending == 0 && !file.failed) {
            finalize(outcome.index);
        }
    }

    void on_finish(TaskOutcome& outcome) {
        if (outcome.result.is_error()) {
            fail(outcome.index, outcome.result.error());
            return;
        }

        const auto& op = plan_.operations[outcome.index];
        auto& node = report_.at(outcome.index);
        node.status = OutcomeStatus::Succeeded;
        node.remote_id = outcome.result.value();
        bus_.emit(events::FileTransferredEvent{Direction::Upload, op.display_path, op.size,
                                               op.fingerprint ? op.fingerprint->to_string() : std::string()});
    }

    const Config& config_;
    remote::RemoteService& service_;
    std::vector<std::optional<std::string>> remote_ids_;
    std::vector<std::string> upload_ids_;
};

} // namespace

UploadScheduler::UploadScheduler(const Config& config, remote::RemoteService& service, events::EventBus& bus,
                                 RetryPolicy::Sleeper sleeper)
    : config_(config), service_(service), bus_(bus), sleeper_(std::move(sleeper)) {}

Result<TransferReport> UploadScheduler::run(const OperationPlan& plan) {
    if (plan.direction != Direction::Upload) {
        return Err<TransferReport>(Error::validation("not an upload plan"));
    }
    if (plan.operations.empty()) {
        return Err<TransferReport>(Error::validation("upload plan is empty"));
    }
    if (config_.upload_bytes_per_chunk == 0) {
        return Err<TransferReport>(Error::validation("upload_bytes_per_chunk must be positive"));
    }

    spdlog::debug("Uploading '{}' with {} worker(s), {} byte chunks",
        plan.project_name, config_.upload_workers, config_.upload_bytes_per_chunk);

    UploadRun run(config_, service_, plan, bus_, sleeper_);
    return Ok(run.run());
}

} // namespace ddsync::sync
