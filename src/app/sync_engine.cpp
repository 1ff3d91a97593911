#include "ddsync/app/sync_engine.hpp"

#include "ddsync/content/local_tree.hpp"
#include "ddsync/content/path_filter.hpp"
#include "ddsync/events/events.hpp"
#include "ddsync/remote/tree_fetcher.hpp"
#include "ddsync/sync/chunking.hpp"
#include "ddsync/sync/differ.hpp"
#include "ddsync/sync/downloader.hpp"
#include "ddsync/sync/uploader.hpp"

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace ddsync::app {

using content::NodeKind;
using content::NodePtr;
using sync::OperationKind;
using sync::OutcomeStatus;
using sync::SessionState;

namespace {

/// Records a pre-flight failure on the session and hands the error back
Result<SyncOutcome> abandon(sync::SyncSession& session, const Error& error) {
    auto failed = session.mark_failed(error.describe());
    if (failed.is_error()) {
        spdlog::debug("Session could not enter failed state: {}", failed.error().message);
    }
    return Err<SyncOutcome>(error);
}

/// Exclude regex that also hides partial files left behind by an interrupted download
std::string without_partial_files(const std::string& exclude_regex) {
    std::string partial;
    for (const char c : std::string(sync::kPartialSuffix)) {
        if (c == '.') {
            partial += '\\';
        }
        partial += c;
    }
    partial += '$';
    return exclude_regex.empty() ? partial : "(" + exclude_regex + ")|" + partial;
}

} // namespace

SyncEngine::SyncEngine(const Config& config, remote::RemoteService& service, events::EventBus& bus,
                       sync::RetryPolicy::Sleeper sleeper)
    : config_(config), service_(service), bus_(bus), sleeper_(std::move(sleeper)) {}

Result<SyncOutcome> SyncEngine::upload(const UploadOptions& options) {
    sync::SyncSession session(sync::Direction::Upload, options.project);
    if (options.project.empty()) {
        return abandon(session, Error::validation("project name must not be empty"));
    }
    bus_.emit(events::RunStartedEvent{sync::Direction::Upload, options.project});

    if (auto moved = session.transition_to(SessionState::Scanning); moved.is_error()) {
        return abandon(session, moved.error());
    }
    content::LocalTreeBuilder builder(config_, options.follow_symlinks);
    auto local = builder.build_from_paths(options.project, options.paths);
    if (local.is_error()) {
        return abandon(session, local.error());
    }

    if (auto moved = session.transition_to(SessionState::FetchingRemote); moved.is_error()) {
        return abandon(session, moved.error());
    }
    remote::RemoteTreeFetcher fetcher(service_);
    auto remote = fetcher.fetch(options.project);
    if (remote.is_error()) {
        return abandon(session, remote.error());
    }

    if (auto moved = session.transition_to(SessionState::Planning); moved.is_error()) {
        return abandon(session, moved.error());
    }
    sync::Differ differ(config_);
    auto plan = differ.plan_upload(*local.value(), remote.value().get());
    if (plan.is_error()) {
        return abandon(session, plan.error());
    }
    announce_plan(plan.value());

    SyncOutcome outcome;
    outcome.plan = std::move(plan.value());
    session.update_pending(outcome.plan.count(OperationKind::UploadFile), outcome.plan.transfer_bytes());

    if (options.dry_run) {
        outcome.dry_run = true;
        outcome.report = sync::TransferReport(outcome.plan);
        for (size_t i = 0; i < outcome.report.size(); ++i) {
            auto& node = outcome.report.at(i);
            node.status = node.operation == OperationKind::Skip ? OutcomeStatus::Skipped : OutcomeStatus::Planned;
        }
        if (auto moved = session.transition_to(SessionState::Complete); moved.is_error()) {
            return abandon(session, moved.error());
        }
        outcome.session = session.info();
        return Ok(std::move(outcome));
    }

    if (auto moved = session.transition_to(SessionState::Transferring); moved.is_error()) {
        return abandon(session, moved.error());
    }
    sync::UploadScheduler scheduler(config_, service_, bus_, sleeper_);
    auto report = scheduler.run(outcome.plan);
    if (report.is_error()) {
        return abandon(session, report.error());
    }
    outcome.report = std::move(report.value());

    if (auto moved = session.transition_to(SessionState::Verifying); moved.is_error()) {
        return abandon(session, moved.error());
    }
    auto verified = verify_upload(outcome.plan, outcome.report);
    if (verified.is_error()) {
        spdlog::error("Could not verify upload: {}", verified.error().describe());
    }
    outcome.verified = verified.is_ok();

    announce_finish(session, outcome.report);
    if (outcome.report.has_failures() || !outcome.verified) {
        auto failed = session.mark_failed(std::to_string(outcome.report.count(OutcomeStatus::Failed)) + " node(s) failed");
        if (failed.is_error()) {
            spdlog::debug("Session could not enter failed state: {}", failed.error().message);
        }
    } else if (auto moved = session.transition_to(SessionState::Complete); moved.is_error()) {
        return abandon(session, moved.error());
    }
    outcome.session = session.info();
    return Ok(std::move(outcome));
}

Result<void> SyncEngine::verify_upload(const sync::OperationPlan& plan, sync::TransferReport& report) {
    remote::RemoteTreeFetcher fetcher(service_);
    auto remote = fetcher.fetch(plan.project_name);
    if (remote.is_error()) {
        return Err<void>(remote.error());
    }
    if (!remote.value()) {
        return Err<void>(Error::not_found("project '" + plan.project_name + "' missing after upload"));
    }

    size_t checked = 0;
    for (size_t i = 0; i < plan.operations.size(); ++i) {
        const auto& op = plan.operations[i];
        auto& node = report.at(i);
        if (op.node_kind != NodeKind::File ||
            (node.status != OutcomeStatus::Succeeded && node.status != OutcomeStatus::Skipped)) {
            continue;
        }

        const content::ContentNode* found = remote.value()->find(op.path);
        const auto observed = found ? found->known_fingerprint() : std::nullopt;
        if (!found || found->kind() != NodeKind::File) {
            node.status = OutcomeStatus::Failed;
            node.error = Error::not_found("'" + op.display_path + "' is missing remotely after upload");
        } else if (!observed || !op.fingerprint || *observed != *op.fingerprint || found->size() != op.size) {
            node.status = OutcomeStatus::Failed;
            node.error = Error::integrity("remote copy of '" + op.display_path + "' does not match: expected " +
                (op.fingerprint ? op.fingerprint->to_string() : std::string("?")) + " (" + std::to_string(op.size) +
                " bytes), observed " + (observed ? observed->to_string() : std::string("none")) + " (" +
                std::to_string(found->size()) + " bytes)");
        } else {
            ++checked;
            continue;
        }
        bus_.emit(events::NodeFailedEvent{node.path, node.node_kind, *node.error});
    }
    spdlog::debug("Verified {} remote file(s)", checked);
    return Ok();
}

Result<SyncOutcome> SyncEngine::download(const DownloadOptions& options) {
    sync::SyncSession session(sync::Direction::Download, options.project);
    if (options.project.empty()) {
        return abandon(session, Error::validation("project name must not be empty"));
    }
    bus_.emit(events::RunStartedEvent{sync::Direction::Download, options.project});

    auto filter = content::PathFilter::create(options.include, options.exclude);
    if (filter.is_error()) {
        return abandon(session, filter.error());
    }

    const fs::path destination = options.destination.empty()
        ? fs::current_path() / options.project
        : options.destination;
    std::error_code ec;
    const bool exists = fs::exists(destination, ec);
    if (exists && !fs::is_directory(destination, ec)) {
        return abandon(session, Error::validation(destination.string() + " exists and is not a directory"));
    }

    if (auto moved = session.transition_to(SessionState::FetchingRemote); moved.is_error()) {
        return abandon(session, moved.error());
    }
    remote::RemoteTreeFetcher fetcher(service_);
    auto remote = fetcher.fetch(options.project);
    if (remote.is_error()) {
        return abandon(session, remote.error());
    }
    if (!remote.value()) {
        return abandon(session, Error::not_found("project '" + options.project + "' does not exist"));
    }

    if (auto moved = session.transition_to(SessionState::Scanning); moved.is_error()) {
        return abandon(session, moved.error());
    }
    NodePtr local;
    if (exists) {
        // Stale partial files are overwritten when their file is fetched again
        Config scan_config = config_;
        scan_config.file_exclude_regex = without_partial_files(config_.file_exclude_regex);
        content::LocalTreeBuilder builder(scan_config, false);
        auto scanned = builder.build(options.project, destination);
        if (scanned.is_error()) {
            return abandon(session, scanned.error());
        }
        local = std::move(scanned.value());
    }

    if (auto moved = session.transition_to(SessionState::Planning); moved.is_error()) {
        return abandon(session, moved.error());
    }
    sync::Differ differ(config_);
    auto plan = differ.plan_download(*remote.value(), local.get(), destination, &filter.value());
    if (plan.is_error()) {
        return abandon(session, plan.error());
    }
    announce_plan(plan.value());

    SyncOutcome outcome;
    outcome.plan = std::move(plan.value());
    session.update_pending(outcome.plan.count(OperationKind::FetchFile), outcome.plan.transfer_bytes());

    if (auto moved = session.transition_to(SessionState::Transferring); moved.is_error()) {
        return abandon(session, moved.error());
    }
    sync::DownloadScheduler scheduler(config_, service_, bus_, sleeper_);
    auto report = scheduler.run(outcome.plan);
    if (report.is_error()) {
        return abandon(session, report.error());
    }
    outcome.report = std::move(report.value());

    // Every fetched file was hashed and compared before it was moved into place
    if (auto moved = session.transition_to(SessionState::Verifying); moved.is_error()) {
        return abandon(session, moved.error());
    }
    outcome.verified = true;

    announce_finish(session, outcome.report);
    if (outcome.report.has_failures()) {
        auto failed = session.mark_failed(std::to_string(outcome.report.count(OutcomeStatus::Failed)) + " node(s) failed");
        if (failed.is_error()) {
            spdlog::debug("Session could not enter failed state: {}", failed.error().message);
        }
    } else if (auto moved = session.transition_to(SessionState::Complete); moved.is_error()) {
        return abandon(session, moved.error());
    }
    outcome.session = session.info();
    return Ok(std::move(outcome));
}

void SyncEngine::announce_plan(const sync::OperationPlan& plan) {
    events::PlanReadyEvent event{plan.direction, plan.project_name};
    event.operations = plan.operations.size();
    for (const auto& op : plan.operations) {
        switch (op.kind) {
            case OperationKind::CreateContainer:
            case OperationKind::FetchContainer:
                ++event.containers;
                break;
            case OperationKind::UploadFile:
            case OperationKind::FetchFile:
                ++event.transfer_files;
                event.transfer_bytes += op.size;
                break;
            case OperationKind::Skip:
                if (op.node_kind == NodeKind::File) {
                    ++event.skipped_files;
                }
                break;
        }
    }
    bus_.emit(event);
}

void SyncEngine::announce_finish(const sync::SyncSession& session, const sync::TransferReport& report) {
    events::RunFinishedEvent event{session.direction(), session.project()};
    event.succeeded = report.count(OutcomeStatus::Succeeded);
    event.skipped = report.count(OutcomeStatus::Skipped);
    event.failed = report.count(OutcomeStatus::Failed);
    event.cancelled = report.count(OutcomeStatus::Cancelled);
    event.bytes = report.bytes_transferred();
    event.duration = report.duration;
    bus_.emit(event);
}

} // namespace ddsync::app
