#pragma once

#include "ddsync/core/config.hpp"
#include "ddsync/events/event_bus.hpp"
#include "ddsync/remote/service.hpp"
#include "ddsync/sync/plan.hpp"
#include "ddsync/sync/report.hpp"
#include "ddsync/sync/retry.hpp"
#include "ddsync/sync/session.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace ddsync::app {

struct UploadOptions {
    std::string project;
    std::vector<std::filesystem::path> paths;
    bool follow_symlinks = false;
    bool dry_run = false;
};

struct DownloadOptions {
    std::string project;
    std::filesystem::path destination;
    std::vector<std::string> include;
    std::vector<std::string> exclude;
};

struct SyncOutcome {
    sync::OperationPlan plan;
    sync::TransferReport report;
    sync::SessionInfo session;
    bool dry_run = false;
    bool verified = false; ///< Final state was checked against fingerprints

    /// No node failed and the final state was verified (or nothing ran)
    bool succeeded() const { return !report.has_failures() && (verified || dry_run); }
};

/**
 * @brief One-shot upload and download commands
 *
 * Each command walks the session phases: scan and fetch the two trees,
 * plan, transfer, verify. Problems found before transferring (bad input,
 * unreadable files, auth, unreachable service) come back as an error and
 * nothing is transferred. Once transfers start, failures are recorded per
 * node in the report instead.
 */
class SyncEngine {
public:
    SyncEngine(const Config& config, remote::RemoteService& service, events::EventBus& bus,
               sync::RetryPolicy::Sleeper sleeper = sync::RetryPolicy::real_sleeper());

    Result<SyncOutcome> upload(const UploadOptions& options);
    Result<SyncOutcome> download(const DownloadOptions& options);

private:
    /// Re-fetches the remote tree and checks every uploaded or unchanged file
    Result<void> verify_upload(const sync::OperationPlan& plan, sync::TransferReport& report);

    void announce_plan(const sync::OperationPlan& plan);
    void announce_finish(const sync::SyncSession& session, const sync::TransferReport& report);

    const Config& config_;
    remote::RemoteService& service_;
    events::EventBus& bus_;
    sync::RetryPolicy::Sleeper sleeper_;
};

} // namespace ddsync::app
