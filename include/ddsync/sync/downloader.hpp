#pragma once

#include "ddsync/core/config.hpp"
#include "ddsync/events/event_bus.hpp"
#include "ddsync/remote/service.hpp"
#include "ddsync/sync/plan.hpp"
#include "ddsync/sync/report.hpp"
#include "ddsync/sync/retry.hpp"

namespace ddsync::sync {

/**
 * @brief Executes a download plan into the local filesystem
 *
 * Directories are created before any file inside them. Each file is opened
 * once as a partial file, filled by download_workers threads fetching
 * disjoint ranges, then hashed and compared with the remote fingerprint.
 * Only a matching file is renamed into place; a mismatch is an Integrity
 * failure and the partial file is removed.
 */
class DownloadScheduler {
public:
    DownloadScheduler(const Config& config, remote::RemoteService& service, events::EventBus& bus,
                      RetryPolicy::Sleeper sleeper = RetryPolicy::real_sleeper());

    Result<TransferReport> run(const OperationPlan& plan);

private:
    const Config& config_;
    remote::RemoteService& service_;
    events::EventBus& bus_;
    RetryPolicy::Sleeper sleeper_;
};

} // namespace ddsync::sync
