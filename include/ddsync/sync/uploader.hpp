#pragma once

#include "ddsync/core/config.hpp"
#include "ddsync/events/event_bus.hpp"
#include "ddsync/remote/service.hpp"
#include "ddsync/sync/plan.hpp"
#include "ddsync/sync/report.hpp"
#include "ddsync/sync/retry.hpp"

namespace ddsync::sync {

/**
 * @brief Executes an upload plan against the remote service
 *
 * Containers are created before anything inside them. Each file is declared,
 * its chunks are sent by upload_workers threads in any order, and the file is
 * finalized only after every chunk was acknowledged. A file that fails does
 * not stop its siblings.
 */
class UploadScheduler {
public:
    UploadScheduler(const Config& config, remote::RemoteService& service, events::EventBus& bus,
                    RetryPolicy::Sleeper sleeper = RetryPolicy::real_sleeper());

    /// Validation error when the plan is not an upload plan
    Result<TransferReport> run(const OperationPlan& plan);

private:
    const Config& config_;
    remote::RemoteService& service_;
    events::EventBus& bus_;
    RetryPolicy::Sleeper sleeper_;
};

} // namespace ddsync::sync
