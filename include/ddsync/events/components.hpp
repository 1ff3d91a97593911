/**
 * @file components.hpp
 * @brief Event subscribers that turn run milestones into log lines
 */

#pragma once

#include "ddsync/events/event_bus.hpp"
#include "ddsync/events/events.hpp"

#include <spdlog/spdlog.h>

#include <vector>

namespace ddsync::events {

/**
 * @brief Logs every run milestone through spdlog
 *
 * Per-chunk events go to debug, file outcomes to info, retries to warn and
 * failures to error.
 *
 * USAGE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        run_started_ = bus_.subscribe<RunStartedEvent>([](const RunStartedEvent& e) {
            spdlog::info("Starting {} for project '{}'", sync::to_string(e.direction), e.project);
        });

        plan_ready_ = bus_.subscribe<PlanReadyEvent>([](const PlanReadyEvent& e) {
            spdlog::info("Plan: {} operation(s), {} container(s) to create, {} file(s) to transfer ({} bytes), {} unchanged",
                e.operations, e.containers, e.transfer_files, e.transfer_bytes, e.skipped_files);
        });

        container_ready_ = bus_.subscribe<ContainerReadyEvent>([](const ContainerReadyEvent& e) {
            if (e.remote_id.empty()) {
                spdlog::debug("[Container] {}", e.path);
            } else {
                spdlog::debug("[Container] {} id={}", e.path, e.remote_id);
            }
        });

        chunk_transferred_ = bus_.subscribe<ChunkTransferredEvent>([](const ChunkTransferredEvent& e) {
            spdlog::debug("[Chunk] {} {}/{} bytes={} attempts={}",
                e.path, e.chunk + 1, e.chunk_count, e.bytes, e.attempts);
        });

        chunk_retry_ = bus_.subscribe<ChunkRetryEvent>([](const ChunkRetryEvent& e) {
            spdlog::warn("[Retry] {} attempt {} failed ({}), retrying in {}ms",
                e.what, e.attempt, e.error.describe(), e.delay.count());
        });

        file_transferred_ = bus_.subscribe<FileTransferredEvent>([](const FileTransferredEvent& e) {
            spdlog::info("[{}] {} bytes={} hash={}",
                e.direction == sync::Direction::Upload ? "Uploaded" : "Downloaded",
                e.path, e.bytes, e.fingerprint);
        });

        file_skipped_ = bus_.subscribe<FileSkippedEvent>([](const FileSkippedEvent& e) {
            spdlog::debug("[Unchanged] {} bytes={}", e.path, e.bytes);
        });

        node_failed_ = bus_.subscribe<NodeFailedEvent>([](const NodeFailedEvent& e) {
            spdlog::error("[Failed] {} {}: {}", content::to_string(e.kind), e.path, e.error.describe());
        });

        run_finished_ = bus_.subscribe<RunFinishedEvent>([](const RunFinishedEvent& e) {
            spdlog::info("Finished {} for '{}' in {}ms: {} succeeded, {} unchanged, {} failed, {} cancelled, {} bytes",
                sync::to_string(e.direction), e.project, e.duration.count(),
                e.succeeded, e.skipped, e.failed, e.cancelled, e.bytes);
        });
    }

    ~LoggerComponent() {
        bus_.unsubscribe<RunStartedEvent>(run_started_);
        bus_.unsubscribe<PlanReadyEvent>(plan_ready_);
        bus_.unsubscribe<ContainerReadyEvent>(container_ready_);
        bus_.unsubscribe<ChunkTransferredEvent>(chunk_transferred_);
        bus_.unsubscribe<ChunkRetryEvent>(chunk_retry_);
        bus_.unsubscribe<FileTransferredEvent>(file_transferred_);
        bus_.unsubscribe<FileSkippedEvent>(file_skipped_);
        bus_.unsubscribe<NodeFailedEvent>(node_failed_);
        bus_.unsubscribe<RunFinishedEvent>(run_finished_);
    }

    LoggerComponent(const LoggerComponent&) = delete;
    LoggerComponent& operator=(const LoggerComponent&) = delete;

private:
    EventBus& bus_;
    size_t run_started_ = 0;
    size_t plan_ready_ = 0;
    size_t container_ready_ = 0;
    size_t chunk_transferred_ = 0;
    size_t chunk_retry_ = 0;
    size_t file_transferred_ = 0;
    size_t file_skipped_ = 0;
    size_t node_failed_ = 0;
    size_t run_finished_ = 0;
};

} // namespace ddsync::events
