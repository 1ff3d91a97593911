/**
 * @file events.hpp
 * @brief Milestones published while a sync run executes
 *
 * Events are plain value types so they can be copied into handlers on any
 * worker thread. Paths are project-relative ("docs/a.txt"), with "/" for
 * the project itself.
 *
 * FLOW FOR ONE RUN:
 *   RunStartedEvent
 *   PlanReadyEvent
 *   ContainerReadyEvent*        (before anything inside the container)
 *   ChunkTransferredEvent* / ChunkRetryEvent*
 *   FileTransferredEvent* / FileSkippedEvent* / NodeFailedEvent*
 *   RunFinishedEvent
 */

#pragma once

#include "ddsync/content/node.hpp"
#include "ddsync/core/error.hpp"
#include "ddsync/sync/types.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace ddsync::events {

struct RunStartedEvent {
    sync::Direction direction;
    std::string project;
};

struct PlanReadyEvent {
    sync::Direction direction;
    std::string project;
    uint64_t operations = 0;
    uint64_t containers = 0;     ///< Containers that must be created
    uint64_t transfer_files = 0; ///< Files whose bytes move
    uint64_t skipped_files = 0;
    uint64_t transfer_bytes = 0;
};

struct ContainerReadyEvent {
    std::string path;
    std::string remote_id; ///< Empty for local directories created by a download
};

struct ChunkTransferredEvent {
    std::string path;
    uint64_t chunk = 0;
    uint64_t chunk_count = 0;
    uint64_t bytes = 0;
    uint32_t attempts = 1;
};

struct ChunkRetryEvent {
    std::string what; ///< e.g. "upload chunk 3 of docs/a.txt"
    uint32_t attempt = 1;
    Error error;
    std::chrono::milliseconds delay{0};
};

struct FileTransferredEvent {
    sync::Direction direction;
    std::string path;
    uint64_t bytes = 0;
    std::string fingerprint;
};

struct FileSkippedEvent {
    std::string path;
    uint64_t bytes = 0;
};

struct NodeFailedEvent {
    std::string path;
    content::NodeKind kind;
    Error error;
};

struct RunFinishedEvent {
    sync::Direction direction;
    std::string project;
    uint64_t succeeded = 0;
    uint64_t skipped = 0;
    uint64_t failed = 0;
    uint64_t cancelled = 0;
    uint64_t bytes = 0;
    std::chrono::milliseconds duration{0};
};

} // namespace ddsync::events
