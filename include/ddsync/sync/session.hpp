#pragma once

#include "ddsync/core/result.hpp"
#include "ddsync/sync/types.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace ddsync::sync {

enum class SessionState {
    Idle,
    Scanning,       ///< Building the local tree
    FetchingRemote, ///< Building the remote tree
    Planning,
    Transferring,
    Verifying,
    Complete,
    Failed
};

const char* to_string(SessionState state) noexcept;

struct SessionInfo {
    Direction direction = Direction::Upload;
    std::string project;
    SessionState state = SessionState::Idle;
    std::chrono::system_clock::time_point started_at{};
    uint64_t files_pending = 0;
    uint64_t bytes_pending = 0;
    std::string last_error;
};

/**
 * @brief Phase tracker for one upload or download command
 *
 * Phases only move forward. Failed is reachable from every phase that is not
 * already terminal; Complete and Failed accept nothing afterwards.
 */
class SyncSession {
public:
    SyncSession(Direction direction, std::string project);

    [[nodiscard]] Direction direction() const noexcept { return info_.direction; }
    [[nodiscard]] const std::string& project() const noexcept { return info_.project; }
    [[nodiscard]] SessionState state() const noexcept { return info_.state; }
    [[nodiscard]] const SessionInfo& info() const noexcept { return info_; }

    Result<void> transition_to(SessionState next_state);
    Result<void> mark_failed(std::string error_message);

    void update_pending(uint64_t files_pending, uint64_t bytes_pending);

    [[nodiscard]] std::chrono::system_clock::time_point last_transition() const noexcept {
        return last_transition_;
    }

private:
    [[nodiscard]] bool can_transition(SessionState target) const noexcept;

    SessionInfo info_;
    std::chrono::system_clock::time_point last_transition_{};
};

} // namespace ddsync::sync
