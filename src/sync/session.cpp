#include "ddsync/sync/session.hpp"

#include <algorithm>
#include <unordered_map>
#include <vector>

namespace ddsync::sync {
namespace {

bool is_progressive(SessionState current, SessionState target) {
    static const std::unordered_map<SessionState, std::vector<SessionState>> transitions {
        {SessionState::Idle, {SessionState::Scanning, SessionState::FetchingRemote}},
        {SessionState::Scanning, {SessionState::FetchingRemote, SessionState::Planning}},
        {SessionState::FetchingRemote, {SessionState::Scanning, SessionState::Planning}},
        {SessionState::Planning, {SessionState::Transferring, SessionState::Complete}},
        {SessionState::Transferring, {SessionState::Verifying, SessionState::Complete}},
        {SessionState::Verifying, {SessionState::Complete}},
    };

    if (target == SessionState::Failed) {
        return true;
    }

    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed = it->second;
    return std::find(allowed.begin(), allowed.end(), target) != allowed.end();
}

} // namespace

const char* to_string(SessionState state) noexcept {
    switch (state) {
        case SessionState::Idle: return "idle";
        case SessionState::Scanning: return "scanning";
        case SessionState::FetchingRemote: return "fetching-remote";
        case SessionState::Planning: return "planning";
        case SessionState::Transferring: return "transferring";
        case SessionState::Verifying: return "verifying";
        case SessionState::Complete: return "complete";
        case SessionState::Failed: return "failed";
    }
    return "unknown";
}

SyncSession::SyncSession(Direction direction, std::string project) {
    info_.direction = direction;
    info_.project = std::move(project);
    info_.state = SessionState::Idle;
    info_.started_at = std::chrono::system_clock::now();
    last_transition_ = info_.started_at;
}

Result<void> SyncSession::transition_to(SessionState next_state) {
    if (info_.state == next_state) {
        return Ok();
    }

    if (!can_transition(next_state)) {
        return Err<void>(Error::validation(std::string("illegal session transition ") +
            to_string(info_.state) + " -> " + to_string(next_state)));
    }

    info_.state = next_state;
    last_transition_ = std::chrono::system_clock::now();
    if (next_state != SessionState::Failed) {
        info_.last_error.clear();
    }
    return Ok();
}

Result<void> SyncSession::mark_failed(std::string error_message) {
    auto moved = transition_to(SessionState::Failed);
    if (moved.is_ok()) {
        info_.last_error = std::move(error_message);
    }
    return moved;
}

void SyncSession::update_pending(uint64_t files_pending, uint64_t bytes_pending) {
    info_.files_pending = files_pending;
    info_.bytes_pending = bytes_pending;
}

bool SyncSession::can_transition(SessionState target) const noexcept {
    if (info_.state == target) {
        return true;
    }
    if (info_.state == SessionState::Failed || info_.state == SessionState::Complete) {
        return false;
    }
    return is_progressive(info_.state, target);
}

} // namespace ddsync::sync
