#include "sync_lock.hpp"
#include <algorithm>

std::string phase_name(SyncPhase phase) {
    switch (phase) {
        case SyncPhase::Idle:       return "idle";
        case SyncPhase::Committing: return "committing";
        case SyncPhase::Fetching:   return "fetching";
        case SyncPhase::Merging:    return "merging";
        case SyncPhase::Pushing:    return "pushing";
    }
    return "idle";
}

std::optional<SyncPhase> parse_phase(const std::string& name) {
    if (name == "idle") return SyncPhase::Idle;
    if (name == "committing") return SyncPhase::Committing;
    if (name == "fetching") return SyncPhase::Fetching;
    if (name == "merging") return SyncPhase::Merging;
    if (name == "pushing") return SyncPhase::Pushing;
    return std::nullopt;
}

bool is_network_phase(SyncPhase phase) {
    return phase == SyncPhase::Fetching || phase == SyncPhase::Pushing;
}

std::string lock_state_name(LockState state) {
    switch (state) {
        case LockState::Absent: return "absent";
        case LockState::Active: return "active";
        case LockState::Stuck:  return "stuck";
        case LockState::Dead:   return "dead";
    }
    return "absent";
}

LockState classify(const SyncLockRecord& record, int64_t now,
                   const LockSettings& timeouts, bool owner_gone) {
    if (owner_gone) return LockState::Dead;

    int64_t heartbeat_age = now - record.timestamp;
    if (heartbeat_age >= timeouts.heartbeat_timeout_ms) return LockState::Dead;

    if (is_network_phase(record.phase)) {
        // Records from older writers may carry no progress stamp
        int64_t progress_at = record.last_progress;
        if (progress_at == 0) progress_at = std::max(record.phase_changed_at, record.acquired_at);
        if (progress_at == 0) progress_at = record.timestamp;

        if (now - progress_at > timeouts.progress_timeout_ms) return LockState::Stuck;
    }

    return LockState::Active;
}

LockStatus describe(const std::optional<SyncLockRecord>& record, int64_t now,
                    const LockSettings& timeouts, bool owner_gone) {
    LockStatus status;
    if (!record) return status;

    status.exists = true;
    status.state = classify(*record, now, timeouts, owner_gone);
    status.age_ms = now - record->timestamp;
    status.is_stuck = status.state == LockState::Stuck;
    status.phase = record->phase;
    status.progress = record->progress;
    status.owner = record;
    return status;
}
