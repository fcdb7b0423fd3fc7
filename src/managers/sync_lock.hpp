#pragma once

#include <string>
#include <optional>
#include <cstdint>
#include <core/types.hpp>

// ── Sync lock record ────────────────────────────────────────

enum class SyncPhase {
    Idle,
    Committing,
    Fetching,
    Merging,
    Pushing,
};

std::string phase_name(SyncPhase phase);
std::optional<SyncPhase> parse_phase(const std::string& name);

// Network phases are the only ones that can be declared stuck.
bool is_network_phase(SyncPhase phase);

struct LockProgress {
    int64_t current = 0;
    int64_t total = 0;
    std::string description;
};

struct SyncLockRecord {
    int pid = 0;
    std::string host;
    std::string instance;           // optional editor / session id

    int64_t acquired_at = 0;        // epoch ms
    int64_t timestamp = 0;          // last heartbeat, epoch ms
    int64_t last_progress = 0;      // last observed transfer progress, epoch ms

    SyncPhase phase = SyncPhase::Idle;
    int64_t phase_changed_at = 0;

    std::optional<LockProgress> progress;
};

// ── Derived status ──────────────────────────────────────────

enum class LockState {
    Absent,
    Active,
    Stuck,     // holder heartbeats but a network phase made no progress
    Dead,      // heartbeat silence, or the holder's process is gone
};

std::string lock_state_name(LockState state);

struct LockStatus {
    bool exists = false;
    LockState state = LockState::Absent;
    int64_t age_ms = 0;             // since the last heartbeat
    bool is_stuck = false;
    SyncPhase phase = SyncPhase::Idle;
    std::optional<LockProgress> progress;
    std::optional<SyncLockRecord> owner;
};

// Pure classification of a lock record at time `now`.
// `owner_gone` is true when the record's holder is known not to exist
// (same host, pid no longer running).
LockState classify(const SyncLockRecord& record, int64_t now,
                   const LockSettings& timeouts, bool owner_gone);

// Full status for a possibly-absent record.
LockStatus describe(const std::optional<SyncLockRecord>& record, int64_t now,
                    const LockSettings& timeouts, bool owner_gone);
