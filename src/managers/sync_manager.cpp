#include "sync_manager.hpp"
#include "heartbeat_timer.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <git/remote_url.hpp>
#include <platform/file_ops.hpp>
#include <platform/platform.hpp>
#include <platform/socket_util.hpp>
#include <fmt/format.h>
#include <algorithm>

namespace fs = std::filesystem;

std::string sync_status_name(SyncStatus status) {
    switch (status) {
        case SyncStatus::Synced:         return "synced";
        case SyncStatus::Conflicts:      return "conflicts";
        case SyncStatus::Offline:        return "offline";
        case SyncStatus::AlreadyRunning: return "already-running";
        case SyncStatus::Skipped:        return "skipped";
        case SyncStatus::AuthFailed:     return "auth-failed";
        case SyncStatus::Rejected:       return "rejected";
        case SyncStatus::Failed:         return "failed";
    }
    return "failed";
}

bool default_connectivity_probe(const std::string& remote_url, int timeout_ms) {
    auto parsed = parse_remote_url(remote_url);
    if (!parsed) {
        // Plain path remote
        std::error_code ec;
        return fs::exists(remote_url, ec);
    }
    if (parsed->scheme == "file") {
        std::error_code ec;
        return fs::exists("/" + parsed->path, ec);
    }
    return platform::tcp_reachable(parsed->host, parsed->effective_port(), timeout_ms);
}

namespace {

// Releases the sync lock when the operation unwinds
class LockRelease {
public:
    explicit LockRelease(SyncLockManager& lock) : lock_(lock) {}
    ~LockRelease() { lock_.release(); }
private:
    SyncLockManager& lock_;
};

void notify(const StatusCallback& cb, const std::string& msg) {
    tandem_log("sync: " + msg);
    if (cb) cb(msg);
}

SyncStatus status_for(GitErrorKind kind) {
    switch (kind) {
        case GitErrorKind::Network:  return SyncStatus::Offline;
        case GitErrorKind::Auth:     return SyncStatus::AuthFailed;
        case GitErrorKind::Rejected: return SyncStatus::Rejected;
        default:                     return SyncStatus::Failed;
    }
}

} // namespace

SyncManager::SyncManager(GitBackend& git, SyncLockManager& lock, const Config& config,
                         LfsReconciler* lfs)
    : git_(git), lock_(lock), config_(config), lfs_(lfs),
      detector_(git, config.lfs().pointer_prefix),
      probe_(default_connectivity_probe),
      sleep_([](int ms) { platform::sleep_ms(ms); }) {
}

std::string SyncManager::remote_ref(const std::string& branch) const {
    return "refs/remotes/" + remote() + "/" + branch;
}

void SyncManager::set_phase(SyncPhase phase) {
    HeartbeatUpdate update;
    update.phase = phase;
    lock_.update_heartbeat(update);
}

// ── Steps ───────────────────────────────────────────────────

bool SyncManager::commit_local_changes(const AuthorIdentity& author, StatusCallback cb) {
    auto entries = git_.status();
    if (entries.empty()) return false;

    std::vector<std::string> paths;
    for (const auto& e : entries) paths.push_back(e.path);
    git_.add(paths);

    std::string oid = git_.commit("Local changes", author);
    notify(cb, fmt::format("Committed {} local change(s) ({})", paths.size(), oid.substr(0, 8)));
    return true;
}

bool SyncManager::is_online(StatusCallback cb) {
    auto url = git_.remote_url(remote());
    if (!url) {
        throw GitError(GitErrorKind::NotFound, "no remote named " + remote());
    }
    bool online = probe_(*url, config_.sync().connectivity_timeout_ms);
    if (!online) {
        notify(cb, fmt::format("{} is unreachable, local changes are saved", strip_url_credentials(*url)));
    }
    return online;
}

void SyncManager::fetch(const GitCredentials& creds) {
    HeartbeatTimer timer(lock_, lock_.settings().heartbeat_interval_ms);
    timer.start();
    git_.fetch(remote(), creds, [this](const TransferProgress& p) {
        HeartbeatUpdate update;
        update.progress = LockProgress{static_cast<int64_t>(p.current),
                                       static_cast<int64_t>(p.total), p.stage};
        update.progress_made = true;
        lock_.update_heartbeat(update);
    });
    timer.stop();
}

void SyncManager::fast_forward(const std::string& branch, const std::string& target) {
    git_.write_ref("refs/heads/" + branch, target);
    git_.checkout(branch);
}

void SyncManager::apply_changes(const std::vector<MergeChange>& changes) {
    fs::path root = git_.workdir();
    std::vector<std::string> staged;

    for (const auto& change : changes) {
        fs::path file = root / change.path;
        if (change.content) {
            std::error_code ec;
            fs::create_directories(file.parent_path(), ec);
            auto written = platform::write_file(file, *change.content);
            if (written.is_err()) {
                throw GitError(GitErrorKind::Other, "writing " + change.path + ": " + written.error);
            }
            staged.push_back(change.path);
        } else {
            auto removed = platform::remove_file(file);
            if (removed.is_err()) {
                throw GitError(GitErrorKind::Other, "removing " + change.path + ": " + removed.error);
            }
            git_.remove(change.path);
        }
    }
    if (!staged.empty()) git_.add(staged);
}

std::set<std::string> SyncManager::changed_pointer_paths(const std::optional<std::string>& from,
                                                         const std::string& to) {
    std::set<std::string> changed;
    if (!lfs_) return changed;

    TreeListing before;
    if (from) before = git_.list_files(*from);
    TreeListing after = git_.list_files(to);

    for (const auto& [path, oid] : after) {
        if (!lfs_->is_pointer_path(path)) continue;
        auto it = before.find(path);
        if (it == before.end() || it->second != oid) changed.insert(path);
    }
    return changed;
}

void SyncManager::reconcile_lfs(const std::set<std::string>& incoming, const AuthorIdentity& author,
                                SyncResult& result, StatusCallback cb) {
    if (!lfs_) return;

    ReconcileOptions options;
    options.incoming_pointers = incoming;
    result.lfs = lfs_->reconcile(options);

    if (!result.lfs.downloaded.empty()) {
        notify(cb, fmt::format("Downloaded {} large file(s)", result.lfs.downloaded.size()));
    }
    if (!result.lfs.failed.empty()) {
        notify(cb, fmt::format("{} large file transfer(s) failed", result.lfs.failed.size()));
    }
    if (result.lfs.rewritten_pointers.empty()) return;

    set_phase(SyncPhase::Committing);
    git_.add(result.lfs.rewritten_pointers);
    std::string oid = git_.commit("Update large file pointers", author);
    notify(cb, fmt::format("Committed {} updated pointer(s) ({})",
                           result.lfs.rewritten_pointers.size(), oid.substr(0, 8)));
}

void SyncManager::push_with_retry(const std::string& branch, const GitCredentials& creds,
                                  SyncResult& result, StatusCallback cb) {
    set_phase(SyncPhase::Pushing);

    int attempts = std::max(1, config_.sync().push_retries);
    for (int attempt = 1;; ++attempt) {
        try {
            HeartbeatTimer timer(lock_, lock_.settings().heartbeat_interval_ms);
            timer.start();
            git_.push(remote(), branch, creds, [this](const TransferProgress& p) {
                HeartbeatUpdate update;
                update.progress = LockProgress{static_cast<int64_t>(p.current),
                                               static_cast<int64_t>(p.total), p.stage};
                update.progress_made = true;
                lock_.update_heartbeat(update);
            });
            timer.stop();
            result.pushed_commit = git_.resolve_ref("HEAD");
            notify(cb, fmt::format("Pushed {} to {}/{}",
                                   result.pushed_commit.value_or("").substr(0, 8), remote(), branch));
            return;
        } catch (const GitError& e) {
            if (e.kind() != GitErrorKind::Network || attempt >= attempts) throw;
            tandem_log(fmt::format("sync: push attempt {}/{} failed: {}", attempt, attempts, e.what()));
            sleep_(PUSH_RETRY_DELAY_MS << (attempt - 1));
        }
    }
}

// ── Sync ────────────────────────────────────────────────────

SyncResult SyncManager::sync_changes(const GitCredentials& creds, const AuthorIdentity& author,
                                     SyncTrigger trigger, StatusCallback cb) {
    SyncResult result;

    if (!lock_.acquire()) {
        result.status = trigger == SyncTrigger::Manual ? SyncStatus::AlreadyRunning : SyncStatus::Skipped;
        result.message = "sync already in progress";
        tandem_log("sync: " + result.message);
        return result;
    }
    LockRelease release(lock_);

    try {
        std::string branch = git_.current_branch();

        set_phase(SyncPhase::Committing);
        if (lfs_) {
            auto ignored = lfs_->ensure_payloads_ignored();
            if (ignored.is_err()) lock_.sink().report("sync.gitignore", ignored.error);
        }
        commit_local_changes(author, cb);

        if (!is_online(cb)) {
            result.status = SyncStatus::Offline;
            result.offline = true;
            result.message = "offline, local changes committed";
            return result;
        }

        set_phase(SyncPhase::Fetching);
        fetch(creds);

        auto local = git_.resolve_ref("HEAD");
        auto theirs = git_.resolve_ref(remote_ref(branch));
        std::set<std::string> incoming;

        if (!theirs) {
            notify(cb, fmt::format("{}/{} does not exist yet, publishing", remote(), branch));
        } else if (local == theirs) {
            notify(cb, "Already up to date");
        } else if (!local) {
            fast_forward(branch, *theirs);
            incoming = changed_pointer_paths(std::nullopt, *theirs);
            notify(cb, "Checked out " + remote() + "/" + branch);
        } else {
            auto base = git_.merge_base(*local, *theirs);
            if (base == local) {
                fast_forward(branch, *theirs);
                incoming = changed_pointer_paths(local, *theirs);
                notify(cb, fmt::format("Fast-forwarded to {}", theirs->substr(0, 8)));
            } else if (base == theirs) {
                notify(cb, "Remote has nothing new");
            } else {
                set_phase(SyncPhase::Merging);
                MergePlan plan = detector_.plan(*local, *theirs);
                if (!plan.clean()) {
                    result.status = SyncStatus::Conflicts;
                    result.had_conflicts = true;
                    result.conflicts = std::move(plan.conflicts);
                    result.message = fmt::format("{} conflict(s) with {}/{}",
                                                 result.conflicts.size(), remote(), branch);
                    notify(cb, result.message);
                    return result;
                }
                apply_changes(plan.changes);
                for (const auto& change : plan.changes) {
                    if (lfs_ && change.content && lfs_->is_pointer_path(change.path)) {
                        incoming.insert(change.path);
                    }
                }
                std::string merged = git_.commit(
                    fmt::format("Merge branch '{}/{}' into {}", remote(), branch, branch),
                    author, {*local, *theirs});
                notify(cb, fmt::format("Merged {}/{} ({})", remote(), branch, merged.substr(0, 8)));
            }
        }

        reconcile_lfs(incoming, author, result, cb);

        if (git_.resolve_ref("HEAD") != theirs) {
            push_with_retry(branch, creds, result, cb);
        }

        set_phase(SyncPhase::Idle);
        result.status = SyncStatus::Synced;
        result.message = result.lfs.failed.empty()
            ? "synced"
            : fmt::format("synced, {} large file(s) not transferred", result.lfs.failed.size());
        return result;
    } catch (const GitError& e) {
        result.status = status_for(e.kind());
        result.offline = e.kind() == GitErrorKind::Network;
        result.message = e.what();
    } catch (const LfsError& e) {
        result.status = e.kind() == LfsErrorKind::Auth ? SyncStatus::AuthFailed : SyncStatus::Failed;
        result.message = e.what();
    } catch (const std::exception& e) {
        result.status = SyncStatus::Failed;
        result.message = e.what();
    }

    tandem_log(fmt::format("sync: {} ({})", sync_status_name(result.status), result.message));
    if (cb) cb(result.message);
    return result;
}

// ── Merge completion ────────────────────────────────────────

SyncResult SyncManager::complete_merge(const GitCredentials& creds, const AuthorIdentity& author,
                                       const std::vector<std::string>& resolved_files,
                                       StatusCallback cb) {
    SyncResult result;

    if (!lock_.acquire()) {
        result.status = SyncStatus::AlreadyRunning;
        result.message = "sync already in progress";
        return result;
    }
    LockRelease release(lock_);

    try {
        std::string branch = git_.current_branch();
        auto local = git_.resolve_ref("HEAD");
        auto theirs = git_.resolve_ref(remote_ref(branch));
        if (!local || !theirs) {
            throw GitError(GitErrorKind::NotFound,
                           fmt::format("nothing to merge: {}/{} or HEAD is missing", remote(), branch));
        }

        set_phase(SyncPhase::Merging);
        MergePlan plan = detector_.plan(*local, *theirs);

        std::set<std::string> resolved(resolved_files.begin(), resolved_files.end());
        std::vector<std::string> unresolved;
        for (const auto& c : plan.conflicts) {
            if (!resolved.count(c.filepath)) unresolved.push_back(c.filepath);
        }
        if (!unresolved.empty()) {
            result.status = SyncStatus::Conflicts;
            result.had_conflicts = true;
            for (auto& c : plan.conflicts) {
                if (!resolved.count(c.filepath)) result.conflicts.push_back(std::move(c));
            }
            result.message = fmt::format("{} file(s) still unresolved", unresolved.size());
            notify(cb, result.message);
            return result;
        }

        apply_changes(plan.changes);

        fs::path root = git_.workdir();
        std::vector<std::string> present;
        for (const auto& path : resolved_files) {
            std::error_code ec;
            if (fs::exists(root / path, ec)) {
                present.push_back(path);
            } else {
                git_.remove(path);
            }
        }
        if (!present.empty()) git_.add(present);

        std::set<std::string> incoming;
        for (const auto& change : plan.changes) {
            if (lfs_ && change.content && lfs_->is_pointer_path(change.path)) incoming.insert(change.path);
        }

        std::string short_ref = remote() + "/" + branch;
        try {
            git_.commit(fmt::format("Merge branch '{}'", short_ref), author, {*local, *theirs});
        } catch (const GitError& e) {
            tandem_log(fmt::format("sync: merge commit failed ({}), committing on {} alone",
                                   e.what(), local->substr(0, 8)));
            git_.commit("Resolved conflicts with " + short_ref, author);
        }
        notify(cb, "Merged " + short_ref);

        if (!is_online(cb)) {
            result.status = SyncStatus::Offline;
            result.offline = true;
            result.message = "offline, merge committed locally";
            return result;
        }

        reconcile_lfs(incoming, author, result, cb);
        push_with_retry(branch, creds, result, cb);

        set_phase(SyncPhase::Idle);
        result.status = SyncStatus::Synced;
        result.message = "merge completed";
        return result;
    } catch (const GitError& e) {
        result.status = status_for(e.kind());
        result.offline = e.kind() == GitErrorKind::Network;
        result.message = e.what();
    } catch (const LfsError& e) {
        result.status = e.kind() == LfsErrorKind::Auth ? SyncStatus::AuthFailed : SyncStatus::Failed;
        result.message = e.what();
    } catch (const std::exception& e) {
        result.status = SyncStatus::Failed;
        result.message = e.what();
    }

    tandem_log(fmt::format("complete_merge: {} ({})", sync_status_name(result.status), result.message));
    if (cb) cb(result.message);
    return result;
}

// ── Maintenance ─────────────────────────────────────────────

Result<PackStats> SyncManager::pack_repository(bool silent, StatusCallback cb) {
    if (!lock_.acquire()) {
        return Result<PackStats>::Err("sync already in progress");
    }
    LockRelease release(lock_);

    StatusCallback report = silent ? StatusCallback() : cb;
    try {
        notify(report, "Packing repository objects");
        PackStats stats = git_.pack_objects();
        notify(report, fmt::format("Packed {} objects, removed {} loose",
                                   stats.objects_packed, stats.loose_removed));
        return Result<PackStats>::Ok(stats);
    } catch (const GitError& e) {
        return Result<PackStats>::Err(std::string("Failed to pack repository: ") + e.what());
    }
}

RemoteBranchStatus SyncManager::remote_branch_status(const GitCredentials& creds) {
    RemoteBranchStatus status;
    try {
        std::string branch = git_.current_branch();
        git_.fetch(remote(), creds, nullptr);
        status.oid = git_.resolve_ref(remote_ref(branch));
        status.state = status.oid ? RemoteBranchState::Found : RemoteBranchState::NotFound;
    } catch (const GitError& e) {
        status.state = RemoteBranchState::Error;
        status.message = e.what();
        tandem_log(std::string("remote_branch_status: ") + e.what());
    }
    return status;
}
