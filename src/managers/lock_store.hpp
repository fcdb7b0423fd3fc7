#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include <functional>
#include <core/types.hpp>
#include <platform/file_ops.hpp>
#include "sync_lock.hpp"

namespace fs = std::filesystem;

// Reads and writes the single sync lock record of a repository
// (<repo>/.git/tandem-sync.lock). Pure I/O: no liveness decisions here.
class LockStore {
public:
    explicit LockStore(fs::path lock_path);

    static fs::path default_path(const fs::path& repo_dir);

    // nullopt if no record exists. An unreadable record (torn write, foreign
    // garbage) is returned with its file mtime as the heartbeat so it ages
    // out like any other silent holder.
    std::optional<SyncLockRecord> load() const;
    static std::optional<SyncLockRecord> load_from(const fs::path& file);

    // Exclusive create. Exactly one caller sees Created.
    platform::CreateStatus create(const SyncLockRecord& record, std::string* error = nullptr);

    // Overwrite the existing record (temp file + rename). With `still_ours`,
    // the record on disk is checked again right before the rename and left
    // alone when the check fails.
    Result<void> save(const SyncLockRecord& record,
                      const std::function<bool(const SyncLockRecord&)>& still_ours = nullptr);

    Result<void> remove();

    // Remove the record only if `stale` holds for the record actually taken
    // off the path. A record written by someone else after the caller's own
    // load is put back, never deleted.
    platform::TakeOverStatus remove_if(const std::function<bool(const SyncLockRecord&)>& stale,
                                       std::string* error = nullptr);

    bool exists() const;
    const fs::path& path() const { return lock_path_; }

    static std::string serialize(const SyncLockRecord& record);
    static std::optional<SyncLockRecord> parse(const std::string& text);

private:
    fs::path lock_path_;
};
