#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include <functional>
#include <core/types.hpp>

namespace platform {

enum class CreateStatus {
    Created,        // file did not exist and now holds the content
    AlreadyExists,  // someone else holds the path
    Failed,         // I/O error (see error)
};

// Create `path` with O_CREAT|O_EXCL and write `content` to it. This is the
// only cross-process atomicity primitive used for lock files: exactly one
// caller can observe Created for a given path until it is removed.
CreateStatus create_exclusive(const std::filesystem::path& path,
                              const std::string& content,
                              std::string* error = nullptr);

// Read a whole file. nullopt if it does not exist or cannot be read.
std::optional<std::string> read_file(const std::filesystem::path& path);

// Truncate-and-write, flushed to disk before returning.
Result<void> write_file(const std::filesystem::path& path, const std::string& content);

// Atomically move `from` over `to` (rename(2) on the same filesystem).
Result<void> replace_file(const std::filesystem::path& from, const std::filesystem::path& to);

// Remove a file. A missing file is not an error.
Result<void> remove_file(const std::filesystem::path& path);

// A name next to `path` that no other process or thread uses:
// <path>.<tag>.<pid>.<n>
std::filesystem::path private_sibling(const std::filesystem::path& path, const std::string& tag);

enum class TakeOverStatus {
    Removed,    // the file was stale and is gone
    NotStale,   // the file found on claim was live and has been put back
    Missing,    // nothing to take over
    Displaced,  // a live file was claimed and a new one appeared before it could be put back
    Failed,     // I/O error (see error)
};

// Remove a stale lock file without ever deleting one created after the
// caller looked at it. The file is renamed to a private name first and
// `is_stale` judges the claimed copy (mtime survives the rename). A live
// file is linked back without clobbering a newer one.
TakeOverStatus remove_if_stale(const std::filesystem::path& path,
                               const std::function<bool(const std::filesystem::path&)>& is_stale,
                               std::string* error = nullptr);

} // namespace platform
