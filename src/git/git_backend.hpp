#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <functional>
#include <stdexcept>
#include <filesystem>
#include <cstdint>
#include <core/types.hpp>

namespace fs = std::filesystem;

// ── Errors ──────────────────────────────────────────────────

enum class GitErrorKind {
    Network,    // transport could not reach the remote
    Auth,       // credentials missing or refused
    Rejected,   // remote refused the update (non-fast-forward, hooks)
    NotFound,   // ref, object or path does not exist
    Conflict,   // working tree or index prevents the operation
    Other,
};

std::string git_error_kind_name(GitErrorKind kind);

class GitError : public std::runtime_error {
public:
    GitError(GitErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    GitErrorKind kind() const { return kind_; }

private:
    GitErrorKind kind_;
};

// ── Value types ─────────────────────────────────────────────

enum class FileChange {
    Added,
    Modified,
    Deleted,
    Untracked,
};

struct StatusEntry {
    std::string path;
    FileChange change;
};

struct CommitInfo {
    std::string oid;
    std::string message;
    std::string author_name;
    std::string author_email;
    int64_t time = 0;               // seconds since epoch
    std::vector<std::string> parents;
};

struct TransferProgress {
    uint64_t current = 0;
    uint64_t total = 0;
    uint64_t bytes = 0;
    std::string stage;              // "receiving", "indexing", "pushing"
};

using TransferProgressCallback = std::function<void(const TransferProgress&)>;

struct PackStats {
    size_t objects_packed = 0;
    size_t loose_removed = 0;
};

// path -> blob id for every file in a commit's tree
using TreeListing = std::map<std::string, std::string>;

// ── Backend ─────────────────────────────────────────────────

// Version-control primitives the sync engine is built on. Every method
// throws GitError on failure; "not found" lookups return nullopt instead.
class GitBackend {
public:
    virtual ~GitBackend() = default;

    virtual fs::path workdir() const = 0;

    virtual void init(const std::string& default_branch) = 0;
    virtual void add_remote(const std::string& name, const std::string& url) = 0;
    virtual std::optional<std::string> remote_url(const std::string& name) = 0;

    // Stage paths (relative to the work tree) or remove them from the index.
    virtual void add(const std::vector<std::string>& paths) = 0;
    virtual void remove(const std::string& path) = 0;
    virtual std::vector<StatusEntry> status() = 0;

    // Commit the index on the current branch. Empty `parents` means HEAD
    // (or no parent on an unborn branch). Returns the new commit id.
    virtual std::string commit(const std::string& message, const AuthorIdentity& author,
                               const std::vector<std::string>& parents = {}) = 0;

    virtual void fetch(const std::string& remote, const GitCredentials& creds,
                       const TransferProgressCallback& progress) = 0;
    virtual void push(const std::string& remote, const std::string& branch,
                      const GitCredentials& creds,
                      const TransferProgressCallback& progress) = 0;

    // Force the work tree and index to `ref`; a branch name also moves HEAD.
    virtual void checkout(const std::string& ref) = 0;

    virtual std::string current_branch() = 0;
    virtual std::optional<std::string> resolve_ref(const std::string& ref) = 0;
    virtual std::optional<std::string> read_blob(const std::string& commit,
                                                 const std::string& path) = 0;
    virtual std::vector<CommitInfo> log(const std::string& ref, size_t depth) = 0;
    virtual std::vector<std::string> list_branches(bool remote) = 0;
    virtual void write_ref(const std::string& ref, const std::string& oid) = 0;

    virtual std::optional<std::string> merge_base(const std::string& a, const std::string& b) = 0;
    virtual TreeListing list_files(const std::string& commit) = 0;

    // Move loose objects into a pack and drop the loose copies.
    virtual PackStats pack_objects() = 0;
};
