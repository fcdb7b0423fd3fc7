#pragma once

#include <memory>
#include "git_backend.hpp"

struct git_repository;

// GitBackend over libgit2. One instance per work tree; not thread-safe.
class Libgit2Backend : public GitBackend {
public:
    // Opens the repository at `workdir` if there is one; init() creates it.
    explicit Libgit2Backend(fs::path workdir);
    ~Libgit2Backend() override;

    Libgit2Backend(const Libgit2Backend&) = delete;
    Libgit2Backend& operator=(const Libgit2Backend&) = delete;

    bool is_open() const { return repo_ != nullptr; }

    fs::path workdir() const override { return workdir_; }

    void init(const std::string& default_branch) override;
    void add_remote(const std::string& name, const std::string& url) override;
    std::optional<std::string> remote_url(const std::string& name) override;

    void add(const std::vector<std::string>& paths) override;
    void remove(const std::string& path) override;
    std::vector<StatusEntry> status() override;

    std::string commit(const std::string& message, const AuthorIdentity& author,
                       const std::vector<std::string>& parents) override;

    void fetch(const std::string& remote, const GitCredentials& creds,
               const TransferProgressCallback& progress) override;
    void push(const std::string& remote, const std::string& branch,
              const GitCredentials& creds,
              const TransferProgressCallback& progress) override;

    void checkout(const std::string& ref) override;

    std::string current_branch() override;
    std::optional<std::string> resolve_ref(const std::string& ref) override;
    std::optional<std::string> read_blob(const std::string& commit,
                                         const std::string& path) override;
    std::vector<CommitInfo> log(const std::string& ref, size_t depth) override;
    std::vector<std::string> list_branches(bool remote) override;
    void write_ref(const std::string& ref, const std::string& oid) override;

    std::optional<std::string> merge_base(const std::string& a, const std::string& b) override;
    TreeListing list_files(const std::string& commit) override;

    PackStats pack_objects() override;

private:
    git_repository* repo() const;

    fs::path workdir_;
    git_repository* repo_ = nullptr;
};
