#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <functional>
#include <optional>
#include <filesystem>
#include <core/config.hpp>
#include <core/nonfatal.hpp>
#include <git/libgit2_backend.hpp>
#include <lfs/curl_http_client.hpp>
#include <lfs/lfs_client.hpp>
#include <lfs/lfs_reconciler.hpp>
#include <managers/sync_lock_manager.hpp>
#include <managers/metadata_manager.hpp>
#include <managers/sync_manager.hpp>

namespace fs = std::filesystem;

class BaseCLI {
public:
    explicit BaseCLI(fs::path repo);
    virtual ~BaseCLI() = default;

    using CommandHandler = std::function<void(BaseCLI&, const std::vector<std::string>&)>;

    void add_command(const std::string& name,
                     CommandHandler handler,
                     const std::string& help);

    bool has_command(const std::string& name) const { return commands_.count(name) > 0; }

    bool require_config();
    bool require_repository();

    // Lock and metadata managers need only the config; the sync stack
    // also needs an opened repository.
    void init_managers();

    // Runs the handler and returns the process exit code.
    int execute_command(const std::string& command, const std::vector<std::string>& args);
    void print_help() const;

    // Print a failure and mark the run as failed
    void fail(const std::string& msg);

    // Credentials for the git transport and LFS endpoint
    GitCredentials credentials() const;
    AuthorIdentity author() const;

    // Public state
    fs::path repo_dir;
    std::optional<Config> config;
    std::string config_error;
    NonFatalSink sink;
    std::unique_ptr<SyncLockManager> lock;
    std::unique_ptr<MetadataManager> metadata;
    std::unique_ptr<Libgit2Backend> git;
    std::unique_ptr<CurlHttpClient> http;
    std::unique_ptr<LfsClient> lfs_client;
    std::unique_ptr<LfsReconciler> lfs;
    std::unique_ptr<SyncManager> sync;

protected:
    std::map<std::string, std::pair<CommandHandler, std::string>> commands_;
    int exit_code_ = 0;
};
