#include "base_cli.hpp"
#include "theme.hpp"
#include <core/credentials.hpp>
#include <core/constants.hpp>
#include <core/log.hpp>
#include <lfs/lfs_endpoint.hpp>
#include <iostream>
#include <fmt/format.h>

BaseCLI::BaseCLI(fs::path repo) : repo_dir(std::move(repo)) {
    auto config_result = Config::load(repo_dir);
    if (config_result.is_ok()) {
        config = config_result.value;
    } else {
        config_error = config_result.error;
    }
}

void BaseCLI::add_command(const std::string& name,
                          CommandHandler handler,
                          const std::string& help) {
    commands_[name] = {handler, help};
}

void BaseCLI::fail(const std::string& msg) {
    std::cout << theme::fail(msg);
    exit_code_ = 1;
}

bool BaseCLI::require_config() {
    if (!config.has_value()) {
        fail(config_error.empty() ? "Configuration could not be loaded." : config_error);
        return false;
    }
    return true;
}

bool BaseCLI::require_repository() {
    if (!require_config()) {
        return false;
    }
    if (!git || !git->is_open() || !sync) {
        fail(fmt::format("No git repository at {}", repo_dir.string()));
        return false;
    }
    return true;
}

GitCredentials BaseCLI::credentials() const {
    return CredentialManager::instance().git_credentials();
}

AuthorIdentity BaseCLI::author() const {
    if (config && config->sync().author) return *config->sync().author;
    return AuthorIdentity{DEFAULT_AUTHOR_NAME, DEFAULT_AUTHOR_EMAIL};
}

void BaseCLI::init_managers() {
    if (!config) return;

    lock = std::make_unique<SyncLockManager>(repo_dir, config->lock(), sink);
    metadata = std::make_unique<MetadataManager>(repo_dir, sink);

    if (!fs::is_directory(repo_dir / ".git")) return;
    if (lock->cleanup_stale()) {
        std::cout << theme::log("Removed a stale sync lock");
    }

    try {
        git = std::make_unique<Libgit2Backend>(repo_dir);
    } catch (const GitError& e) {
        tandem_log(std::string("cli: cannot open repository: ") + e.what());
        git.reset();
        return;
    }
    if (!git->is_open()) return;

    std::string remote_url = git->remote_url(config->sync().remote).value_or("");
    http = std::make_unique<CurlHttpClient>();
    lfs_client = std::make_unique<LfsClient>(
        *http, make_endpoint_provider(remote_url, credentials(), config->lfs().endpoint));
    lfs = std::make_unique<LfsReconciler>(repo_dir, config->lfs(), *lfs_client, sink);
    sync = std::make_unique<SyncManager>(*git, *lock, *config, lfs.get());
}

int BaseCLI::execute_command(const std::string& command, const std::vector<std::string>& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        fail("Unknown command: " + command);
        std::cout << theme::step("Run 'tandem --help' for available commands.");
        return exit_code_;
    }

    try {
        it->second.first(*this, args);
    } catch (const std::exception& e) {
        fail(std::string(e.what()));
    }
    return exit_code_;
}

void BaseCLI::print_help() const {
    // Group commands by category
    std::vector<std::pair<std::string, std::vector<std::string>>> categories = {
        {"Sync",        {"sync", "complete-merge", "remote", "pack"}},
        {"Lock",        {"lock"}},
        {"Large files", {"lfs"}},
        {"Metadata",    {"metadata"}},
        {"Setup",       {"init", "credentials"}},
    };

    for (const auto& [cat_name, cmd_names] : categories) {
        bool has_any = false;
        for (const auto& name : cmd_names) {
            if (commands_.count(name)) {
                has_any = true;
                break;
            }
        }
        if (!has_any) continue;

        std::cout << "\n" << theme::color::BROWN << theme::color::BOLD
                  << "  " << cat_name << theme::color::RESET << "\n";

        for (const auto& name : cmd_names) {
            auto it = commands_.find(name);
            if (it != commands_.end()) {
                std::cout << theme::color::BLUE
                          << fmt::format("    {:<16}", name)
                          << theme::color::RESET
                          << theme::color::DIM
                          << it->second.second
                          << theme::color::RESET << "\n";
            }
        }
    }
    std::cout << "\n";
}
