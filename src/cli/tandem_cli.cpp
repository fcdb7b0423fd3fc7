#include "tandem_cli.hpp"
#include "theme.hpp"
#include <core/log.hpp>
#include <iostream>

TandemCLI::TandemCLI(fs::path repo) : BaseCLI(std::move(repo)) {
    register_all_commands();
}

void TandemCLI::register_all_commands() {
    add_command("help", [this](BaseCLI& cli, const std::vector<std::string>& args) {
        this->print_help();
    }, "Show this help message");

    register_sync_commands(*this);
    register_lock_commands(*this);
    register_lfs_commands(*this);
    register_metadata_commands(*this);
    register_setup_commands(*this);
    register_credentials_commands(*this);
}

int TandemCLI::run_command(const std::string& command, const std::vector<std::string>& args) {
    tandem_log("cli: " + command + " in " + repo_dir.string());
    // init and credentials work without a configured repository
    if (command != "init" && command != "credentials" && command != "help") {
        init_managers();
    }
    int code = execute_command(command, args);

    for (const auto& entry : sink.entries()) {
        std::cout << theme::log(entry.where + ": " + entry.message);
    }
    return code;
}

int positional_arity(const std::string& command, const std::vector<std::string>& args) {
    std::string sub = args.empty() ? "" : args.front();
    if (command == "sync" || command == "pack" || command == "remote" || command == "help") return 0;
    if (command == "complete-merge") return -1;
    if (command == "init") return 1;
    if (command == "lock") return 1;
    if (command == "lfs") {
        if (sub == "fetch" || sub == "track") return 2;
        return 1;
    }
    if (command == "metadata") {
        if (sub == "set-version") return 3;
        return 1;
    }
    if (command == "credentials") {
        if (sub == "set") return 3;
        if (sub == "get" || sub == "remove") return 2;
        return 1;
    }
    return -1;
}
