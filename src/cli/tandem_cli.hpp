#pragma once

#include "base_cli.hpp"
#include <string>
#include <vector>

// Forward declarations for command registration
void register_sync_commands(BaseCLI& cli);
void register_lock_commands(BaseCLI& cli);
void register_lfs_commands(BaseCLI& cli);
void register_metadata_commands(BaseCLI& cli);
void register_setup_commands(BaseCLI& cli);
void register_credentials_commands(BaseCLI& cli);

class TandemCLI : public BaseCLI {
public:
    explicit TandemCLI(fs::path repo);

    int run_command(const std::string& command, const std::vector<std::string>& args);

private:
    void register_all_commands();
};

// Number of positional arguments `command` takes before the optional
// trailing repository path; -1 when it takes a variable number.
int positional_arity(const std::string& command, const std::vector<std::string>& args);
