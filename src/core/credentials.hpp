#pragma once

#include <string>
#include <vector>
#include <map>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

struct CredentialInfo {
    std::string key;
    bool has_value;
};

// Keys used for the git transport and LFS endpoint
constexpr const char* CRED_GIT_USERNAME = "git_username";
constexpr const char* CRED_GIT_TOKEN    = "git_token";

class CredentialManager {
public:
    static CredentialManager& instance();

    // Backed by an explicit key=value file (tests, alternate homes)
    explicit CredentialManager(fs::path store_path);

    // Get credential by key
    Result<std::string> get(const std::string& key);

    // Set credential (written to the store file, mode 600)
    Result<void> set(const std::string& key, const std::string& value);

    // Remove credential
    Result<void> remove(const std::string& key);

    // List all stored credentials
    std::vector<CredentialInfo> list();

    // Git username + token. TANDEM_GIT_USERNAME / TANDEM_GIT_TOKEN win over
    // the store; missing values are left empty.
    GitCredentials git_credentials();

    const fs::path& store_path() const { return store_path_; }

private:
    CredentialManager();

    std::map<std::string, std::string> read_all() const;
    bool write_all(const std::map<std::string, std::string>& m) const;

    fs::path store_path_;
};
