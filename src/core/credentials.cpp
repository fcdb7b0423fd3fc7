#include "credentials.hpp"
#include <platform/platform.hpp>
#include <cstdlib>

CredentialManager& CredentialManager::instance() {
    static CredentialManager mgr;
    return mgr;
}

CredentialManager::CredentialManager()
    : store_path_(platform::home_dir() / ".tandem" / "credentials") {}

CredentialManager::CredentialManager(fs::path store_path)
    : store_path_(std::move(store_path)) {}

Result<std::string> CredentialManager::get(const std::string& key) {
    auto m = read_all();
    auto it = m.find(key);
    if (it == m.end()) {
        return Result<std::string>::Err("Credential not found: " + key);
    }
    return Result<std::string>::Ok(it->second);
}

Result<void> CredentialManager::set(const std::string& key, const std::string& value) {
    if (key.empty() || key.find('=') != std::string::npos) {
        return Result<void>::Err("Invalid credential key");
    }
    auto m = read_all();
    m[key] = value;
    if (!write_all(m)) {
        return Result<void>::Err("Failed to write credentials file " + store_path_.string());
    }
    return Result<void>::Ok();
}

Result<void> CredentialManager::remove(const std::string& key) {
    auto m = read_all();
    if (m.erase(key) == 0) {
        return Result<void>::Err("Credential not found: " + key);
    }
    if (!write_all(m)) {
        return Result<void>::Err("Failed to write credentials file " + store_path_.string());
    }
    return Result<void>::Ok();
}

std::vector<CredentialInfo> CredentialManager::list() {
    std::vector<CredentialInfo> infos;
    for (const auto& [k, v] : read_all()) {
        infos.push_back({k, !v.empty()});
    }
    return infos;
}

GitCredentials CredentialManager::git_credentials() {
    GitCredentials creds;

    if (const char* user = std::getenv("TANDEM_GIT_USERNAME")) {
        creds.username = user;
    } else if (auto r = get(CRED_GIT_USERNAME); r.is_ok()) {
        creds.username = r.value;
    }

    if (const char* token = std::getenv("TANDEM_GIT_TOKEN")) {
        creds.password = token;
    } else if (auto r = get(CRED_GIT_TOKEN); r.is_ok()) {
        creds.password = r.value;
    }

    return creds;
}
