#pragma once

#include <string>
#include <optional>
#include <vector>
#include <map>
#include <functional>
#include <cstdint>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// SSH command result
struct SSHResult {
    int exit_code;
    std::string stdout_data;
    std::string stderr_data;

    bool success() const { return exit_code == 0; }
    bool failed() const { return exit_code != 0; }

    std::string get_output() const {
        return stdout_data.empty() ? stderr_data : stdout_data;
    }
};

// Credentials handed to the git transport and the LFS endpoint
struct GitCredentials {
    std::string username;
    std::string password;        // password or personal access token

    bool empty() const { return username.empty() && password.empty(); }
};

struct AuthorIdentity {
    std::string name;
    std::string email;
};

// Configuration structures
enum class MediaStrategy {
    AutoDownload,     // download every missing payload during sync
    StreamOnly,       // never bulk-download payloads
    StreamAndSave,    // no bulk download, on-demand fetches are kept on disk
};

struct LockSettings {
    int64_t heartbeat_timeout_ms = 30000;
    int64_t progress_timeout_ms = 120000;
    int heartbeat_interval_ms = 5000;
};

struct LfsSettings {
    std::string pointer_prefix = ".project/attachments/pointers";
    std::string payload_prefix = ".project/attachments/files";
    std::string endpoint;                        // overrides the endpoint derived from the remote
    MediaStrategy media_strategy = MediaStrategy::AutoDownload;
};

struct SyncSettings {
    std::string remote = "origin";
    int connectivity_timeout_ms = 3000;
    int push_retries = 3;
    std::optional<AuthorIdentity> author;
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
