#pragma once

#include <string>
#include <optional>
#include <core/types.hpp>

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;

struct SessionTarget {
    std::string host;
    int port = 22;
    std::string user = "git";
    std::string password;                    // used when the server offers password auth
    std::optional<std::string> ssh_key_path; // default: ~/.ssh/id_ed25519, ~/.ssh/id_rsa
    int timeout = 30;
};

// One authenticated SSH connection used to run single commands
// (git-lfs-authenticate). Auth order: agent, key files, password.
class SessionManager {
public:
    explicit SessionManager(const SessionTarget& target);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    SSHResult establish(StatusCallback callback = nullptr);
    void close();
    bool is_active() const { return active_; }

    // Run `command` on an exec channel and collect its output.
    SSHResult exec(const std::string& command);

private:
    SessionTarget target_;
    LIBSSH2_SESSION* session_;
    int sock_;
    bool active_;

    SSHResult ssh_userauth(StatusCallback callback);
    bool try_agent();
    bool try_key_files();
};
