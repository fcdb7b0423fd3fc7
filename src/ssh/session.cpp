#include "session.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <platform/socket_util.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

namespace {

struct LibraryInit {
    int rc;
    LibraryInit() : rc(libssh2_init(0)) {}
    ~LibraryInit() { libssh2_exit(); }
};

bool ensure_library() {
    static LibraryInit init;
    return init.rc == 0;
}

} // namespace

SessionManager::SessionManager(const SessionTarget& target)
    : target_(target), session_(nullptr), sock_(-1), active_(false) {
}

SessionManager::~SessionManager() {
    close();
}

SSHResult SessionManager::establish(StatusCallback callback) {
    if (callback) {
        callback("Connecting to " + target_.host + "...");
    }

    if (!ensure_library()) {
        return SSHResult{-1, "", "Failed to initialize libssh2"};
    }

    std::string error;
    sock_ = platform::connect_tcp(target_.host, target_.port, target_.timeout * 1000, &error);
    if (sock_ == TANDEM_INVALID_SOCKET) {
        sock_ = -1;
        return SSHResult{-1, "", "Failed to connect to " + target_.host + ": " + error};
    }

    // Create SSH session
    session_ = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!session_) {
        close();
        return SSHResult{-1, "", "Failed to create SSH session"};
    }

    libssh2_session_set_blocking(session_, 0);

    // SSH handshake (key exchange)
    int ret;
    while ((ret = libssh2_session_handshake(session_, sock_)) == LIBSSH2_ERROR_EAGAIN) {
        platform::sleep_ms(50);
    }
    if (ret != 0) {
        close();
        return SSHResult{-1, "", "SSH handshake failed"};
    }

    if (callback) callback("SSH handshake complete, authenticating...");

    auto auth_result = ssh_userauth(callback);
    if (auth_result.failed()) {
        tandem_log(fmt::format("ssh: {}", auth_result.stderr_data));
        close();
        return auth_result;
    }

    active_ = true;
    return SSHResult{0, "", ""};
}

bool SessionManager::try_agent() {
    LIBSSH2_AGENT* agent = libssh2_agent_init(session_);
    if (!agent) return false;

    bool ok = false;
    // The agent API is used in blocking mode
    libssh2_session_set_blocking(session_, 1);
    if (libssh2_agent_connect(agent) == 0 && libssh2_agent_list_identities(agent) == 0) {
        struct libssh2_agent_publickey* identity = nullptr;
        struct libssh2_agent_publickey* prev = nullptr;
        while (libssh2_agent_get_identity(agent, &identity, prev) == 0) {
            if (libssh2_agent_userauth(agent, target_.user.c_str(), identity) == 0) {
                ok = true;
                break;
            }
            prev = identity;
        }
        libssh2_agent_disconnect(agent);
    }
    libssh2_agent_free(agent);
    libssh2_session_set_blocking(session_, 0);
    return ok;
}

bool SessionManager::try_key_files() {
    std::vector<fs::path> keys;
    if (target_.ssh_key_path) {
        keys.emplace_back(*target_.ssh_key_path);
    } else {
        auto ssh_dir = platform::home_dir() / ".ssh";
        keys = {ssh_dir / "id_ed25519", ssh_dir / "id_ecdsa", ssh_dir / "id_rsa"};
    }

    for (const auto& key : keys) {
        std::error_code ec;
        if (!fs::exists(key, ec)) continue;
        std::string pub = key.string() + ".pub";
        const char* pub_path = fs::exists(pub, ec) ? pub.c_str() : nullptr;

        int ret;
        while ((ret = libssh2_userauth_publickey_fromfile(
                    session_, target_.user.c_str(), pub_path, key.c_str(),
                    target_.password.empty() ? nullptr : target_.password.c_str())) ==
               LIBSSH2_ERROR_EAGAIN) {
            platform::sleep_ms(50);
        }
        if (ret == 0) return true;
    }
    return false;
}

SSHResult SessionManager::ssh_userauth(StatusCallback callback) {
    // Check what auth methods the server supports
    char* auth_list = nullptr;
    while ((auth_list = libssh2_userauth_list(session_, target_.user.c_str(),
                                              static_cast<unsigned int>(target_.user.length()))) == nullptr) {
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) {
            break;
        }
        platform::sleep_ms(50);
    }

    std::string methods = auth_list ? auth_list : "";
    if (callback && !methods.empty()) {
        callback("Auth methods: " + methods);
    }

    if (methods.find("publickey") != std::string::npos) {
        if (try_agent() || try_key_files()) {
            if (callback) callback("Authentication successful");
            return SSHResult{0, "", ""};
        }
    }

    if (!target_.password.empty() && methods.find("password") != std::string::npos) {
        int ret;
        while ((ret = libssh2_userauth_password(session_,
                target_.user.c_str(), target_.password.c_str())) == LIBSSH2_ERROR_EAGAIN) {
            platform::sleep_ms(50);
        }
        if (ret == 0) {
            if (callback) callback("Authentication successful");
            return SSHResult{0, "", ""};
        }
    }

    return SSHResult{-1, "", "SSH authentication failed for " + target_.user + "@" + target_.host};
}

SSHResult SessionManager::exec(const std::string& command) {
    if (!active_) return SSHResult{-1, "", "SSH session is not established"};

    LIBSSH2_CHANNEL* channel = nullptr;
    while ((channel = libssh2_channel_open_session(session_)) == nullptr) {
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) {
            return SSHResult{-1, "", "Failed to open SSH channel"};
        }
        platform::sleep_ms(50);
    }

    int ret;
    while ((ret = libssh2_channel_exec(channel, command.c_str())) == LIBSSH2_ERROR_EAGAIN) {
        platform::sleep_ms(50);
    }
    if (ret != 0) {
        libssh2_channel_free(channel);
        return SSHResult{-1, "", "Failed to run: " + command};
    }

    SSHResult result{0, "", ""};
    char buf[SSH_READ_BUF_SIZE];
    int64_t deadline = now_ms() + static_cast<int64_t>(target_.timeout) * 1000;
    while (!libssh2_channel_eof(channel)) {
        ssize_t out = libssh2_channel_read(channel, buf, sizeof(buf));
        if (out > 0) result.stdout_data.append(buf, static_cast<size_t>(out));

        ssize_t err = libssh2_channel_read_stderr(channel, buf, sizeof(buf));
        if (err > 0) result.stderr_data.append(buf, static_cast<size_t>(err));

        if (out > 0 || err > 0) continue;
        if ((out < 0 && out != LIBSSH2_ERROR_EAGAIN) || (err < 0 && err != LIBSSH2_ERROR_EAGAIN)) {
            result.exit_code = -1;
            result.stderr_data += "SSH channel read failed";
            break;
        }
        if (now_ms() > deadline) {
            result.exit_code = -1;
            result.stderr_data += "Timed out waiting for: " + command;
            break;
        }
        platform::poll_socket(sock_, POLLIN, 100);
    }

    while (libssh2_channel_close(channel) == LIBSSH2_ERROR_EAGAIN) {
        platform::sleep_ms(20);
    }
    if (result.exit_code == 0) {
        result.exit_code = libssh2_channel_get_exit_status(channel);
    }
    libssh2_channel_free(channel);
    return result;
}

void SessionManager::close() {
    active_ = false;

    if (session_) {
        libssh2_session_disconnect(session_, "Normal disconnection");
        libssh2_session_free(session_);
        session_ = nullptr;
    }

    if (sock_ >= 0) {
        platform::close_socket(sock_);
        sock_ = -1;
    }
}
