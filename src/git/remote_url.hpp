#pragma once

#include <string>
#include <optional>

// A git remote address split into its parts. Handles URL forms
// (https://user:pw@host:port/path.git, ssh://git@host/path) and the
// scp-like form (git@host:group/project.git).
struct RemoteUrl {
    std::string scheme;             // "https", "http", "ssh", "git", "file"
    std::string user;
    std::string password;
    std::string host;
    int port = 0;                   // 0 when not given
    std::string path;               // without leading '/'

    bool is_http() const { return scheme == "http" || scheme == "https"; }
    bool is_ssh() const { return scheme == "ssh"; }

    // Explicit port, or the scheme's default
    int effective_port() const;
};

std::optional<RemoteUrl> parse_remote_url(const std::string& url);
