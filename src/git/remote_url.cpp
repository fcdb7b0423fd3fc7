#include "remote_url.hpp"
#include <core/utils.hpp>

int RemoteUrl::effective_port() const {
    if (port > 0) return port;
    if (scheme == "https") return 443;
    if (scheme == "http") return 80;
    if (scheme == "ssh") return 22;
    if (scheme == "git") return 9418;
    return 0;
}

static void split_userinfo(const std::string& userinfo, RemoteUrl& out) {
    auto colon = userinfo.find(':');
    if (colon == std::string::npos) {
        out.user = userinfo;
    } else {
        out.user = userinfo.substr(0, colon);
        out.password = userinfo.substr(colon + 1);
    }
}

std::optional<RemoteUrl> parse_remote_url(const std::string& url) {
    RemoteUrl out;

    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        // scp-like: [user@]host:path
        auto colon = url.find(':');
        if (colon == std::string::npos || url.find('/') < colon) {
            return std::nullopt;
        }
        std::string authority = url.substr(0, colon);
        auto at = authority.rfind('@');
        if (at != std::string::npos) {
            out.user = authority.substr(0, at);
            authority = authority.substr(at + 1);
        }
        if (authority.empty()) return std::nullopt;
        out.scheme = "ssh";
        out.host = authority;
        out.path = url.substr(colon + 1);
        while (starts_with(out.path, "/")) out.path.erase(0, 1);
        return out;
    }

    out.scheme = url.substr(0, scheme_end);
    std::string rest = url.substr(scheme_end + 3);
    if (out.scheme == "file") {
        out.path = rest;
        return out;
    }

    auto slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    out.path = slash == std::string::npos ? "" : rest.substr(slash + 1);

    auto at = authority.rfind('@');
    if (at != std::string::npos) {
        split_userinfo(authority.substr(0, at), out);
        authority = authority.substr(at + 1);
    }

    // [v6]:port or host:port
    std::string host = authority;
    std::string port;
    if (!authority.empty() && authority[0] == '[') {
        auto close = authority.find(']');
        if (close == std::string::npos) return std::nullopt;
        host = authority.substr(1, close - 1);
        if (close + 1 < authority.size() && authority[close + 1] == ':') {
            port = authority.substr(close + 2);
        }
    } else {
        auto colon = authority.rfind(':');
        if (colon != std::string::npos) {
            host = authority.substr(0, colon);
            port = authority.substr(colon + 1);
        }
    }
    if (host.empty()) return std::nullopt;
    out.host = host;
    if (!port.empty()) {
        out.port = safe_stoi(port, 0);
        if (out.port <= 0) return std::nullopt;
    }
    return out;
}
