#include "lfs_endpoint.hpp"
#include "lfs_error.hpp"
#include <git/remote_url.hpp>
#include <ssh/session.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <nlohmann/json.hpp>
#include <fmt/format.h>
#include <map>
#include <memory>

using json = nlohmann::json;

std::string direction_name(TransferDirection direction) {
    return direction == TransferDirection::Upload ? "upload" : "download";
}

std::optional<std::string> derive_lfs_url(const std::string& remote_url) {
    auto parsed = parse_remote_url(remote_url);
    if (!parsed || !parsed->is_http()) return std::nullopt;

    std::string url = strip_url_credentials(remote_url);
    while (!url.empty() && url.back() == '/') url.pop_back();
    if (url.size() < 4 || url.compare(url.size() - 4, 4, ".git") != 0) {
        url += ".git";
    }
    return url + "/info/lfs";
}

HttpHeaders basic_auth_headers(const std::string& user, const std::string& password) {
    HttpHeaders headers;
    if (user.empty() && password.empty()) return headers;
    headers["Authorization"] = "Basic " + base64_encode(user + ":" + password);
    return headers;
}

std::optional<LfsEndpoint> parse_ssh_authenticate(const std::string& output) {
    try {
        auto doc = json::parse(output);
        if (!doc.is_object() || !doc.contains("href") || !doc["href"].is_string()) {
            return std::nullopt;
        }
        LfsEndpoint endpoint;
        endpoint.url = doc["href"].get<std::string>();
        while (!endpoint.url.empty() && endpoint.url.back() == '/') endpoint.url.pop_back();
        if (doc.contains("header") && doc["header"].is_object()) {
            for (const auto& [k, v] : doc["header"].items()) {
                if (v.is_string()) endpoint.headers[k] = v.get<std::string>();
            }
        }
        return endpoint;
    } catch (const json::exception&) {
        return std::nullopt;
    }
}

static LfsEndpoint ssh_authenticate(const RemoteUrl& remote, const GitCredentials& creds,
                                    TransferDirection direction) {
    SessionTarget target;
    target.host = remote.host;
    target.port = remote.effective_port();
    target.user = remote.user.empty() ? "git" : remote.user;
    target.password = remote.password;

    SessionManager session(target);
    auto established = session.establish();
    if (established.failed()) {
        throw LfsError(LfsErrorKind::Auth, established.get_output());
    }

    std::string path = remote.path;
    std::string command = fmt::format("git-lfs-authenticate '{}' {}", path, direction_name(direction));
    auto result = session.exec(command);
    if (result.failed()) {
        throw LfsError(LfsErrorKind::Protocol,
                       fmt::format("{} failed: {}", command, result.get_output()));
    }

    auto endpoint = parse_ssh_authenticate(result.stdout_data);
    if (!endpoint) {
        throw LfsError(LfsErrorKind::Protocol, "unexpected git-lfs-authenticate output");
    }
    // Servers that omit auth headers expect the git credentials
    if (endpoint->headers.find("Authorization") == endpoint->headers.end() && !creds.empty()) {
        auto basic = basic_auth_headers(creds.username, creds.password);
        endpoint->headers.insert(basic.begin(), basic.end());
    }
    tandem_log(fmt::format("lfs: ssh endpoint for {} is {}", direction_name(direction), endpoint->url));
    return *endpoint;
}

EndpointProvider make_endpoint_provider(const std::string& remote_url,
                                        const GitCredentials& creds,
                                        const std::string& override_url) {
    auto parsed = parse_remote_url(remote_url);

    HttpHeaders auth = basic_auth_headers(creds.username, creds.password);
    if (auth.empty() && parsed && parsed->is_http()) {
        auth = basic_auth_headers(parsed->user, parsed->password);
    }

    if (!override_url.empty()) {
        LfsEndpoint fixed{strip_url_credentials(override_url), auth};
        return [fixed](TransferDirection) { return fixed; };
    }

    if (auto url = derive_lfs_url(remote_url)) {
        LfsEndpoint fixed{*url, auth};
        return [fixed](TransferDirection) { return fixed; };
    }

    if (parsed && parsed->is_ssh()) {
        auto cache = std::make_shared<std::map<TransferDirection, LfsEndpoint>>();
        RemoteUrl remote = *parsed;
        GitCredentials c = creds;
        return [cache, remote, c](TransferDirection direction) {
            auto it = cache->find(direction);
            if (it != cache->end()) return it->second;
            auto endpoint = ssh_authenticate(remote, c, direction);
            (*cache)[direction] = endpoint;
            return endpoint;
        };
    }

    std::string shown = strip_url_credentials(remote_url);
    return [shown](TransferDirection) -> LfsEndpoint {
        throw LfsError(LfsErrorKind::Protocol, "no LFS endpoint for remote " + shown);
    };
}
