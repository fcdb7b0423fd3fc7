#pragma once

#include <string>
#include <optional>
#include <functional>
#include <core/types.hpp>
#include "http_client.hpp"

enum class TransferDirection {
    Upload,
    Download,
};

std::string direction_name(TransferDirection direction);   // "upload" / "download"

// Base URL of the LFS API ("{url}/objects/batch" is the batch call) plus
// the headers every request to it needs.
struct LfsEndpoint {
    std::string url;
    HttpHeaders headers;
};

using EndpointProvider = std::function<LfsEndpoint(TransferDirection)>;

// https://host/group/repo(.git) -> https://host/group/repo.git/info/lfs
// Embedded credentials are removed. nullopt for non-http remotes.
std::optional<std::string> derive_lfs_url(const std::string& remote_url);

HttpHeaders basic_auth_headers(const std::string& user, const std::string& password);

// Parse the JSON printed by `git-lfs-authenticate`: {"href", "header", ...}
std::optional<LfsEndpoint> parse_ssh_authenticate(const std::string& output);

// Endpoint for a git remote. An explicit `override_url` wins; http(s)
// remotes use basic auth from `creds` (or the URL's own user info); ssh
// remotes ask the server through git-lfs-authenticate, once per direction.
// The provider throws LfsError when no endpoint can be obtained.
EndpointProvider make_endpoint_provider(const std::string& remote_url,
                                        const GitCredentials& creds,
                                        const std::string& override_url = "");
