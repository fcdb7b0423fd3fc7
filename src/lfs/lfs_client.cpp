#include "lfs_client.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <nlohmann/json.hpp>
#include <fmt/format.h>
#include <algorithm>

using json = nlohmann::json;

std::optional<LfsErrorKind> classify_status(long status) {
    if (status >= 200 && status < 300) return std::nullopt;
    if (status == 401 || status == 403) return LfsErrorKind::Auth;
    if (status == 404 || status == 410) return LfsErrorKind::NotFound;
    if (status == 429 || status >= 500) return LfsErrorKind::Network;
    return LfsErrorKind::Protocol;
}

static void check_response(const HttpResponse& response, const std::string& what) {
    auto kind = classify_status(response.status);
    if (!kind) return;
    std::string message = fmt::format("{}: HTTP {}", what, response.status);
    if (!response.body.empty() && response.body.size() < 512) {
        message += " " + response.body;
    }
    throw LfsError(*kind, message);
}

static HttpHeaders parse_headers(const json& node) {
    HttpHeaders headers;
    if (!node.is_object()) return headers;
    for (const auto& [k, v] : node.items()) {
        if (v.is_string()) headers[k] = v.get<std::string>();
    }
    return headers;
}

static std::optional<TransferAction> parse_action(const json& actions, const char* name) {
    if (!actions.is_object() || !actions.contains(name)) return std::nullopt;
    const auto& node = actions[name];
    if (!node.is_object() || !node.contains("href") || !node["href"].is_string()) {
        throw LfsError(LfsErrorKind::Protocol, fmt::format("batch action '{}' has no href", name));
    }
    TransferAction action;
    action.href = node["href"].get<std::string>();
    if (node.contains("header")) action.headers = parse_headers(node["header"]);
    return action;
}

LfsClient::LfsClient(HttpClient& http, EndpointProvider endpoints, RetryPolicy retry)
    : http_(http), endpoints_(std::move(endpoints)), retry_(std::move(retry)) {
    if (!retry_.sleep) retry_.sleep = [](int ms) { platform::sleep_ms(ms); };
    if (retry_.max_attempts < 1) retry_.max_attempts = 1;
}

void LfsClient::with_retry(const std::string& what, const std::function<void()>& op) {
    int delay = retry_.base_delay_ms;
    for (int attempt = 1;; ++attempt) {
        try {
            op();
            return;
        } catch (const LfsError& e) {
            if (!e.retryable() || attempt >= retry_.max_attempts) throw;
            tandem_log(fmt::format("lfs: {} failed (attempt {}/{}): {}",
                                   what, attempt, retry_.max_attempts, e.what()));
            retry_.sleep(delay);
            delay *= 2;
        }
    }
}

// ── Batch API ───────────────────────────────────────────────

std::vector<TransferDescriptor> LfsClient::negotiate_batch(const std::vector<LfsObject>& objects,
                                                           TransferDirection direction) {
    std::vector<TransferDescriptor> out;
    for (size_t i = 0; i < objects.size(); i += LFS_BATCH_SIZE) {
        auto end = std::min(objects.size(), i + LFS_BATCH_SIZE);
        std::vector<LfsObject> chunk(objects.begin() + i, objects.begin() + end);
        auto part = batch_chunk(chunk, direction);
        out.insert(out.end(), part.begin(), part.end());
    }
    return out;
}

std::vector<TransferDescriptor> LfsClient::batch_chunk(const std::vector<LfsObject>& chunk,
                                                       TransferDirection direction) {
    json request;
    request["operation"] = direction_name(direction);
    request["transfers"] = json::array({"basic"});
    request["objects"] = json::array();
    for (const auto& obj : chunk) {
        request["objects"].push_back({{"oid", obj.oid}, {"size", obj.size}});
    }

    HttpResponse response;
    with_retry("batch " + direction_name(direction), [&] {
        LfsEndpoint endpoint = endpoints_(direction);
        HttpRequest req;
        req.method = "POST";
        req.url = endpoint.url + "/objects/batch";
        req.headers = endpoint.headers;
        req.headers["Accept"] = LFS_MEDIA_TYPE;
        req.headers["Content-Type"] = LFS_MEDIA_TYPE;
        req.body = request.dump();
        req.timeout_secs = LFS_HTTP_TIMEOUT_SECS;
        response = http_.send(req);
        check_response(response, "batch " + direction_name(direction));
    });

    json doc;
    try {
        doc = json::parse(response.body);
    } catch (const json::exception& e) {
        throw LfsError(LfsErrorKind::Protocol, std::string("batch response is not JSON: ") + e.what());
    }
    if (!doc.is_object() || !doc.contains("objects") || !doc["objects"].is_array()) {
        throw LfsError(LfsErrorKind::Protocol, "batch response has no objects array");
    }

    std::vector<TransferDescriptor> descriptors;
    for (const auto& node : doc["objects"]) {
        if (!node.is_object() || !node.contains("oid") || !node["oid"].is_string()) {
            throw LfsError(LfsErrorKind::Protocol, "batch response object without oid");
        }
        TransferDescriptor d;
        d.object.oid = node["oid"].get<std::string>();
        d.object.size = node.value("size", uint64_t{0});

        if (node.contains("error") && node["error"].is_object()) {
            d.error_code = node["error"].value("code", 0);
            d.error_message = node["error"].value("message", std::string());
            descriptors.push_back(d);
            continue;
        }

        if (node.contains("actions")) {
            const auto& actions = node["actions"];
            d.action = parse_action(actions, direction == TransferDirection::Upload ? "upload" : "download");
            if (direction == TransferDirection::Upload) d.verify = parse_action(actions, "verify");
        }
        descriptors.push_back(d);
    }
    return descriptors;
}

// ── Transfers ───────────────────────────────────────────────

void LfsClient::download(const TransferDescriptor& descriptor, const fs::path& dest) {
    if (!descriptor.action) {
        throw LfsError(descriptor.error_code == 404 ? LfsErrorKind::NotFound : LfsErrorKind::Protocol,
                       fmt::format("no download action for {}{}", descriptor.object.oid,
                                   descriptor.error_message.empty() ? "" : ": " + descriptor.error_message));
    }

    std::error_code ec;
    if (dest.has_parent_path()) fs::create_directories(dest.parent_path(), ec);
    fs::path tmp = dest;
    tmp += ".download." + std::to_string(platform::current_pid());

    with_retry("download " + descriptor.object.oid, [&] {
        HttpRequest req;
        req.method = "GET";
        req.url = descriptor.action->href;
        req.headers = descriptor.action->headers;
        req.response_file = tmp;
        req.timeout_secs = LFS_HTTP_TIMEOUT_SECS;

        HttpResponse response;
        try {
            response = http_.send(req);
            check_response(response, "download " + descriptor.object.oid);
        } catch (const LfsError&) {
            std::error_code rm;
            fs::remove(tmp, rm);
            throw;
        }

        auto digest = sha256_file_hex(tmp);
        if (!digest || *digest != descriptor.object.oid) {
            std::error_code rm;
            fs::remove(tmp, rm);
            throw LfsError(LfsErrorKind::Integrity,
                           fmt::format("downloaded bytes for {} hash to {}", descriptor.object.oid,
                                       digest.value_or("<unreadable>")));
        }
    });

    fs::rename(tmp, dest, ec);
    if (ec) {
        std::error_code rm;
        fs::remove(tmp, rm);
        throw LfsError(LfsErrorKind::Protocol,
                       fmt::format("cannot move payload into {}: {}", dest.string(), ec.message()));
    }
}

void LfsClient::upload(const TransferDescriptor& descriptor, const fs::path& source) {
    if (!descriptor.action) return;   // server already has it

    with_retry("upload " + descriptor.object.oid, [&] {
        HttpRequest req;
        req.method = "PUT";
        req.url = descriptor.action->href;
        req.headers = descriptor.action->headers;
        if (req.headers.find("Content-Type") == req.headers.end()) {
            req.headers["Content-Type"] = "application/octet-stream";
        }
        req.body_file = source;
        req.timeout_secs = LFS_HTTP_TIMEOUT_SECS;
        check_response(http_.send(req), "upload " + descriptor.object.oid);
    });

    if (!descriptor.verify) return;

    json body = {{"oid", descriptor.object.oid}, {"size", descriptor.object.size}};
    with_retry("verify " + descriptor.object.oid, [&] {
        HttpRequest req;
        req.method = "POST";
        req.url = descriptor.verify->href;
        req.headers = descriptor.verify->headers;
        req.headers["Accept"] = LFS_MEDIA_TYPE;
        req.headers["Content-Type"] = LFS_MEDIA_TYPE;
        req.body = body.dump();
        req.timeout_secs = LFS_HTTP_TIMEOUT_SECS;
        check_response(http_.send(req), "verify " + descriptor.object.oid);
    });
}
