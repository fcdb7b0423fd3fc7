#pragma once

#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <filesystem>
#include <cstdint>
#include <core/constants.hpp>
#include "http_client.hpp"
#include "lfs_endpoint.hpp"
#include "lfs_error.hpp"

namespace fs = std::filesystem;

struct LfsObject {
    std::string oid;
    uint64_t size = 0;
};

struct TransferAction {
    std::string href;
    HttpHeaders headers;
};

// One object's entry in a batch response. `action` is empty when the server
// needs nothing done (upload of an object it already has) or refused it.
struct TransferDescriptor {
    LfsObject object;
    std::optional<TransferAction> action;
    std::optional<TransferAction> verify;   // upload only
    int error_code = 0;                     // per-object error from the server
    std::string error_message;
};

struct RetryPolicy {
    int max_attempts = LFS_TRANSFER_MAX_ATTEMPTS;
    int base_delay_ms = LFS_RETRY_DELAY_MS;  // doubled after every failed attempt
    std::function<void(int)> sleep;          // default: platform::sleep_ms
};

// Client for the LFS batch API and basic transfer adapter.
// All failures surface as LfsError; retryable ones are retried per RetryPolicy.
class LfsClient {
public:
    LfsClient(HttpClient& http, EndpointProvider endpoints, RetryPolicy retry = {});

    std::vector<TransferDescriptor> negotiate_batch(const std::vector<LfsObject>& objects,
                                                    TransferDirection direction);

    // GET the object into `dest`. Bytes land in a sibling temp file, are
    // checked against the oid, then renamed into place.
    void download(const TransferDescriptor& descriptor, const fs::path& dest);

    // PUT `source`, then call the verify action if the server gave one.
    void upload(const TransferDescriptor& descriptor, const fs::path& source);

private:
    HttpClient& http_;
    EndpointProvider endpoints_;
    RetryPolicy retry_;

    std::vector<TransferDescriptor> batch_chunk(const std::vector<LfsObject>& chunk,
                                                TransferDirection direction);
    void with_retry(const std::string& what, const std::function<void()>& op);
};

// Map an HTTP status to the error kind it implies (nullopt for 2xx).
std::optional<LfsErrorKind> classify_status(long status);
