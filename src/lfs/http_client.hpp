#pragma once

#include <string>
#include <map>
#include <optional>
#include <filesystem>

namespace fs = std::filesystem;

using HttpHeaders = std::map<std::string, std::string>;

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    HttpHeaders headers;
    std::string body;
    std::optional<fs::path> body_file;      // stream the request body from a file
    std::optional<fs::path> response_file;  // stream the response body into a file
    long timeout_secs = 0;                  // 0: no limit
};

struct HttpResponse {
    long status = 0;
    std::string body;                       // empty when response_file was used
};

// Minimal HTTP transport for the LFS batch API and object transfers.
// send() throws LfsError(Network) when no response was received at all;
// any HTTP status, including errors, is returned to the caller.
class HttpClient {
public:
    virtual ~HttpClient() = default;
    virtual HttpResponse send(const HttpRequest& request) = 0;
};
