#include "curl_http_client.hpp"
#include "lfs_error.hpp"
#include <core/log.hpp>
#include <curl/curl.h>
#include <fmt/format.h>
#include <cstdio>
#include <memory>

namespace {

struct GlobalInit {
    GlobalInit() { curl_global_init(CURL_GLOBAL_DEFAULT); }
    ~GlobalInit() { curl_global_cleanup(); }
};

struct CurlCloser {
    void operator()(CURL* c) const { if (c) curl_easy_cleanup(c); }
};
struct SlistCloser {
    void operator()(curl_slist* l) const { if (l) curl_slist_free_all(l); }
};
struct FileCloser {
    void operator()(std::FILE* f) const { if (f) std::fclose(f); }
};

using CurlPtr = std::unique_ptr<CURL, CurlCloser>;
using SlistPtr = std::unique_ptr<curl_slist, SlistCloser>;
using FilePtr = std::unique_ptr<std::FILE, FileCloser>;

size_t write_to_string(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

size_t write_to_file(char* ptr, size_t size, size_t nmemb, void* userdata) {
    return std::fwrite(ptr, size, nmemb, static_cast<std::FILE*>(userdata)) * size;
}

size_t read_from_file(char* buffer, size_t size, size_t nitems, void* userdata) {
    return std::fread(buffer, size, nitems, static_cast<std::FILE*>(userdata)) * size;
}

} // namespace

CurlHttpClient::CurlHttpClient() {
    static GlobalInit init;
}

HttpResponse CurlHttpClient::send(const HttpRequest& request) {
    CurlPtr curl(curl_easy_init());
    if (!curl) throw LfsError(LfsErrorKind::Network, "curl_easy_init failed");

    CURL* c = curl.get();
    curl_easy_setopt(c, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(c, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(c, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(c, CURLOPT_CONNECTTIMEOUT, 30L);
    if (request.timeout_secs > 0) {
        curl_easy_setopt(c, CURLOPT_TIMEOUT, request.timeout_secs);
    }

    curl_slist* raw_headers = nullptr;
    for (const auto& [k, v] : request.headers) {
        std::string line = k + ": " + v;
        curl_slist* next = curl_slist_append(raw_headers, line.c_str());
        if (!next) {
            curl_slist_free_all(raw_headers);
            throw LfsError(LfsErrorKind::Network, "curl_slist_append failed");
        }
        raw_headers = next;
    }
    SlistPtr headers(raw_headers);
    if (headers) curl_easy_setopt(c, CURLOPT_HTTPHEADER, headers.get());

    FilePtr upload;
    if (request.body_file) {
        upload.reset(std::fopen(request.body_file->c_str(), "rb"));
        if (!upload) {
            throw LfsError(LfsErrorKind::Integrity, "cannot open " + request.body_file->string());
        }
        std::error_code ec;
        auto size = fs::file_size(*request.body_file, ec);
        curl_easy_setopt(c, CURLOPT_UPLOAD, 1L);
        curl_easy_setopt(c, CURLOPT_READFUNCTION, read_from_file);
        curl_easy_setopt(c, CURLOPT_READDATA, upload.get());
        curl_easy_setopt(c, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(ec ? 0 : size));
        curl_easy_setopt(c, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    } else if (request.method == "POST") {
        curl_easy_setopt(c, CURLOPT_POST, 1L);
        curl_easy_setopt(c, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(c, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
    } else if (request.method != "GET") {
        curl_easy_setopt(c, CURLOPT_CUSTOMREQUEST, request.method.c_str());
        if (!request.body.empty()) {
            curl_easy_setopt(c, CURLOPT_POSTFIELDS, request.body.c_str());
            curl_easy_setopt(c, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
        }
    }

    HttpResponse response;
    FilePtr download;
    if (request.response_file) {
        download.reset(std::fopen(request.response_file->c_str(), "wb"));
        if (!download) {
            throw LfsError(LfsErrorKind::Integrity, "cannot write " + request.response_file->string());
        }
        curl_easy_setopt(c, CURLOPT_WRITEFUNCTION, write_to_file);
        curl_easy_setopt(c, CURLOPT_WRITEDATA, download.get());
    } else {
        curl_easy_setopt(c, CURLOPT_WRITEFUNCTION, write_to_string);
        curl_easy_setopt(c, CURLOPT_WRITEDATA, &response.body);
    }

    CURLcode rc = curl_easy_perform(c);
    if (rc != CURLE_OK) {
        std::string msg = fmt::format("{} {}: {}", request.method, request.url, curl_easy_strerror(rc));
        tandem_log("http: " + msg);
        throw LfsError(LfsErrorKind::Network, msg);
    }
    curl_easy_getinfo(c, CURLINFO_RESPONSE_CODE, &response.status);

    if (download && std::fflush(download.get()) != 0) {
        throw LfsError(LfsErrorKind::Integrity, "short write to " + request.response_file->string());
    }
    return response;
}
