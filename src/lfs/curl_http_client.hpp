#pragma once

#include "http_client.hpp"

// HttpClient over libcurl's easy interface. One handle per request.
class CurlHttpClient : public HttpClient {
public:
    CurlHttpClient();
    HttpResponse send(const HttpRequest& request) override;
};
