#pragma once

#include <string>

namespace infra::http {

struct HttpResponse {
    unsigned status = 0U;
    std::string body;
    std::string usedWeightHeader;
    std::string finalHost;
    std::string finalTarget;

    bool ok() const noexcept { return status >= 200U && status < 300U; }
};

struct HttpRequestOptions {
    std::string port = "443";
    int timeoutSec = 10;
    bool verifyPeer = true;
};

// Performs an HTTPS GET expecting a JSON payload, following up to five redirects.
// Throws std::runtime_error on DNS, connect, TLS, I/O errors and timeouts; HTTP
// status codes are returned to the caller untouched.
HttpResponse httpsGet(const std::string& host, const std::string& target, const HttpRequestOptions& options = {});

}  // namespace infra::http
