#include "infra/http/TlsHttpClient.hpp"

#include <chrono>
#include <functional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

#include <openssl/err.h>

namespace infra::http {
namespace {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;

constexpr int kMaxRedirects = 5;

std::runtime_error makeError(const std::string& host, const std::string& target, const std::string& message) {
    std::ostringstream oss;
    oss << "HTTPS GET request to https://" << host << target << " failed: " << message;
    return std::runtime_error(oss.str());
}

struct ParsedLocation {
    std::string host;
    std::string target;
};

ParsedLocation parseRedirectLocation(const std::string& location, const std::string& currentHost) {
    if (location.empty()) {
        throw std::runtime_error("Redirect response missing Location header");
    }

    ParsedLocation result{};

    if (location.rfind("https://", 0) == 0) {
        const std::string withoutScheme = location.substr(std::string{"https://"}.size());
        const auto slashPos = withoutScheme.find('/');
        std::string hostPart = slashPos == std::string::npos ? withoutScheme : withoutScheme.substr(0, slashPos);
        if (hostPart.empty()) {
            throw std::runtime_error("Redirect URL missing host");
        }
        const auto colonPos = hostPart.find(':');
        if (colonPos != std::string::npos) {
            const std::string portPart = hostPart.substr(colonPos + 1);
            if (portPart != "443") {
                throw std::runtime_error("Redirect to unsupported HTTPS port: " + portPart);
            }
            hostPart = hostPart.substr(0, colonPos);
        }
        result.host = hostPart;
        result.target = slashPos == std::string::npos ? std::string{"/"} : withoutScheme.substr(slashPos);
    } else if (location.rfind("http://", 0) == 0) {
        throw std::runtime_error("Insecure redirect to HTTP is not supported");
    } else {
        result.host = currentHost;
        result.target = location.front() == '/' ? location : "/" + location;
    }

    return result;
}

http::response<http::string_body> performRequest(const std::string& host,
                                                 const std::string& target,
                                                 const HttpRequestOptions& options) {
    if (options.timeoutSec <= 0) {
        throw makeError(host, target, "timeout must be positive");
    }
    const auto timeout = std::chrono::seconds(options.timeoutSec);

    net::io_context ioc;
    ssl::context sslContext(ssl::context::tls_client);
    if (options.verifyPeer) {
        sslContext.set_default_verify_paths();
        sslContext.set_verify_mode(ssl::verify_peer);
    } else {
        sslContext.set_verify_mode(ssl::verify_none);
    }

    beast::ssl_stream<beast::tcp_stream> stream(ioc, sslContext);
    if (options.verifyPeer) {
        stream.set_verify_callback(ssl::host_name_verification(host));
    }

    if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str())) {
        const unsigned long err = ::ERR_get_error();
        const char* reason = err != 0 ? ::ERR_reason_error_string(err) : nullptr;
        std::ostringstream oss;
        oss << "Failed to set SNI hostname to '" << host << "'";
        if (reason != nullptr) {
            oss << ": " << reason;
        }
        throw makeError(host, target, oss.str());
    }

    // The synchronous calls do not honour expires_after, so every step, name
    // resolution included, runs through the io_context with a deadline.
    net::ip::tcp::resolver resolver(ioc);
    auto& lowestLayer = beast::get_lowest_layer(stream);
    beast::error_code ec;
    auto runStep = [&](const char* what, const std::function<void()>& cancel) {
        ioc.restart();
        ioc.run_for(timeout);
        if (!ioc.stopped()) {
            cancel();
            ioc.run();
            throw makeError(host, target, std::string{what} + " timed out");
        }
        if (ec) {
            throw makeError(host, target, std::string{what} + " error: " + ec.message());
        }
    };
    const auto cancelSocket = [&lowestLayer]() { lowestLayer.cancel(); };

    net::ip::tcp::resolver::results_type results;
    resolver.async_resolve(host,
                           options.port,
                           [&](beast::error_code resolveEc, net::ip::tcp::resolver::results_type resolved) {
                               ec = resolveEc;
                               results = std::move(resolved);
                           });
    runStep("DNS resolution", [&resolver]() { resolver.cancel(); });

    lowestLayer.expires_after(timeout);
    lowestLayer.async_connect(results, [&](beast::error_code connectEc, const net::ip::tcp::endpoint&) {
        ec = connectEc;
    });
    runStep("Connection", cancelSocket);

    lowestLayer.expires_after(timeout);
    stream.async_handshake(ssl::stream_base::client, [&](beast::error_code handshakeEc) { ec = handshakeEc; });
    runStep("TLS handshake", cancelSocket);

    http::request<http::empty_body> req{http::verb::get, target, 11};
    req.set(http::field::host, host);
    req.set(http::field::user_agent, std::string{"candlesync/1.0 "} + BOOST_BEAST_VERSION_STRING);
    req.set(http::field::accept, "application/json");
    req.set(http::field::connection, "close");

    lowestLayer.expires_after(timeout);
    http::async_write(stream, req, [&](beast::error_code writeEc, std::size_t) { ec = writeEc; });
    runStep("Write", cancelSocket);

    beast::flat_buffer buffer;
    http::response<http::string_body> response;
    lowestLayer.expires_after(timeout);
    http::async_read(stream, buffer, response, [&](beast::error_code readEc, std::size_t) { ec = readEc; });
    runStep("Read", cancelSocket);

    // Shutdown errors are irrelevant once the full response has been read.
    lowestLayer.expires_after(std::chrono::seconds(2));
    stream.async_shutdown([](beast::error_code) {});
    ioc.restart();
    ioc.run_for(std::chrono::seconds(2));

    return response;
}

}  // namespace

HttpResponse httpsGet(const std::string& host, const std::string& target, const HttpRequestOptions& options) {
    if (host.empty()) {
        throw std::runtime_error("HTTPS GET requires a non-empty host");
    }

    std::string currentHost = host;
    std::string currentTarget = target.empty() ? std::string{"/"} : target;
    if (currentTarget.front() != '/') {
        currentTarget.insert(currentTarget.begin(), '/');
    }

    for (int redirectCount = 0; redirectCount <= kMaxRedirects; ++redirectCount) {
        auto response = performRequest(currentHost, currentTarget, options);
        const auto status = static_cast<unsigned>(response.result_int());
        if (status == 301U || status == 302U || status == 307U || status == 308U) {
            try {
                const auto locationHeader = response.base()[http::field::location];
                const auto parsed = parseRedirectLocation(std::string(locationHeader), currentHost);
                currentHost = parsed.host;
                currentTarget = parsed.target;
                continue;
            } catch (const std::exception& redirectError) {
                throw makeError(currentHost, currentTarget, redirectError.what());
            }
        }

        HttpResponse result{};
        result.status = status;
        result.body = std::move(response.body());
        result.finalHost = currentHost;
        result.finalTarget = currentTarget;
        if (auto it = response.base().find("X-MBX-USED-WEIGHT-1M"); it != response.base().end()) {
            result.usedWeightHeader = std::string{it->value()};
        }
        return result;
    }

    throw makeError(currentHost, currentTarget, "Too many redirects");
}

}  // namespace infra::http
