#pragma once

/// @file http_transport.h
/// @brief Outbound JSON POST used by the remote moderation providers

#include <chrono>
#include <string>
#include <utility>
#include <vector>

#include <absl/status/statusor.h>

namespace aegis::guardrails {

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

/// @brief Status and body of a completed HTTP exchange
struct HttpResponse {
    int status = 0;
    std::string body;
};

/// @brief Minimal HTTP client seam
///
/// A non-OK status means the exchange did not complete (DNS, connect,
/// timeout, TLS). Any HTTP status code, including 4xx/5xx, is returned
/// as a response and left to the caller to interpret.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual absl::StatusOr<HttpResponse> PostJson(
        const std::string& url,
        const std::string& body,
        const HttpHeaders& headers) const = 0;
};

/// @brief cpp-httplib implementation
///
/// A client is created per request, so concurrent calls share nothing.
class HttplibTransport : public HttpTransport {
public:
    explicit HttplibTransport(std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));

    absl::StatusOr<HttpResponse> PostJson(
        const std::string& url,
        const std::string& body,
        const HttpHeaders& headers) const override;

private:
    std::chrono::milliseconds timeout_;
};

/// @brief Split "https://host:port/path" into {"https://host:port", "/path"}
absl::StatusOr<std::pair<std::string, std::string>> SplitUrl(const std::string& url);

}  // namespace aegis::guardrails
