/// @file http_transport.cpp
/// @brief cpp-httplib transport

#include "guardrails/http_transport.h"

#include <cctype>
#include <regex>

#include <httplib.h>

#include "common/error.h"
#include "common/logging.h"

namespace aegis::guardrails {

absl::StatusOr<std::pair<std::string, std::string>> SplitUrl(const std::string& url) {
    static const std::regex url_regex(R"((https?)://([^/?#]+)([^#]*))", std::regex::icase);

    std::smatch match;
    if (!std::regex_match(url, match, url_regex)) {
        return MakeError(ErrorCode::kInvalidArgument, "Invalid endpoint URL: " + url);
    }

    std::string scheme = match[1].str();
    for (auto& c : scheme) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    std::string path = match[3].str();
    if (path.empty()) {
        path = "/";
    }
    return std::make_pair(scheme + "://" + match[2].str(), path);
}

HttplibTransport::HttplibTransport(std::chrono::milliseconds timeout)
    : timeout_(timeout) {}

absl::StatusOr<HttpResponse> HttplibTransport::PostJson(
    const std::string& url,
    const std::string& body,
    const HttpHeaders& headers) const {

    AEGIS_ASSIGN_OR_RETURN(auto parts, SplitUrl(url));

    httplib::Client client(parts.first);
    client.set_connection_timeout(timeout_);
    client.set_read_timeout(timeout_);
    client.set_write_timeout(timeout_);

    httplib::Headers request_headers;
    for (const auto& [name, value] : headers) {
        request_headers.emplace(name, value);
    }

    auto result = client.Post(parts.second, request_headers, body, "application/json");
    if (!result) {
        const auto error = result.error();
        AEGIS_LOG_DEBUG("POST {} failed: {}", parts.first, httplib::to_string(error));
        if (error == httplib::Error::Read || error == httplib::Error::Write) {
            return MakeError(ErrorCode::kProviderTimeout,
                             "Request to " + parts.first + " timed out or was interrupted: " +
                             httplib::to_string(error));
        }
        return MakeError(ErrorCode::kProviderUnavailable,
                         "Request to " + parts.first + " failed: " + httplib::to_string(error));
    }

    return HttpResponse{result->status, result->body};
}

}  // namespace aegis::guardrails
