/// @file openai_moderation_provider.cpp
/// @brief OpenAI moderation endpoint client

#include "guardrails/openai_moderation_provider.h"

#include <nlohmann/json.hpp>

#include "common/error.h"
#include "common/logging.h"

namespace aegis::guardrails {

using json = nlohmann::json;

OpenAIModerationProvider::OpenAIModerationProvider(
    RemoteEndpoint endpoint,
    std::shared_ptr<const HttpTransport> transport)
    : endpoint_(std::move(endpoint)), transport_(std::move(transport)) {
    if (endpoint_.url.empty()) {
        endpoint_.url = kDefaultUrl;
    }
    if (endpoint_.model.empty()) {
        endpoint_.model = kDefaultModel;
    }
}

absl::StatusOr<ModerationResult> OpenAIModerationProvider::Moderate(
    const std::string& content) const {
    if (!IsAvailable()) {
        return MakeError(ErrorCode::kProviderUnavailable, "OpenAI moderation API key not configured");
    }
    if (!transport_) {
        return MakeError(ErrorCode::kProviderUnavailable, "No HTTP transport configured");
    }

    json request_body;
    request_body["input"] = content;
    request_body["model"] = endpoint_.model;

    HttpHeaders headers = {
        {"Authorization", "Bearer " + endpoint_.api_key},
    };

    AEGIS_ASSIGN_OR_RETURN(
        auto response,
        transport_->PostJson(endpoint_.url,
                             request_body.dump(-1, ' ', false, json::error_handler_t::replace),
                             headers));

    if (response.status < 200 || response.status >= 300) {
        AEGIS_LOG_DEBUG("Moderation API returned {}: {}", response.status, response.body);
        return MakeError(ErrorCode::kProviderUnavailable,
                         "Moderation API returned HTTP " + std::to_string(response.status));
    }

    return ParseOpenAIModerationResponse(response.body);
}

absl::StatusOr<ModerationResult> ParseOpenAIModerationResponse(const std::string& body) {
    json response;
    try {
        response = json::parse(body);
    } catch (const json::exception& e) {
        return MakeError(ErrorCode::kMalformedResponse,
                         std::string("Failed to parse moderation response: ") + e.what());
    }

    if (!response.is_object() || !response.contains("results") ||
        !response["results"].is_array() || response["results"].empty()) {
        return MakeError(ErrorCode::kMalformedResponse, "Moderation response has no results");
    }

    return ModerationResultFromJson(response["results"][0], ProviderKind::kOpenAI);
}

}  // namespace aegis::guardrails
