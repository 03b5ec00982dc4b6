#pragma once

/// @file openai_moderation_provider.h
/// @brief OpenAI moderation endpoint client

#include <memory>
#include <string>

#include "guardrails/http_transport.h"
#include "guardrails/moderation_provider.h"

namespace aegis::guardrails {

/// @brief Calls POST /v1/moderations and maps results[0] onto the taxonomy
///
/// Non-2xx responses, transport errors and unparseable bodies come back
/// as non-OK statuses. Unavailable when no API key is configured.
class OpenAIModerationProvider : public ModerationProvider {
public:
    static constexpr const char* kDefaultUrl = "https://api.openai.com/v1/moderations";
    static constexpr const char* kDefaultModel = "omni-moderation-latest";

    OpenAIModerationProvider(RemoteEndpoint endpoint,
                             std::shared_ptr<const HttpTransport> transport);

    absl::StatusOr<ModerationResult> Moderate(const std::string& content) const override;

    ProviderKind Kind() const override { return ProviderKind::kOpenAI; }
    bool IsAvailable() const override { return !endpoint_.api_key.empty(); }

private:
    RemoteEndpoint endpoint_;
    std::shared_ptr<const HttpTransport> transport_;
};

/// @brief Parse a moderation API response body
absl::StatusOr<ModerationResult> ParseOpenAIModerationResponse(const std::string& body);

}  // namespace aegis::guardrails
