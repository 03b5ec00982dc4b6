#pragma once

/// @file llm_moderation_provider.h
/// @brief Moderation through an OpenAI-compatible chat completions endpoint

#include <memory>
#include <string>

#include "guardrails/http_transport.h"
#include "guardrails/moderation_provider.h"

namespace aegis::guardrails {

/// @brief Asks a chat model to classify content into the taxonomy
///
/// The model is instructed to answer with a JSON object of the form
/// {"flagged": bool, "categories": {...}, "category_scores": {...}}.
class LlmModerationProvider : public ModerationProvider {
public:
    static constexpr const char* kDefaultUrl = "https://api.openai.com/v1/chat/completions";
    static constexpr const char* kDefaultModel = "gpt-4o-mini";

    LlmModerationProvider(RemoteEndpoint endpoint,
                          std::shared_ptr<const HttpTransport> transport);

    absl::StatusOr<ModerationResult> Moderate(const std::string& content) const override;

    ProviderKind Kind() const override { return ProviderKind::kLLM; }
    bool IsAvailable() const override { return !endpoint_.api_key.empty(); }

    /// @brief System prompt sent with every request
    static const std::string& SystemPrompt();

private:
    RemoteEndpoint endpoint_;
    std::shared_ptr<const HttpTransport> transport_;
};

/// @brief Parse a chat completions body whose message content is the verdict
absl::StatusOr<ModerationResult> ParseLlmModerationResponse(const std::string& body);

}  // namespace aegis::guardrails
