#pragma once

/// @file content_moderator.h
/// @brief Provider resolution, failure policy and block decision for moderation
///
/// ContentModerator owns one instance of each provider, built at
/// construction. Moderate() picks one per call and never fails: a remote
/// provider error is resolved through the configured failure policy and
/// surfaces as ModerationResult::degraded.

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/statusor.h>

#include "guardrails/http_transport.h"
#include "guardrails/moderation_provider.h"
#include "guardrails/pattern_moderation_provider.h"
#include "guardrails/types.h"

namespace aegis::guardrails {

/// @brief Configured provider choice
enum class ProviderSelection {
    kAuto,     ///< OpenAI when an API key is present, otherwise pattern
    kOpenAI,
    kPattern,
    kLLM
};

/// @brief What to do when the remote provider fails
enum class FailurePolicy {
    kFallback,    ///< Re-run with the pattern provider
    kFailOpen,    ///< Treat as not flagged
    kFailClosed   ///< Treat as blocked
};

/// @brief Configuration for content moderation
struct ContentModerationConfig {
    bool enabled = true;
    ProviderSelection provider = ProviderSelection::kAuto;

    /// Any category score at or above this blocks a flagged result
    double score_threshold = 0.8;

    /// Flagged categories that always block
    std::vector<ModerationCategory> block_categories = {
        ModerationCategory::kHateThreatening,
        ModerationCategory::kHarassmentThreatening,
        ModerationCategory::kSelfHarmIntent,
        ModerationCategory::kSelfHarmInstructions,
        ModerationCategory::kSexualMinors,
        ModerationCategory::kViolence,
        ModerationCategory::kViolenceGraphic,
    };

    FailurePolicy failure_policy = FailurePolicy::kFallback;

    // OpenAI moderation endpoint
    std::string api_endpoint;
    std::string api_key;
    std::string model;

    // Chat-completions endpoint for the llm provider; shares api_key
    std::string llm_endpoint;
    std::string llm_model;

    int timeout_ms = 5000;
};

/// @brief Content moderation front end
///
/// Example:
/// @code
///   ContentModerator moderator(config.content_moderation, config.severity);
///   auto result = moderator.Moderate(text);
///   if (moderator.ShouldBlock(result)) { ... }
/// @endcode
class ContentModerator {
public:
    /// @brief Build remote providers on top of a cpp-httplib transport
    explicit ContentModerator(ContentModerationConfig config,
                              SeverityThresholds severity = {});

    /// @brief Build remote providers on top of the given transport
    ContentModerator(ContentModerationConfig config,
                     SeverityThresholds severity,
                     std::shared_ptr<const HttpTransport> transport);

    /// @brief Use the given provider wherever a remote provider is selected
    ContentModerator(ContentModerationConfig config,
                     SeverityThresholds severity,
                     std::shared_ptr<const ModerationProvider> remote);

    /// @brief Classify content; never fails
    ModerationResult Moderate(const std::string& content) const;

    /// @brief flagged && (a flagged category is in block_categories ||
    /// any category score >= score_threshold)
    bool ShouldBlock(const ModerationResult& result) const;

    /// @brief Severity for a category score
    Severity SeverityForScore(double score) const;

    /// @brief One-line summary of a result
    std::string Explain(const ModerationResult& result) const;

    const ContentModerationConfig& GetConfig() const { return config_; }

private:
    /// Provider chosen for this call, or nullptr for the pattern provider
    const ModerationProvider* SelectRemote() const;

    ModerationResult ApplyFailurePolicy(const ModerationProvider& failed,
                                        const absl::Status& status,
                                        const std::string& content) const;

    ContentModerationConfig config_;
    SeverityThresholds severity_;

    PatternModerationProvider pattern_;
    std::shared_ptr<const ModerationProvider> openai_;
    std::shared_ptr<const ModerationProvider> llm_;
};

/// @brief Map a moderation category to the violation type reported for it
ViolationType ViolationTypeForCategory(ModerationCategory category);

std::string ProviderSelectionToString(ProviderSelection selection);
absl::StatusOr<ProviderSelection> ParseProviderSelection(std::string_view name);

std::string FailurePolicyToString(FailurePolicy policy);
absl::StatusOr<FailurePolicy> ParseFailurePolicy(std::string_view name);

}  // namespace aegis::guardrails
