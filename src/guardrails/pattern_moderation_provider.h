#pragma once

/// @file pattern_moderation_provider.h
/// @brief In-process regex moderation

#include <regex>
#include <string>
#include <vector>

#include "guardrails/moderation_provider.h"

namespace aegis::guardrails {

/// @brief Deterministic keyword/regex moderation
///
/// Used directly when configured, and as the fallback when a remote
/// provider fails. A category's score is the highest weight among its
/// matching rules. Never returns an error.
class PatternModerationProvider : public ModerationProvider {
public:
    PatternModerationProvider() = default;

    absl::StatusOr<ModerationResult> Moderate(const std::string& content) const override;

    /// @brief Same as Moderate() without the StatusOr wrapper
    ModerationResult Classify(const std::string& content) const;

    ProviderKind Kind() const override { return ProviderKind::kPattern; }
    bool IsAvailable() const override { return true; }

    struct Rule {
        std::regex regex;
        ModerationCategory category;
        double weight;
    };

    /// @brief Built-in rule table, compiled on first use
    static const std::vector<Rule>& DefaultRules();
};

}  // namespace aegis::guardrails
