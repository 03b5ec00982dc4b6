#pragma once

/// @file moderation_provider.h
/// @brief Content moderation taxonomy and the provider interface

#include <array>
#include <map>
#include <string>
#include <string_view>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>

namespace aegis::guardrails {

/// @brief Fixed moderation taxonomy (12 categories)
enum class ModerationCategory {
    kHate,
    kHateThreatening,
    kHarassment,
    kHarassmentThreatening,
    kSelfHarm,
    kSelfHarmIntent,
    kSelfHarmInstructions,
    kSexual,
    kSexualMinors,
    kViolence,
    kViolenceGraphic,
    kIllicit
};

/// All categories in taxonomy order
inline constexpr std::array<ModerationCategory, 12> kAllModerationCategories = {
    ModerationCategory::kHate,
    ModerationCategory::kHateThreatening,
    ModerationCategory::kHarassment,
    ModerationCategory::kHarassmentThreatening,
    ModerationCategory::kSelfHarm,
    ModerationCategory::kSelfHarmIntent,
    ModerationCategory::kSelfHarmInstructions,
    ModerationCategory::kSexual,
    ModerationCategory::kSexualMinors,
    ModerationCategory::kViolence,
    ModerationCategory::kViolenceGraphic,
    ModerationCategory::kIllicit,
};

/// @brief Which backend produced a moderation result
enum class ProviderKind {
    kOpenAI,
    kPattern,
    kLLM
};

/// @brief Per-category moderation outcome
///
/// categories and category_scores always hold all 12 keys.
struct ModerationResult {
    bool flagged = false;
    std::map<ModerationCategory, bool> categories;
    std::map<ModerationCategory, double> category_scores;
    ProviderKind provider = ProviderKind::kPattern;

    /// Set when the configured provider failed and a failure policy applied
    bool degraded = false;
    std::string degraded_reason;

    /// @brief Result with every category unflagged and scored 0
    static ModerationResult Empty(ProviderKind provider);
};

/// @brief A moderation backend
///
/// Implementations report transport or parsing problems through the
/// returned status; ContentModerator decides what a failure means.
class ModerationProvider {
public:
    virtual ~ModerationProvider() = default;

    /// @brief Classify content into the fixed taxonomy
    virtual absl::StatusOr<ModerationResult> Moderate(const std::string& content) const = 0;

    /// @brief Backend identity written into ModerationResult::provider
    virtual ProviderKind Kind() const = 0;

    /// @brief Whether the provider can currently be used (credentials present)
    virtual bool IsAvailable() const = 0;
};

/// @brief Where and how a remote provider is reached
struct RemoteEndpoint {
    std::string url;
    std::string api_key;
    std::string model;
};

/// @brief Build a result from an object carrying "categories" and
/// "category_scores" maps keyed by taxonomy name
///
/// Unknown keys are ignored, missing keys stay false / 0, scores are
/// clamped to [0, 1]. "flagged" is taken from the object when present,
/// otherwise derived from the categories.
absl::StatusOr<ModerationResult> ModerationResultFromJson(
    const nlohmann::json& object, ProviderKind provider);

// =============================================================================
// String conversions
// =============================================================================

/// @brief Taxonomy name, e.g. "self-harm/intent"
std::string ModerationCategoryToString(ModerationCategory category);

absl::StatusOr<ModerationCategory> ParseModerationCategory(std::string_view name);

std::string ProviderKindToString(ProviderKind kind);

}  // namespace aegis::guardrails
