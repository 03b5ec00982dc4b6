/// @file moderation_provider.cpp
/// @brief Moderation taxonomy helpers

#include "guardrails/moderation_provider.h"

#include <algorithm>

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>

#include "common/error.h"

namespace aegis::guardrails {

ModerationResult ModerationResult::Empty(ProviderKind provider) {
    ModerationResult result;
    result.provider = provider;
    for (auto category : kAllModerationCategories) {
        result.categories[category] = false;
        result.category_scores[category] = 0.0;
    }
    return result;
}

absl::StatusOr<ModerationResult> ModerationResultFromJson(
    const nlohmann::json& object, ProviderKind provider) {
    if (!object.is_object()) {
        return MakeError(ErrorCode::kMalformedResponse, "Moderation result is not an object");
    }
    const auto categories = object.find("categories");
    if (categories == object.end() || !categories->is_object()) {
        return MakeError(ErrorCode::kMalformedResponse,
                         "Moderation result has no \"categories\" object");
    }

    ModerationResult result = ModerationResult::Empty(provider);
    for (auto it = categories->begin(); it != categories->end(); ++it) {
        auto category = ParseModerationCategory(it.key());
        if (!category.ok() || !it.value().is_boolean()) {
            continue;
        }
        result.categories[*category] = it.value().get<bool>();
    }

    const auto scores = object.find("category_scores");
    if (scores != object.end() && scores->is_object()) {
        for (auto it = scores->begin(); it != scores->end(); ++it) {
            auto category = ParseModerationCategory(it.key());
            if (!category.ok() || !it.value().is_number()) {
                continue;
            }
            result.category_scores[*category] =
                std::clamp(it.value().get<double>(), 0.0, 1.0);
        }
    }

    const auto flagged = object.find("flagged");
    if (flagged != object.end() && flagged->is_boolean()) {
        result.flagged = flagged->get<bool>();
    } else {
        result.flagged = std::any_of(
            result.categories.begin(), result.categories.end(),
            [](const auto& entry) { return entry.second; });
    }
    return result;
}

std::string ModerationCategoryToString(ModerationCategory category) {
    switch (category) {
        case ModerationCategory::kHate: return "hate";
        case ModerationCategory::kHateThreatening: return "hate/threatening";
        case ModerationCategory::kHarassment: return "harassment";
        case ModerationCategory::kHarassmentThreatening: return "harassment/threatening";
        case ModerationCategory::kSelfHarm: return "self-harm";
        case ModerationCategory::kSelfHarmIntent: return "self-harm/intent";
        case ModerationCategory::kSelfHarmInstructions: return "self-harm/instructions";
        case ModerationCategory::kSexual: return "sexual";
        case ModerationCategory::kSexualMinors: return "sexual/minors";
        case ModerationCategory::kViolence: return "violence";
        case ModerationCategory::kViolenceGraphic: return "violence/graphic";
        case ModerationCategory::kIllicit: return "illicit";
    }
    return "unknown";
}

absl::StatusOr<ModerationCategory> ParseModerationCategory(std::string_view name) {
    const std::string lower = absl::AsciiStrToLower(absl::string_view(name.data(), name.size()));
    for (auto category : kAllModerationCategories) {
        if (ModerationCategoryToString(category) == lower) {
            return category;
        }
    }
    return absl::InvalidArgumentError(
        absl::StrCat("Unknown moderation category: ", absl::string_view(name.data(), name.size())));
}

std::string ProviderKindToString(ProviderKind kind) {
    switch (kind) {
        case ProviderKind::kOpenAI: return "openai";
        case ProviderKind::kPattern: return "pattern";
        case ProviderKind::kLLM: return "llm";
    }
    return "pattern";
}

}  // namespace aegis::guardrails
