/// @file content_moderator.cpp
/// @brief Content moderation front end

#include "guardrails/content_moderator.h"

#include <algorithm>
#include <chrono>
#include <exception>
#include <iomanip>
#include <sstream>

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "common/logging.h"
#include "guardrails/llm_moderation_provider.h"
#include "guardrails/openai_moderation_provider.h"

namespace aegis::guardrails {

namespace {

RemoteEndpoint OpenAIEndpoint(const ContentModerationConfig& config) {
    return RemoteEndpoint{config.api_endpoint, config.api_key, config.model};
}

RemoteEndpoint LlmEndpoint(const ContentModerationConfig& config) {
    return RemoteEndpoint{config.llm_endpoint, config.api_key, config.llm_model};
}

}  // namespace

ContentModerator::ContentModerator(ContentModerationConfig config,
                                   SeverityThresholds severity)
    : ContentModerator(config, severity,
                       std::shared_ptr<const HttpTransport>(std::make_shared<HttplibTransport>(
                           std::chrono::milliseconds(config.timeout_ms)))) {}

ContentModerator::ContentModerator(ContentModerationConfig config,
                                   SeverityThresholds severity,
                                   std::shared_ptr<const HttpTransport> transport)
    : config_(std::move(config)), severity_(severity) {
    openai_ = std::make_shared<OpenAIModerationProvider>(OpenAIEndpoint(config_), transport);
    llm_ = std::make_shared<LlmModerationProvider>(LlmEndpoint(config_), transport);
}

ContentModerator::ContentModerator(ContentModerationConfig config,
                                   SeverityThresholds severity,
                                   std::shared_ptr<const ModerationProvider> remote)
    : config_(std::move(config)), severity_(severity), openai_(remote), llm_(remote) {}

ModerationResult ContentModerator::Moderate(const std::string& content) const {
    if (!config_.enabled) {
        return ModerationResult::Empty(ProviderKind::kPattern);
    }

    const ModerationProvider* remote = SelectRemote();
    if (remote == nullptr) {
        return pattern_.Classify(content);
    }

    absl::StatusOr<ModerationResult> result;
    try {
        result = remote->Moderate(content);
    } catch (const std::exception& e) {
        result = MakeError(ErrorCode::kProviderUnavailable,
                           absl::StrCat("provider threw: ", e.what()));
    }
    if (!result.ok()) {
        return ApplyFailurePolicy(*remote, result.status(), content);
    }
    return *std::move(result);
}

const ModerationProvider* ContentModerator::SelectRemote() const {
    switch (config_.provider) {
        case ProviderSelection::kPattern:
            return nullptr;
        case ProviderSelection::kOpenAI:
            return openai_.get();
        case ProviderSelection::kLLM:
            return llm_.get();
        case ProviderSelection::kAuto:
            return (openai_ && openai_->IsAvailable()) ? openai_.get() : nullptr;
    }
    return nullptr;
}

ModerationResult ContentModerator::ApplyFailurePolicy(const ModerationProvider& failed,
                                                      const absl::Status& status,
                                                      const std::string& content) const {
    const std::string reason = absl::StrCat(
        ProviderKindToString(failed.Kind()), " provider failed (", std::string(ProviderFailureKind(status)),
        "): ", status.message());

    switch (config_.failure_policy) {
        case FailurePolicy::kFallback: {
            AEGIS_LOG_WARN("Moderation {}; falling back to pattern provider", reason);
            ModerationResult result = pattern_.Classify(content);
            result.degraded = true;
            result.degraded_reason = reason;
            return result;
        }
        case FailurePolicy::kFailOpen:
            AEGIS_LOG_WARN("Moderation {}; failing open", reason);
            break;
        case FailurePolicy::kFailClosed:
            AEGIS_LOG_WARN("Moderation {}; failing closed", reason);
            break;
    }

    ModerationResult result = ModerationResult::Empty(failed.Kind());
    result.degraded = true;
    result.degraded_reason = reason;
    return result;
}

bool ContentModerator::ShouldBlock(const ModerationResult& result) const {
    if (!result.flagged) {
        return false;
    }

    for (const auto& [category, flagged] : result.categories) {
        if (flagged &&
            std::find(config_.block_categories.begin(), config_.block_categories.end(),
                      category) != config_.block_categories.end()) {
            return true;
        }
    }

    return std::any_of(
        result.category_scores.begin(), result.category_scores.end(),
        [this](const auto& entry) { return entry.second >= config_.score_threshold; });
}

Severity ContentModerator::SeverityForScore(double score) const {
    if (score >= severity_.critical) {
        return Severity::kCritical;
    }
    if (score >= severity_.high) {
        return Severity::kHigh;
    }
    return Severity::kMedium;
}

std::string ContentModerator::Explain(const ModerationResult& result) const {
    std::ostringstream oss;
    if (!result.flagged) {
        oss << "Content not flagged (" << ProviderKindToString(result.provider) << ")";
    } else {
        oss << "Content flagged by " << ProviderKindToString(result.provider) << ":";
        bool first = true;
        for (const auto& [category, flagged] : result.categories) {
            if (!flagged) continue;
            oss << (first ? " " : ", ") << ModerationCategoryToString(category) << " ("
                << std::fixed << std::setprecision(2) << result.category_scores.at(category) << ")";
            first = false;
        }
    }
    if (result.degraded) {
        oss << " [degraded: " << result.degraded_reason << "]";
    }
    return oss.str();
}

ViolationType ViolationTypeForCategory(ModerationCategory category) {
    switch (category) {
        case ModerationCategory::kHate:
        case ModerationCategory::kHateThreatening:
            return ViolationType::kHateSpeech;
        case ModerationCategory::kHarassment:
        case ModerationCategory::kHarassmentThreatening:
            return ViolationType::kHarmfulContent;
        case ModerationCategory::kSelfHarm:
        case ModerationCategory::kSelfHarmIntent:
        case ModerationCategory::kSelfHarmInstructions:
            return ViolationType::kSelfHarm;
        case ModerationCategory::kSexual:
        case ModerationCategory::kSexualMinors:
            return ViolationType::kSexualContent;
        case ModerationCategory::kViolence:
        case ModerationCategory::kViolenceGraphic:
            return ViolationType::kViolence;
        case ModerationCategory::kIllicit:
            return ViolationType::kPolicyViolation;
    }
    return ViolationType::kPolicyViolation;
}

std::string ProviderSelectionToString(ProviderSelection selection) {
    switch (selection) {
        case ProviderSelection::kAuto: return "auto";
        case ProviderSelection::kOpenAI: return "openai";
        case ProviderSelection::kPattern: return "pattern";
        case ProviderSelection::kLLM: return "llm";
    }
    return "auto";
}

absl::StatusOr<ProviderSelection> ParseProviderSelection(std::string_view name) {
    const std::string lower = absl::AsciiStrToLower(absl::string_view(name.data(), name.size()));
    if (lower == "auto") return ProviderSelection::kAuto;
    if (lower == "openai") return ProviderSelection::kOpenAI;
    if (lower == "pattern") return ProviderSelection::kPattern;
    if (lower == "llm") return ProviderSelection::kLLM;
    return absl::InvalidArgumentError(absl::StrCat("Unknown moderation provider: ", absl::string_view(name.data(), name.size())));
}

std::string FailurePolicyToString(FailurePolicy policy) {
    switch (policy) {
        case FailurePolicy::kFallback: return "fallback";
        case FailurePolicy::kFailOpen: return "fail_open";
        case FailurePolicy::kFailClosed: return "fail_closed";
    }
    return "fallback";
}

absl::StatusOr<FailurePolicy> ParseFailurePolicy(std::string_view name) {
    const std::string lower = absl::AsciiStrToLower(absl::string_view(name.data(), name.size()));
    if (lower == "fallback") return FailurePolicy::kFallback;
    if (lower == "fail_open") return FailurePolicy::kFailOpen;
    if (lower == "fail_closed") return FailurePolicy::kFailClosed;
    return absl::InvalidArgumentError(absl::StrCat("Unknown failure policy: ", absl::string_view(name.data(), name.size())));
}

}  // namespace aegis::guardrails
