/// @file guardrails_service.cpp
/// @brief Guardrail orchestration

#include "guardrails/guardrails_service.h"

#include <algorithm>
#include <chrono>
#include <exception>
#include <optional>

#include <absl/strings/str_join.h>

#include "common/logging.h"

namespace aegis::guardrails {

namespace {

constexpr size_t kMaxEvidencePatterns = 3;
constexpr size_t kPreviewRedactionMargin = 512;

double ElapsedMs(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start).count();
}

Severity SeverityForRisk(RiskLevel risk) {
    return risk == RiskLevel::kHigh ? Severity::kHigh : Severity::kMedium;
}

nlohmann::json PIIMetadata(const PIIRedactionResult& pii) {
    nlohmann::json types = nlohmann::json::array();
    for (const auto& match : pii.matches) {
        types.push_back(PIITypeToString(match.type));
    }
    return {
        {"types", types},
        {"count", pii.matches.size()},
        {"risk_level", RiskLevelToString(pii.risk_level)},
    };
}

}  // namespace

GuardrailsService::GuardrailsService(const GuardrailsConfig& config,
                                     std::shared_ptr<AuditSink> audit_sink)
    : config_(config),
      injection_detector_(config_.prompt_injection),
      content_moderator_(config_.content_moderation, config_.severity),
      pii_redactor_(config_.pii_redaction),
      audit_sink_(audit_sink ? std::move(audit_sink) : std::make_shared<LoggingAuditSink>()) {}

GuardrailsService::GuardrailsService(const GuardrailsConfig& config,
                                     std::shared_ptr<const ModerationProvider> moderation_provider,
                                     std::shared_ptr<AuditSink> audit_sink)
    : config_(config),
      injection_detector_(config_.prompt_injection),
      content_moderator_(config_.content_moderation, config_.severity,
                         std::move(moderation_provider)),
      pii_redactor_(config_.pii_redaction),
      audit_sink_(audit_sink ? std::move(audit_sink) : std::make_shared<LoggingAuditSink>()) {}

// =============================================================================
// Input
// =============================================================================

GuardrailCheckResult GuardrailsService::CheckInput(const std::string& content,
                                                   const CheckOptions& options) const {
    const auto start = std::chrono::steady_clock::now();

    GuardrailCheckResult result;
    result.check_type = CheckType::kInput;

    if (!config_.enabled) {
        result.processing_time_ms = ElapsedMs(start);
        return result;
    }

    bool blocked = false;

    if (!options.skip_prompt_injection && config_.prompt_injection.enabled) {
        const InjectionResult injection = injection_detector_.Detect(content);
        if (injection.is_injection) {
            const bool jailbreak = injection.category == InjectionCategory::kJailbreak;

            Violation violation;
            violation.type = jailbreak ? ViolationType::kJailbreakAttempt
                                       : ViolationType::kPromptInjection;
            violation.severity = injection.confidence >= config_.severity.critical
                ? Severity::kCritical : Severity::kHigh;
            violation.description = injection_detector_.Explain(injection);
            violation.confidence = injection.confidence;

            const size_t evidence_count = std::min(injection.patterns.size(), kMaxEvidencePatterns);
            violation.evidence = absl::StrJoin(
                injection.patterns.begin(), injection.patterns.begin() + evidence_count, "; ");

            violation.metadata["patterns"] = injection.patterns;
            if (injection.category) {
                violation.metadata["category"] = InjectionCategoryToString(*injection.category);
            }
            result.violations.push_back(std::move(violation));

            if (config_.prompt_injection.block_on_detection) {
                blocked = true;
            }
        }
    }

    if (!options.skip_content_moderation && config_.content_moderation.enabled) {
        blocked = RunModeration(content, result) || blocked;
    }

    // Input PII is reported, never blocked on
    if (!options.skip_pii_redaction && config_.pii_redaction.enabled) {
        const PIIRedactionResult pii = pii_redactor_.Detect(content);
        if (pii.has_pii && pii.risk_level != RiskLevel::kNone) {
            Violation violation;
            violation.type = ViolationType::kPIIDetected;
            violation.severity = SeverityForRisk(pii.risk_level);
            violation.description = pii_redactor_.Summarize(pii);
            violation.confidence = 1.0;
            violation.metadata = PIIMetadata(pii);
            result.violations.push_back(std::move(violation));
        }
    }

    result.blocked = blocked;
    ApplyBlockingPolicy(result, options);

    result.passed = result.violations.empty();
    result.processing_time_ms = ElapsedMs(start);

    EmitAudit(content, result, options);
    return result;
}

// =============================================================================
// Output
// =============================================================================

GuardrailCheckResult GuardrailsService::CheckOutput(const std::string& content,
                                                    const CheckOptions& options) const {
    const auto start = std::chrono::steady_clock::now();

    GuardrailCheckResult result;
    result.check_type = CheckType::kOutput;

    if (!config_.enabled) {
        result.processing_time_ms = ElapsedMs(start);
        return result;
    }

    bool blocked = false;
    if (!options.skip_content_moderation && config_.content_moderation.enabled) {
        blocked = RunModeration(content, result);
    }

    std::optional<std::string> redacted;
    if (!options.skip_pii_redaction && config_.pii_redaction.enabled &&
        config_.pii_redaction.redact_in_responses) {
        PIIRedactionResult pii = pii_redactor_.Redact(content);
        if (pii.has_pii) {
            Violation violation;
            violation.type = ViolationType::kPIIDetected;
            violation.severity = SeverityForRisk(pii.risk_level);
            violation.description = pii_redactor_.Summarize(pii);
            violation.confidence = 1.0;
            violation.metadata = PIIMetadata(pii);
            violation.metadata["redacted"] = true;
            result.violations.push_back(std::move(violation));

            redacted = std::move(pii.redacted_text);
        }
    }

    result.blocked = blocked;
    ApplyBlockingPolicy(result, options);

    // The block message always wins over redacted text
    if (result.blocked) {
        result.sanitized_content = config_.blocking.block_message;
    } else if (redacted) {
        result.sanitized_content = std::move(redacted);
    }

    result.passed = result.violations.empty();
    result.processing_time_ms = ElapsedMs(start);

    EmitAudit(content, result, options);
    return result;
}

// =============================================================================
// Pass-throughs
// =============================================================================

InjectionResult GuardrailsService::CheckPromptInjection(const std::string& content) const {
    return injection_detector_.Detect(content);
}

ModerationResult GuardrailsService::ModerateContent(const std::string& content) const {
    return content_moderator_.Moderate(content);
}

PIIRedactionResult GuardrailsService::RedactPII(const std::string& content) const {
    return pii_redactor_.Redact(content);
}

// =============================================================================
// Helpers
// =============================================================================

bool GuardrailsService::RunModeration(const std::string& content,
                                      GuardrailCheckResult& result) const {
    const ModerationResult moderation = content_moderator_.Moderate(content);

    if (moderation.degraded) {
        const FailurePolicy policy = config_.content_moderation.failure_policy;
        if (policy != FailurePolicy::kFallback) {
            const bool closed = policy == FailurePolicy::kFailClosed;

            Violation violation;
            violation.type = ViolationType::kPolicyViolation;
            violation.severity = closed ? Severity::kHigh : Severity::kLow;
            violation.description = "Content moderation could not be evaluated";
            violation.confidence = closed ? 1.0 : 0.1;
            violation.metadata = {
                {"degraded", true},
                {"failure_policy", FailurePolicyToString(policy)},
                {"provider", ProviderKindToString(moderation.provider)},
                {"reason", moderation.degraded_reason},
            };
            result.violations.push_back(std::move(violation));
            return closed;
        }
    }

    if (!moderation.flagged) {
        return false;
    }

    const size_t violations_before = result.violations.size();
    for (const auto& [category, flagged] : moderation.categories) {
        if (!flagged) continue;

        const double score = moderation.category_scores.at(category);
        const std::string name = ModerationCategoryToString(category);

        Violation violation;
        violation.type = ViolationTypeForCategory(category);
        violation.severity = content_moderator_.SeverityForScore(score);
        violation.description = "Content flagged for " + name;
        violation.confidence = score;
        violation.metadata = {
            {"category", name},
            {"score", score},
            {"provider", ProviderKindToString(moderation.provider)},
        };
        if (moderation.degraded) {
            violation.metadata["fallback"] = true;
        }
        result.violations.push_back(std::move(violation));
    }

    const bool block = content_moderator_.ShouldBlock(moderation);
    if (block && result.violations.size() == violations_before) {
        // Flagged on score alone: no category was marked, but a block needs evidence
        nlohmann::json categories = nlohmann::json::array();
        double max_score = 0.0;
        for (const auto& [category, score] : moderation.category_scores) {
            if (score >= config_.content_moderation.score_threshold) {
                categories.push_back(ModerationCategoryToString(category));
            }
            max_score = std::max(max_score, score);
        }

        Violation violation;
        violation.type = ViolationType::kPolicyViolation;
        violation.severity = content_moderator_.SeverityForScore(max_score);
        violation.description = "Content flagged by moderation score";
        violation.confidence = max_score;
        violation.metadata = {
            {"categories", categories},
            {"max_score", max_score},
            {"provider", ProviderKindToString(moderation.provider)},
        };
        if (moderation.degraded) {
            violation.metadata["fallback"] = true;
        }
        result.violations.push_back(std::move(violation));
    }
    return block;
}

void GuardrailsService::ApplyBlockingPolicy(GuardrailCheckResult& result,
                                            const CheckOptions& options) const {
    if (!config_.blocking.block_on_violation) {
        result.blocked = false;
        return;
    }

    if (result.blocked && options.bypass_blocking && BypassAllowed(options)) {
        AEGIS_LOG_INFO("Guardrail block bypassed (user: {}, role: {})",
                       options.user_id.value_or("-"), options.user_role.value_or("-"));
        result.blocked = false;
    }
}

bool GuardrailsService::BypassAllowed(const CheckOptions& options) const {
    if (!config_.blocking.allow_bypass) {
        return false;
    }
    const auto& roles = config_.blocking.bypass_roles;
    if (roles.empty()) {
        return true;
    }
    return options.user_role &&
           std::find(roles.begin(), roles.end(), *options.user_role) != roles.end();
}

void GuardrailsService::EmitAudit(const std::string& content,
                                  const GuardrailCheckResult& result,
                                  const CheckOptions& options) const {
    const bool should_log = config_.logging.log_all_checks ||
                            (config_.logging.log_violations && !result.passed);
    if (!should_log || !audit_sink_) {
        return;
    }

    AuditLogEntry entry;
    entry.timestamp = std::chrono::system_clock::now();
    entry.user_id = options.user_id;
    entry.session_id = options.session_id;
    entry.check_type = result.check_type;
    entry.passed = result.passed;
    entry.violations = result.violations;
    entry.blocked = result.blocked;
    entry.processing_time_ms = result.processing_time_ms;

    // Cut before redacting so a long body is never scanned in full. The
    // margin keeps PII that straddles the preview boundary whole.
    const std::string head =
        TruncateUtf8(content, kMaxContentPreviewBytes + kPreviewRedactionMargin);
    const bool redact = config_.logging.redact_sensitive_data ||
                        config_.pii_redaction.redact_in_logs;
    const std::string source = redact ? pii_redactor_.RedactForLogging(head) : head;

    entry.metadata.content_preview = TruncateUtf8(source, kMaxContentPreviewBytes);
    entry.metadata.content_truncated = head.size() < content.size() ||
                                       entry.metadata.content_preview.size() < source.size();
    entry.metadata.content_length = content.size();

    try {
        auto status = audit_sink_->Emit(entry);
        if (!status.ok()) {
            AEGIS_LOG_WARN("Failed to emit audit entry: {}", status.ToString());
        }
    } catch (const std::exception& e) {
        AEGIS_LOG_ERROR("Audit sink threw: {}", e.what());
    }
}

std::string TruncateUtf8(const std::string& text, size_t max_bytes) {
    if (text.size() <= max_bytes) {
        return text;
    }

    size_t cut = max_bytes;
    // Step back off continuation bytes so the cut lands before a lead byte
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return text.substr(0, cut);
}

}  // namespace aegis::guardrails
