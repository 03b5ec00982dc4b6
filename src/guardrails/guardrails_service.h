#pragma once

/// @file guardrails_service.h
/// @brief Input/output guardrail orchestration
///
/// CheckInput runs injection detection, moderation and PII detection on
/// user input. CheckOutput runs moderation and PII redaction on model
/// output. Every enabled sub-check runs before the block decision, so the
/// violations list is complete even when the content is blocked.

#include <memory>
#include <string>

#include "guardrails/audit_sink.h"
#include "guardrails/content_moderator.h"
#include "guardrails/guardrails_config.h"
#include "guardrails/injection_detector.h"
#include "guardrails/pii_redactor.h"
#include "guardrails/types.h"

namespace aegis::guardrails {

/// @brief Guardrail pipeline entry point
///
/// All methods are const and may be called concurrently. Results never
/// expose violation detail beyond GuardrailCheckResult; the audit sink
/// receives the full record.
///
/// Example:
/// @code
///   auto config = GuardrailsConfig::Load("config/guardrails.yaml");
///   GuardrailsService service(*config);
///
///   CheckOptions options;
///   options.user_id = "u-42";
///   auto result = service.CheckInput(prompt, options);
///   if (result.blocked) {
///       return config->blocking.block_message;
///   }
/// @endcode
class GuardrailsService {
public:
    /// @param config Copied; never modified afterwards
    /// @param audit_sink Receives audit entries; defaults to a LoggingAuditSink
    explicit GuardrailsService(const GuardrailsConfig& config,
                               std::shared_ptr<AuditSink> audit_sink = nullptr);

    /// @brief Same, with a moderation provider used in place of the remote ones
    GuardrailsService(const GuardrailsConfig& config,
                      std::shared_ptr<const ModerationProvider> moderation_provider,
                      std::shared_ptr<AuditSink> audit_sink);

    /// @brief Screen user input before it reaches the model
    GuardrailCheckResult CheckInput(const std::string& content,
                                    const CheckOptions& options = {}) const;

    /// @brief Screen model output before it reaches the user
    GuardrailCheckResult CheckOutput(const std::string& content,
                                     const CheckOptions& options = {}) const;

    // Single sub-checks without orchestration, blocking or audit
    InjectionResult CheckPromptInjection(const std::string& content) const;
    ModerationResult ModerateContent(const std::string& content) const;
    PIIRedactionResult RedactPII(const std::string& content) const;

    const GuardrailsConfig& GetConfig() const { return config_; }
    bool IsEnabled() const { return config_.enabled; }

private:
    /// @return true when the moderation outcome requires a block
    bool RunModeration(const std::string& content, GuardrailCheckResult& result) const;

    /// Monitor mode and bypass
    void ApplyBlockingPolicy(GuardrailCheckResult& result, const CheckOptions& options) const;

    bool BypassAllowed(const CheckOptions& options) const;

    void EmitAudit(const std::string& content,
                   const GuardrailCheckResult& result,
                   const CheckOptions& options) const;

    GuardrailsConfig config_;
    InjectionDetector injection_detector_;
    ContentModerator content_moderator_;
    PIIRedactor pii_redactor_;
    std::shared_ptr<AuditSink> audit_sink_;
};

/// @brief Longest prefix of text that is at most max_bytes long and does
/// not end inside a UTF-8 sequence
std::string TruncateUtf8(const std::string& text, size_t max_bytes);

}  // namespace aegis::guardrails
