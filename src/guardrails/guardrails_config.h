#pragma once

/// @file guardrails_config.h
/// @brief Process-wide guardrail settings
///
/// Built once at startup (defaults, then YAML, then AEGIS_* environment
/// variables), validated, and passed by const reference into
/// GuardrailsService. Nothing mutates it afterwards.

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "common/config.h"
#include "guardrails/content_moderator.h"
#include "guardrails/injection_detector.h"
#include "guardrails/pii_redactor.h"
#include "guardrails/types.h"

namespace aegis::guardrails {

/// @brief When and how checks turn into blocks
struct BlockingPolicy {
    /// false = monitor mode: violations are reported, nothing is blocked
    bool block_on_violation = true;

    /// The only text an end user sees for blocked content
    std::string block_message =
        "I'm sorry, but I can't help with that request. It was blocked by content safety policy.";

    /// Honour CheckOptions::bypass_blocking
    bool allow_bypass = false;

    /// Roles allowed to bypass; empty = any caller
    std::vector<std::string> bypass_roles;
};

/// @brief Which checks produce audit entries
struct AuditLoggingConfig {
    bool log_violations = true;
    bool log_all_checks = false;

    /// Mask PII in the content preview
    bool redact_sensitive_data = true;
};

/// @brief Guardrail settings
struct GuardrailsConfig {
    bool enabled = true;

    PromptInjectionConfig prompt_injection;
    ContentModerationConfig content_moderation;
    PIIRedactionConfig pii_redaction;
    BlockingPolicy blocking;
    AuditLoggingConfig logging;
    SeverityThresholds severity;

    /// @brief Built-in defaults
    static GuardrailsConfig Default();

    /// @brief Read the "guardrails" section of a configuration tree
    ///
    /// Keys that are absent keep their defaults. Malformed values and
    /// unknown names are rejected. The result is validated.
    static absl::StatusOr<GuardrailsConfig> FromConfig(const Config& config);

    /// @brief Load a YAML file (optional) with AEGIS_* environment overrides
    static absl::StatusOr<GuardrailsConfig> Load(
        const std::optional<std::filesystem::path>& path,
        std::string_view env_prefix = "AEGIS_");

    /// @brief Check value ranges and cross-field constraints
    absl::Status Validate() const;
};

}  // namespace aegis::guardrails
