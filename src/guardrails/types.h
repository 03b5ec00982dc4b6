#pragma once

/// @file types.h
/// @brief Value types shared by the guardrail checks
///
/// Every type here is created fresh for a single check and carries no
/// references into detector state.

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>

namespace aegis::guardrails {

/// @brief Kind of issue a check reported
enum class ViolationType {
    kPromptInjection,
    kJailbreakAttempt,
    kHateSpeech,
    kHarmfulContent,
    kSelfHarm,
    kSexualContent,
    kViolence,
    kPIIDetected,
    kPolicyViolation
};

/// @brief Violation severity, ordered from least to most severe
enum class Severity {
    kLow,
    kMedium,
    kHigh,
    kCritical
};

/// @brief Which side of the model a check ran on
enum class CheckType {
    kInput,
    kOutput
};

/// @brief One detected issue
struct Violation {
    ViolationType type = ViolationType::kPolicyViolation;
    Severity severity = Severity::kLow;
    std::string description;
    std::optional<std::string> evidence;
    double confidence = 0.0;  ///< 0.0 - 1.0

    /// Detector-specific detail (category, score, provider, pattern list, ...)
    nlohmann::json metadata = nlohmann::json::object();
};

/// @brief Outcome of CheckInput / CheckOutput
///
/// passed == violations.empty(). blocked is decided by policy and may be
/// false while violations are present (e.g. PII on input, bypassed blocks).
struct GuardrailCheckResult {
    bool passed = true;
    std::vector<Violation> violations;
    double processing_time_ms = 0.0;
    CheckType check_type = CheckType::kInput;
    bool blocked = false;

    /// Replacement text for the caller to return instead of the original
    std::optional<std::string> sanitized_content;
};

/// @brief Per-call options supplied by the caller
struct CheckOptions {
    std::optional<std::string> user_id;
    std::optional<std::string> session_id;

    /// Role of the caller; consulted when bypass is restricted to roles
    std::optional<std::string> user_role;

    bool skip_prompt_injection = false;
    bool skip_content_moderation = false;
    bool skip_pii_redaction = false;

    /// Ask to suppress a block decision (honoured only when policy allows)
    bool bypass_blocking = false;
};

/// @brief Record handed to the audit sink after a check
struct AuditLogEntry {
    std::chrono::system_clock::time_point timestamp;
    std::optional<std::string> user_id;
    std::optional<std::string> session_id;
    CheckType check_type = CheckType::kInput;
    bool passed = true;
    std::vector<Violation> violations;
    bool blocked = false;
    double processing_time_ms = 0.0;

    struct Metadata {
        std::string content_preview;  ///< At most kMaxContentPreviewBytes
        size_t content_length = 0;
        bool content_truncated = false;
    } metadata;
};

/// @brief Score cut-offs used to derive violation severity
struct SeverityThresholds {
    double critical = 0.9;
    double high = 0.7;
};

/// Upper bound on AuditLogEntry::Metadata::content_preview
inline constexpr size_t kMaxContentPreviewBytes = 500;

// =============================================================================
// String conversions
// =============================================================================

std::string ViolationTypeToString(ViolationType type);
std::string SeverityToString(Severity severity);
std::string CheckTypeToString(CheckType type);

absl::StatusOr<Severity> ParseSeverity(std::string_view name);

// =============================================================================
// JSON
// =============================================================================

nlohmann::json ToJson(const Violation& violation);
nlohmann::json ToJson(const GuardrailCheckResult& result);
nlohmann::json ToJson(const AuditLogEntry& entry);

}  // namespace aegis::guardrails
