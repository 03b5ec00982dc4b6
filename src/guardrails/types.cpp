/// @file types.cpp
/// @brief String and JSON conversions for guardrail value types

#include "guardrails/types.h"

#include <ctime>
#include <iomanip>
#include <sstream>

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>

namespace aegis::guardrails {

namespace {

std::string FormatTimestamp(std::chrono::system_clock::time_point tp) {
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count() % 1000;
    const std::time_t seconds = std::chrono::system_clock::to_time_t(tp);

    std::tm utc{};
    gmtime_r(&seconds, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << millis << 'Z';
    return oss.str();
}

}  // namespace

std::string ViolationTypeToString(ViolationType type) {
    switch (type) {
        case ViolationType::kPromptInjection: return "prompt_injection";
        case ViolationType::kJailbreakAttempt: return "jailbreak_attempt";
        case ViolationType::kHateSpeech: return "hate_speech";
        case ViolationType::kHarmfulContent: return "harmful_content";
        case ViolationType::kSelfHarm: return "self_harm";
        case ViolationType::kSexualContent: return "sexual_content";
        case ViolationType::kViolence: return "violence";
        case ViolationType::kPIIDetected: return "pii_detected";
        case ViolationType::kPolicyViolation: return "policy_violation";
    }
    return "policy_violation";
}

std::string SeverityToString(Severity severity) {
    switch (severity) {
        case Severity::kLow: return "low";
        case Severity::kMedium: return "medium";
        case Severity::kHigh: return "high";
        case Severity::kCritical: return "critical";
    }
    return "low";
}

std::string CheckTypeToString(CheckType type) {
    return type == CheckType::kInput ? "input" : "output";
}

absl::StatusOr<Severity> ParseSeverity(std::string_view name) {
    const std::string lower = absl::AsciiStrToLower(absl::string_view(name.data(), name.size()));
    if (lower == "low") return Severity::kLow;
    if (lower == "medium") return Severity::kMedium;
    if (lower == "high") return Severity::kHigh;
    if (lower == "critical") return Severity::kCritical;
    return absl::InvalidArgumentError(absl::StrCat("Unknown severity: ", absl::string_view(name.data(), name.size())));
}

nlohmann::json ToJson(const Violation& violation) {
    nlohmann::json j;
    j["type"] = ViolationTypeToString(violation.type);
    j["severity"] = SeverityToString(violation.severity);
    j["description"] = violation.description;
    if (violation.evidence) {
        j["evidence"] = *violation.evidence;
    }
    j["confidence"] = violation.confidence;
    if (!violation.metadata.empty()) {
        j["metadata"] = violation.metadata;
    }
    return j;
}

nlohmann::json ToJson(const GuardrailCheckResult& result) {
    nlohmann::json j;
    j["passed"] = result.passed;
    j["blocked"] = result.blocked;
    j["checkType"] = CheckTypeToString(result.check_type);
    j["processingTimeMs"] = result.processing_time_ms;

    nlohmann::json violations = nlohmann::json::array();
    for (const auto& v : result.violations) {
        violations.push_back(ToJson(v));
    }
    j["violations"] = std::move(violations);

    if (result.sanitized_content) {
        j["sanitizedContent"] = *result.sanitized_content;
    }
    return j;
}

nlohmann::json ToJson(const AuditLogEntry& entry) {
    nlohmann::json j;
    j["timestamp"] = FormatTimestamp(entry.timestamp);
    if (entry.user_id) {
        j["userId"] = *entry.user_id;
    }
    if (entry.session_id) {
        j["sessionId"] = *entry.session_id;
    }
    j["checkType"] = CheckTypeToString(entry.check_type);
    j["passed"] = entry.passed;
    j["blocked"] = entry.blocked;
    j["processingTimeMs"] = entry.processing_time_ms;

    nlohmann::json violations = nlohmann::json::array();
    for (const auto& v : entry.violations) {
        violations.push_back(ToJson(v));
    }
    j["violations"] = std::move(violations);

    j["metadata"] = {
        {"contentPreview", entry.metadata.content_preview},
        {"contentLength", entry.metadata.content_length},
        {"contentTruncated", entry.metadata.content_truncated},
    };
    return j;
}

}  // namespace aegis::guardrails
