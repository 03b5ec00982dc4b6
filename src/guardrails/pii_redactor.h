#pragma once

/// @file pii_redactor.h
/// @brief PII detection, masking and risk scoring
///
/// Detected types:
/// - email, phone, ssn, credit_card, ip_address
/// - api_key (prefixed keys, labeled keys, Bearer tokens), password
/// - date_of_birth, street address, name (labeled, e.g. "my name is ...")
///
/// Matches are byte offsets into the original text. Overlapping matches
/// are resolved before masking so that redaction never corrupts text
/// outside a matched span.

#include <array>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/statusor.h>

namespace aegis::guardrails {

/// @brief Kind of personal data
enum class PIIType {
    kEmail,
    kPhone,
    kSSN,
    kCreditCard,
    kIPAddress,
    kAPIKey,
    kPassword,
    kDateOfBirth,
    kAddress,
    kName
};

inline constexpr std::array<PIIType, 10> kAllPIITypes = {
    PIIType::kEmail,
    PIIType::kPhone,
    PIIType::kSSN,
    PIIType::kCreditCard,
    PIIType::kIPAddress,
    PIIType::kAPIKey,
    PIIType::kPassword,
    PIIType::kDateOfBirth,
    PIIType::kAddress,
    PIIType::kName,
};

/// @brief One detected PII span
struct PIIMatch {
    PIIType type = PIIType::kEmail;
    std::string value;
    std::string masked;
    size_t start_index = 0;  ///< Inclusive byte offset in the original text
    size_t end_index = 0;    ///< Exclusive byte offset in the original text
};

/// @brief Coarse risk bucket derived from the matched types
enum class RiskLevel {
    kNone,
    kLow,
    kMedium,
    kHigh
};

/// @brief Result of Detect / Redact
struct PIIRedactionResult {
    bool has_pii = false;
    std::vector<PIIMatch> matches;  ///< Ascending by start_index, non-overlapping
    std::string redacted_text;
    RiskLevel risk_level = RiskLevel::kNone;
};

/// @brief Configuration for PII handling
struct PIIRedactionConfig {
    bool enabled = true;

    /// Types scanned by Detect / Redact. Name detection is opt-in.
    std::vector<PIIType> types_to_redact = {
        PIIType::kEmail,
        PIIType::kPhone,
        PIIType::kSSN,
        PIIType::kCreditCard,
        PIIType::kIPAddress,
        PIIType::kAPIKey,
        PIIType::kPassword,
        PIIType::kDateOfBirth,
        PIIType::kAddress,
    };

    /// Mask PII in audit previews
    bool redact_in_logs = true;

    /// Mask PII in model output returned to the caller
    bool redact_in_responses = true;
};

/// @brief Stateless PII detector and masker
///
/// Example:
/// @code
///   PIIRedactor redactor(config.pii_redaction);
///   auto result = redactor.Redact("My SSN is 123-45-6789");
///   // result.redacted_text == "My SSN is ***-**-****"
/// @endcode
class PIIRedactor {
public:
    explicit PIIRedactor(PIIRedactionConfig config = {});

    /// @brief Find PII of the configured types; redacted_text is the input
    PIIRedactionResult Detect(const std::string& text) const;

    /// @brief Find and mask PII of the configured types
    PIIRedactionResult Redact(const std::string& text) const;

    /// @brief Mask every PII type regardless of configuration
    std::string RedactForLogging(const std::string& text) const;

    /// @brief none / high for sensitive types / medium for location data or
    /// three or more matches / low otherwise
    static RiskLevel CalculateRiskLevel(const std::vector<PIIMatch>& matches);

    /// @brief Short description such as "2 PII item(s): ssn x1, email x1 (risk: high)"
    std::string Summarize(const PIIRedactionResult& result) const;

    const PIIRedactionConfig& GetConfig() const { return config_; }

    using MaskFn = std::string (*)(const std::string& value);

    /// @brief A detection rule. Only the value_group span is masked; text
    /// matched around it (labels, separators) is kept.
    struct Rule {
        PIIType type;
        std::regex regex;
        int value_group;
        MaskFn mask;
    };

    /// @brief Built-in rule table, compiled on first use
    static const std::vector<Rule>& DefaultRules();

private:
    /// Non-overlapping matches of the given types, ascending by start
    std::vector<PIIMatch> Scan(const std::string& text,
                               const std::vector<PIIType>& types) const;

    static PIIRedactionResult Splice(const std::string& text, std::vector<PIIMatch> matches);

    PIIRedactionConfig config_;
};

// =============================================================================
// String conversions
// =============================================================================

std::string PIITypeToString(PIIType type);
absl::StatusOr<PIIType> ParsePIIType(std::string_view name);

std::string RiskLevelToString(RiskLevel level);

}  // namespace aegis::guardrails
