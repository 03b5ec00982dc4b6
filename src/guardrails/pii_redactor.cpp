/// @file pii_redactor.cpp
/// @brief PII detection and masking implementation

#include "guardrails/pii_redactor.h"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <iterator>
#include <map>
#include <sstream>

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>

namespace aegis::guardrails {

namespace {

constexpr size_t kMaskedSecretLength = 16;

// libstdc++ regex matching recurses per character, so rules run over
// bounded windows. The overlap is longer than any rule can match.
constexpr size_t kScanWindowBytes = 4096;
constexpr size_t kScanOverlapBytes = 1024;
constexpr size_t kScanStrideBytes = kScanWindowBytes - kScanOverlapBytes;

std::string LastDigits(const std::string& value, size_t count) {
    std::string digits;
    for (char c : value) {
        if (std::isdigit(static_cast<unsigned char>(c))) {
            digits.push_back(c);
        }
    }
    if (digits.size() > count) {
        digits.erase(0, digits.size() - count);
    }
    return digits;
}

// =============================================================================
// Masks
// =============================================================================

std::string MaskEmail(const std::string& value) {
    const auto at = value.find('@');
    const std::string local = value.substr(0, at);
    const std::string domain = value.substr(at);

    if (local.size() <= 2) {
        return std::string(local.size(), '*') + domain;
    }
    return local.front() + std::string(local.size() - 2, '*') + local.back() + domain;
}

std::string MaskPhone(const std::string& value) {
    return "***-***-" + LastDigits(value, 4);
}

std::string MaskSSN(const std::string&) {
    return "***-**-****";
}

std::string MaskCreditCard(const std::string& value) {
    return "****-****-****-" + LastDigits(value, 4);
}

std::string MaskIPAddress(const std::string& value) {
    return value.substr(0, value.find('.')) + ".***.***.***";
}

std::string MaskSecret(const std::string&) {
    return std::string(kMaskedSecretLength, '*');
}

std::string MaskPassword(const std::string&) {
    return "********";
}

std::string MaskDate(const std::string&) {
    return "**/**/****";
}

std::string MaskAddress(const std::string&) {
    return "[REDACTED ADDRESS]";
}

std::string MaskName(const std::string&) {
    return "[REDACTED NAME]";
}

// =============================================================================
// Rule table
// =============================================================================

struct RuleSpec {
    PIIType type;
    const char* pattern;
    bool icase;
    int value_group;
    PIIRedactor::MaskFn mask;
};

const RuleSpec kRuleSpecs[] = {
    // Secrets first: a labeled secret should win over any number inside it
    {PIIType::kAPIKey,
     R"(\bBearer\s{1,8}([A-Za-z0-9._~+/=-]{16,256}))",
     true, 1, MaskSecret},
    {PIIType::kAPIKey,
     R"(\b(?:api[_-]?key|access[_-]?token|secret[_-]?key|auth[_-]?token)\s{0,8}[=:]\s{0,8}["']?([A-Za-z0-9._-]{8,256}))",
     true, 1, MaskSecret},
    {PIIType::kAPIKey,
     R"(\b(?:sk|pk|rk)[-_](?:(?:live|test|proj)[-_])?([A-Za-z0-9]{16,256}))",
     false, 1, MaskSecret},
    {PIIType::kPassword,
     R"(\b(?:password|passwd|pwd|pass)\s{0,8}[=:]\s{0,8}(\S{1,256}))",
     true, 1, MaskPassword},

    {PIIType::kSSN,
     R"(\b\d{3}([-\s])\d{2}\1\d{4}\b)",
     false, 0, MaskSSN},
    {PIIType::kCreditCard,
     R"(\b(?:\d{4}[-\s]?){3}\d{4}\b)",
     false, 0, MaskCreditCard},
    {PIIType::kEmail,
     R"(\b[A-Za-z0-9._%+-]{1,64}@[A-Za-z0-9.-]{1,253}\.[A-Za-z]{2,24}\b)",
     false, 0, MaskEmail},
    {PIIType::kPhone,
     R"((?:\+?1[-.\s]?)?(?:\(\d{3}\)|\b\d{3})[-.\s]?\d{3}[-.\s]?\d{4}\b)",
     false, 0, MaskPhone},
    {PIIType::kIPAddress,
     R"(\b(?:(?:25[0-5]|2[0-4]\d|1\d\d|[1-9]?\d)\.){3}(?:25[0-5]|2[0-4]\d|1\d\d|[1-9]?\d)\b)",
     false, 0, MaskIPAddress},
    {PIIType::kDateOfBirth,
     R"(\b(?:dob|date\s{1,4}of\s{1,4}birth|birth\s{0,4}date|born\s{1,4}on)\s{0,8}[:=-]?\s{0,8}(\d{1,2}[/.-]\d{1,2}[/.-]\d{2,4}|\d{4}-\d{2}-\d{2})\b)",
     true, 1, MaskDate},
    // Case-sensitive: relies on capitalized street names
    {PIIType::kAddress,
     R"(\b\d{1,6}\s{1,4}(?:[A-Z][a-z]{1,30}\s{1,4}){1,4}(?:Street|St|Avenue|Ave|Road|Rd|Boulevard|Blvd|Lane|Ln|Drive|Dr|Court|Ct|Way|Place|Pl)\b)",
     false, 0, MaskAddress},
    {PIIType::kName,
     R"(\b(?:[Mm]y\s{1,4}[Nn]ame\s{1,4}[Ii]s|[Nn]ame\s{0,4}:)\s{0,8}([A-Z][a-z]{1,30}(?:\s{1,4}[A-Z][a-z]{1,30}){0,2}))",
     false, 1, MaskName},
};

bool IsHighRisk(PIIType type) {
    return type == PIIType::kSSN || type == PIIType::kCreditCard ||
           type == PIIType::kPassword || type == PIIType::kAPIKey;
}

bool IsMediumRisk(PIIType type) {
    return type == PIIType::kDateOfBirth || type == PIIType::kAddress;
}

}  // namespace

PIIRedactor::PIIRedactor(PIIRedactionConfig config)
    : config_(std::move(config)) {}

PIIRedactionResult PIIRedactor::Detect(const std::string& text) const {
    PIIRedactionResult result;
    result.matches = Scan(text, config_.types_to_redact);
    result.has_pii = !result.matches.empty();
    result.redacted_text = text;
    result.risk_level = CalculateRiskLevel(result.matches);
    return result;
}

PIIRedactionResult PIIRedactor::Redact(const std::string& text) const {
    return Splice(text, Scan(text, config_.types_to_redact));
}

std::string PIIRedactor::RedactForLogging(const std::string& text) const {
    static const std::vector<PIIType> all_types(kAllPIITypes.begin(), kAllPIITypes.end());
    return Splice(text, Scan(text, all_types)).redacted_text;
}

std::vector<PIIMatch> PIIRedactor::Scan(const std::string& text,
                                        const std::vector<PIIType>& types) const {
    struct Candidate {
        PIIMatch match;
        size_t rule_index;
    };
    std::vector<Candidate> candidates;

    const auto& rules = DefaultRules();
    for (size_t i = 0; i < rules.size(); ++i) {
        const auto& rule = rules[i];
        if (std::find(types.begin(), types.end(), rule.type) == types.end()) {
            continue;
        }

        // Each start offset belongs to exactly one window: the one whose
        // stride covers it. The last window owns everything to the end.
        for (size_t window_start = 0;; window_start += kScanStrideBytes) {
            const size_t window_end = std::min(text.size(), window_start + kScanWindowBytes);
            const bool last_window = window_end == text.size();
            const size_t owned_until = last_window ? window_end : window_start + kScanStrideBytes;

            auto flags = std::regex_constants::match_default;
            if (window_start > 0) {
                flags |= std::regex_constants::match_prev_avail;
            }

            const auto begin = text.begin() + static_cast<std::ptrdiff_t>(window_start);
            const auto end = text.begin() + static_cast<std::ptrdiff_t>(window_end);
            for (auto it = std::sregex_iterator(begin, end, rule.regex, flags);
                 it != std::sregex_iterator(); ++it) {
                const std::smatch& m = *it;
                if (m.length(0) == 0) continue;

                const size_t start = window_start + static_cast<size_t>(m.position(0));
                if (start >= owned_until) break;

                const size_t value_offset =
                    static_cast<size_t>(m.position(rule.value_group) - m.position(0));
                const size_t value_length = static_cast<size_t>(m.length(rule.value_group));

                const std::string whole = m.str(0);
                const std::string value = m.str(rule.value_group);

                PIIMatch match;
                match.type = rule.type;
                match.value = whole;
                match.masked = whole.substr(0, value_offset) + rule.mask(value) +
                               whole.substr(value_offset + value_length);
                match.start_index = start;
                match.end_index = start + whole.size();
                candidates.push_back(Candidate{std::move(match), i});
            }

            if (last_window) break;
        }
    }

    // Earliest start first, then the longer span, then table order
    std::sort(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b) {
        if (a.match.start_index != b.match.start_index) {
            return a.match.start_index < b.match.start_index;
        }
        if (a.match.end_index != b.match.end_index) {
            return a.match.end_index > b.match.end_index;
        }
        return a.rule_index < b.rule_index;
    });

    std::vector<PIIMatch> accepted;
    size_t covered_until = 0;
    for (auto& candidate : candidates) {
        if (!accepted.empty() && candidate.match.start_index < covered_until) {
            continue;
        }
        covered_until = candidate.match.end_index;
        accepted.push_back(std::move(candidate.match));
    }
    return accepted;
}

PIIRedactionResult PIIRedactor::Splice(const std::string& text, std::vector<PIIMatch> matches) {
    PIIRedactionResult result;
    result.redacted_text = text;

    // Right to left so earlier offsets stay valid
    std::sort(matches.begin(), matches.end(), [](const PIIMatch& a, const PIIMatch& b) {
        return a.start_index > b.start_index;
    });
    for (const auto& match : matches) {
        result.redacted_text.replace(match.start_index,
                                     match.end_index - match.start_index,
                                     match.masked);
    }
    std::sort(matches.begin(), matches.end(), [](const PIIMatch& a, const PIIMatch& b) {
        return a.start_index < b.start_index;
    });

    result.has_pii = !matches.empty();
    result.risk_level = CalculateRiskLevel(matches);
    result.matches = std::move(matches);
    return result;
}

RiskLevel PIIRedactor::CalculateRiskLevel(const std::vector<PIIMatch>& matches) {
    if (matches.empty()) {
        return RiskLevel::kNone;
    }

    bool medium = matches.size() >= 3;
    for (const auto& match : matches) {
        if (IsHighRisk(match.type)) {
            return RiskLevel::kHigh;
        }
        medium = medium || IsMediumRisk(match.type);
    }
    return medium ? RiskLevel::kMedium : RiskLevel::kLow;
}

std::string PIIRedactor::Summarize(const PIIRedactionResult& result) const {
    if (!result.has_pii) {
        return "No PII detected";
    }

    // Keep first-seen order of types
    std::vector<std::pair<PIIType, size_t>> counts;
    for (const auto& match : result.matches) {
        auto it = std::find_if(counts.begin(), counts.end(),
                               [&](const auto& entry) { return entry.first == match.type; });
        if (it == counts.end()) {
            counts.emplace_back(match.type, 1);
        } else {
            it->second++;
        }
    }

    std::ostringstream oss;
    oss << result.matches.size() << " PII item(s): ";
    for (size_t i = 0; i < counts.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << PIITypeToString(counts[i].first) << " x" << counts[i].second;
    }
    oss << " (risk: " << RiskLevelToString(result.risk_level) << ")";
    return oss.str();
}

const std::vector<PIIRedactor::Rule>& PIIRedactor::DefaultRules() {
    static const std::vector<Rule> rules = [] {
        std::vector<Rule> compiled;
        compiled.reserve(std::size(kRuleSpecs));
        for (const auto& spec : kRuleSpecs) {
            auto flags = std::regex::ECMAScript | std::regex::optimize;
            if (spec.icase) {
                flags |= std::regex::icase;
            }
            compiled.push_back(Rule{spec.type, std::regex(spec.pattern, flags),
                                    spec.value_group, spec.mask});
        }
        return compiled;
    }();
    return rules;
}

// =============================================================================
// String conversions
// =============================================================================

std::string PIITypeToString(PIIType type) {
    switch (type) {
        case PIIType::kEmail: return "email";
        case PIIType::kPhone: return "phone";
        case PIIType::kSSN: return "ssn";
        case PIIType::kCreditCard: return "credit_card";
        case PIIType::kIPAddress: return "ip_address";
        case PIIType::kAPIKey: return "api_key";
        case PIIType::kPassword: return "password";
        case PIIType::kDateOfBirth: return "date_of_birth";
        case PIIType::kAddress: return "address";
        case PIIType::kName: return "name";
    }
    return "unknown";
}

absl::StatusOr<PIIType> ParsePIIType(std::string_view name) {
    const std::string lower = absl::AsciiStrToLower(absl::string_view(name.data(), name.size()));
    for (auto type : kAllPIITypes) {
        if (PIITypeToString(type) == lower) {
            return type;
        }
    }
    return absl::InvalidArgumentError(absl::StrCat("Unknown PII type: ", absl::string_view(name.data(), name.size())));
}

std::string RiskLevelToString(RiskLevel level) {
    switch (level) {
        case RiskLevel::kNone: return "none";
        case RiskLevel::kLow: return "low";
        case RiskLevel::kMedium: return "medium";
        case RiskLevel::kHigh: return "high";
    }
    return "none";
}

}  // namespace aegis::guardrails
