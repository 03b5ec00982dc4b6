/// @file pattern_moderation_provider.cpp
/// @brief Regex moderation rules

#include "guardrails/pattern_moderation_provider.h"

#include <algorithm>
#include <iterator>

#include <absl/strings/ascii.h>

namespace aegis::guardrails {

namespace {

struct RuleSpec {
    const char* pattern;
    ModerationCategory category;
    double weight;
};

constexpr RuleSpec kRuleSpecs[] = {
    // Hate
    {R"(\b(kill\s+all|exterminate|genocide|ethnic\s+cleansing)\b)",
     ModerationCategory::kHateThreatening, 0.9},
    {R"(\b(racial\s+slurs?|hate\s+groups?|white\s+supremac\w*|neo-?nazis?)\b)",
     ModerationCategory::kHate, 0.8},

    // Violence
    {R"(\bhow\s+to\s+(make|build)\s+(a\s+|an\s+)?(bomb|explosive|pipe\s+bomb|weapon)s?\b)",
     ModerationCategory::kViolence, 0.95},
    {R"(\b(murder|assassinate|torture)\s+(instructions?|guide|how\s+to)\b)",
     ModerationCategory::kViolenceGraphic, 0.9},
    {R"(\b(dismember(ed|ing)?|graphic\s+gore|mutilat(e|ed|ion))\b)",
     ModerationCategory::kViolenceGraphic, 0.8},

    // Self-harm
    {R"(\b(how\s+to\s+(kill|harm|hurt)\s+(yourself|myself)|suicide\s+methods?)\b)",
     ModerationCategory::kSelfHarmInstructions, 0.95},
    {R"(\b(want\s+to\s+(die|end\s+it|kill\s+myself)|planning\s+(my\s+)?suicide)\b)",
     ModerationCategory::kSelfHarmIntent, 0.9},
    {R"(\b(self-?harm(ing)?|cutting\s+myself)\b)",
     ModerationCategory::kSelfHarm, 0.7},

    // Harassment
    {R"(\b(i\s+will\s+(find|hurt|kill)\s+you|threat(en)?\s+(your|you))\b)",
     ModerationCategory::kHarassmentThreatening, 0.9},
    {R"(\b(doxx(ing|ed)?|reveal\s+(your\s+|their\s+)?personal\s+info(rmation)?)\b)",
     ModerationCategory::kHarassment, 0.8},

    // Sexual
    {R"(\b(explicit\s+sexual|pornograph(ic|y)|sexual\s+content)\b)",
     ModerationCategory::kSexual, 0.7},
    {R"(\b(child|minor|underage)\s+(porn\w*|sexual\w*|nudes?)\b)",
     ModerationCategory::kSexualMinors, 1.0},

    // Illicit
    {R"(\b(synthesi[sz]e|cook|manufacture)\s+(meth(amphetamine)?|fentanyl|heroin)\b)",
     ModerationCategory::kIllicit, 0.9},
    {R"(\b(buy|sell)\s+(stolen\s+credit\s+cards?|counterfeit\s+(money|bills))\b)",
     ModerationCategory::kIllicit, 0.85},
};

}  // namespace

absl::StatusOr<ModerationResult> PatternModerationProvider::Moderate(
    const std::string& content) const {
    return Classify(content);
}

ModerationResult PatternModerationProvider::Classify(const std::string& content) const {
    ModerationResult result = ModerationResult::Empty(ProviderKind::kPattern);

    const std::string normalized = absl::AsciiStrToLower(content);
    for (const auto& rule : DefaultRules()) {
        if (std::regex_search(normalized, rule.regex)) {
            result.categories[rule.category] = true;
            result.category_scores[rule.category] =
                std::max(result.category_scores[rule.category], rule.weight);
        }
    }

    result.flagged = std::any_of(
        result.categories.begin(), result.categories.end(),
        [](const auto& entry) { return entry.second; });
    return result;
}

const std::vector<PatternModerationProvider::Rule>& PatternModerationProvider::DefaultRules() {
    static const std::vector<Rule> rules = [] {
        std::vector<Rule> compiled;
        compiled.reserve(std::size(kRuleSpecs));
        for (const auto& spec : kRuleSpecs) {
            compiled.push_back(Rule{
                std::regex(spec.pattern, std::regex::icase | std::regex::optimize),
                spec.category,
                spec.weight});
        }
        return compiled;
    }();
    return rules;
}

}  // namespace aegis::guardrails
