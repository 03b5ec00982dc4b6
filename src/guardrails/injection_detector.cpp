/// @file injection_detector.cpp
/// @brief Prompt injection detection implementation

#include "guardrails/injection_detector.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <iomanip>
#include <iterator>
#include <sstream>

#include <absl/strings/ascii.h>

namespace aegis::guardrails {

namespace {

struct RuleSpec {
    const char* pattern;
    InjectionCategory category;
    double weight;
    const char* description;
};

// Jailbreak rules come first: category ties resolve to the earliest table entry.
constexpr RuleSpec kRuleSpecs[] = {
    // Jailbreak personas and safety bypass
    {R"(\bignore\s+(all\s+)?(of\s+)?(the\s+|your\s+)?(previous|prior|above|earlier)\s+(instructions?|prompts?|rules|directions))",
     InjectionCategory::kJailbreak, 0.9, "Instruction to ignore previous instructions"},
    {R"(\b(DAN\s+mode|do\s+anything\s+now)\b)",
     InjectionCategory::kJailbreak, 0.9, "DAN / do-anything-now persona"},
    {R"(\b(developer|god|unrestricted|jailbreak)\s+mode\b)",
     InjectionCategory::kJailbreak, 0.8, "Request to enter an unrestricted mode"},
    {R"(\bjailbr(eak|oken|eaking)\b)",
     InjectionCategory::kJailbreak, 0.7, "Explicit jailbreak reference"},
    {R"(\bbypass\s+(your\s+|the\s+|all\s+|any\s+)?(safety\s+|content\s+|ethical\s+)?(filters?|restrictions?|guidelines|guardrails|safeguards))",
     InjectionCategory::kJailbreak, 0.7, "Request to bypass safety filters"},
    {R"(\bpretend\s+(that\s+)?you\s+(have|are\s+under)\s+no\s+(rules|restrictions|limits|guidelines))",
     InjectionCategory::kJailbreak, 0.8, "Pretend-no-rules framing"},
    {R"(\b(without|with\s+no)\s+(any\s+)?(ethical|moral|safety)\s+(restrictions|guidelines|constraints|limits))",
     InjectionCategory::kJailbreak, 0.6, "Request to drop ethical constraints"},
    {R"(\b(evil|uncensored|unfiltered)\s+(ai|assistant|mode|version|response)\b)",
     InjectionCategory::kJailbreak, 0.6, "Uncensored persona request"},

    // Instruction override
    {R"(\bdisregard\s+(all\s+)?(the\s+|your\s+)?(previous\s+|prior\s+|above\s+|earlier\s+)?(instructions?|prompts?|rules|guidelines))",
     InjectionCategory::kInstructionOverride, 0.8, "Instruction to disregard prior instructions"},
    {R"(\bforget\s+(all\s+)?(everything|(the\s+|your\s+)?(previous|prior|above)\s+(instructions?|prompts?|rules)))",
     InjectionCategory::kInstructionOverride, 0.7, "Instruction to forget prior context"},
    {R"(\boverride\s+(your\s+|the\s+)?(system|previous|safety)\s+(prompt|instructions?|settings))",
     InjectionCategory::kInstructionOverride, 0.8, "Attempt to override system instructions"},
    {R"(\bnew\s+instructions?\s*:)",
     InjectionCategory::kInstructionOverride, 0.5, "Inline replacement instructions"},
    {R"(\b(from\s+now\s+on|henceforth),?\s+you\s+(will|must|shall)\b)",
     InjectionCategory::kInstructionOverride, 0.4, "Persistent behaviour change request"},
    {R"(\bdo\s+not\s+follow\s+(your|the|any)\s+(previous\s+)?(rules|instructions|guidelines))",
     InjectionCategory::kInstructionOverride, 0.7, "Instruction not to follow rules"},

    // Context manipulation
    {R"(\b(reveal|show|print|display|output|repeat|leak)\s+(me\s+)?(your|the)\s+(system\s+|initial\s+|original\s+|hidden\s+|secret\s+)?(prompt|instructions))",
     InjectionCategory::kContextManipulation, 0.6, "System prompt extraction attempt"},
    {R"(\bwhat\s+(is|are|were)\s+your\s+(system\s+|initial\s+|original\s+)?(prompt|instructions)\b)",
     InjectionCategory::kContextManipulation, 0.5, "Question about hidden instructions"},
    {R"(\[\[?system\]\]?|<\|im_start\|>|<\|im_end\|>|\[/?INST\])",
     InjectionCategory::kContextManipulation, 0.7, "Chat template or role marker injection"},
    {R"(###\s*(system|instructions?)\s*:)",
     InjectionCategory::kContextManipulation, 0.6, "Fake system section header"},
    {R"(\b(end\s+of\s+(the\s+)?(system\s+)?prompt|begin\s+new\s+(session|conversation))\b)",
     InjectionCategory::kContextManipulation, 0.5, "Fake prompt boundary"},

    // Role hijack
    {R"(\byou\s+are\s+now\s+(a|an|the|my)\b)",
     InjectionCategory::kRoleHijack, 0.5, "Identity reassignment"},
    {R"(\b(act|behave)\s+as\s+(if\s+you\s+(are|were)\s+)?(a|an)\s+(different|unrestricted|unfiltered|new)\b)",
     InjectionCategory::kRoleHijack, 0.6, "Request to act as a different assistant"},
    {R"(\bpretend\s+(to\s+be|you\s+are)\s+(a|an)\s+)",
     InjectionCategory::kRoleHijack, 0.4, "Persona pretence"},
    {R"(\brole-?play\s+as\b)",
     InjectionCategory::kRoleHijack, 0.4, "Roleplay framing"},
    {R"(\bsimulate\s+(being\s+)?(a|an)\s+(ai|assistant|chatbot)\s+(without|with\s+no)\b)",
     InjectionCategory::kRoleHijack, 0.6, "Unrestricted assistant simulation"},
};

const char* const kDefaultPhrases[] = {
    "ignore all previous",
    "ignore previous instructions",
    "disregard your instructions",
    "system prompt",
    "no restrictions",
    "without restrictions",
    "developer mode",
    "you must obey",
    "override your",
    "unfiltered response",
    "stay in character",
    "opposite mode",
};

constexpr size_t kNumCategories = 4;

// Replace a UTF-8 sequence at position i with an ASCII character, if it is one
// of the typographic quotes or a non-breaking space.
bool ReplaceTypographic(const std::string& text, size_t i, char& replacement, size_t& width) {
    const auto byte = [&](size_t k) { return static_cast<unsigned char>(text[k]); };

    if (byte(i) == 0xC2 && i + 1 < text.size() && byte(i + 1) == 0xA0) {
        replacement = ' ';
        width = 2;
        return true;
    }
    if (byte(i) == 0xE2 && i + 2 < text.size() && byte(i + 1) == 0x80) {
        switch (byte(i + 2)) {
            case 0x98:  // left single quote
            case 0x99:  // right single quote
                replacement = '\'';
                width = 3;
                return true;
            case 0x9C:  // left double quote
            case 0x9D:  // right double quote
                replacement = '"';
                width = 3;
                return true;
            default:
                break;
        }
    }
    return false;
}

}  // namespace

InjectionDetector::InjectionDetector(PromptInjectionConfig config)
    : config_(std::move(config)) {
    phrases_ = DefaultPhrases();
    for (const auto& phrase : config_.additional_phrases) {
        std::string lower = absl::AsciiStrToLower(NormalizeText(phrase));
        if (!lower.empty() &&
            std::find(phrases_.begin(), phrases_.end(), lower) == phrases_.end()) {
            phrases_.push_back(std::move(lower));
        }
    }
}

InjectionResult InjectionDetector::Detect(const std::string& content) const {
    InjectionResult result;

    const std::string normalized = NormalizeText(content);
    if (normalized.empty()) {
        return result;
    }

    double total_weight = 0.0;
    std::array<size_t, kNumCategories> category_counts{};
    // Position of each category's first rule in the table, for tie breaking
    std::array<size_t, kNumCategories> first_index;
    first_index.fill(SIZE_MAX);

    const auto& rules = DefaultRules();
    for (size_t i = 0; i < rules.size(); ++i) {
        const auto& rule = rules[i];
        const auto cat = static_cast<size_t>(rule.category);
        if (first_index[cat] == SIZE_MAX) {
            first_index[cat] = i;
        }
        if (std::regex_search(normalized, rule.regex)) {
            total_weight += rule.weight;
            category_counts[cat]++;
            result.patterns.push_back(rule.description);
        }
    }

    const std::string lowered = absl::AsciiStrToLower(normalized);
    for (const auto& phrase : phrases_) {
        if (lowered.find(phrase) != std::string::npos) {
            total_weight += kPhraseWeight;
            result.patterns.push_back("suspicious phrase: " + phrase);
        }
    }

    // Highest count wins; ties go to the category seen first in the table
    size_t best_count = 0;
    for (size_t cat = 0; cat < kNumCategories; ++cat) {
        if (category_counts[cat] == 0) continue;
        const bool better = category_counts[cat] > best_count ||
            (category_counts[cat] == best_count &&
             first_index[cat] < first_index[static_cast<size_t>(*result.category)]);
        if (better) {
            best_count = category_counts[cat];
            result.category = static_cast<InjectionCategory>(cat);
        }
    }

    result.confidence = std::min(total_weight, 1.0);
    result.is_injection = result.confidence >= config_.confidence_threshold;
    return result;
}

std::string InjectionDetector::Explain(const InjectionResult& result) const {
    if (result.patterns.empty()) {
        return "No prompt injection patterns detected.";
    }

    std::ostringstream oss;
    oss << (result.is_injection ? "Prompt injection detected" : "Suspicious patterns below threshold");
    if (result.category) {
        oss << " (category: " << InjectionCategoryToString(*result.category) << ")";
    }
    oss << ", confidence " << std::fixed << std::setprecision(2) << result.confidence
        << ". Matched " << result.patterns.size() << " pattern(s).";
    return oss.str();
}

std::string InjectionDetector::NormalizeText(const std::string& text) {
    std::string result;
    result.reserve(text.size());

    bool pending_space = false;
    for (size_t i = 0; i < text.size();) {
        char c = text[i];
        size_t width = 1;

        char replacement;
        size_t replaced_width;
        if (ReplaceTypographic(text, i, replacement, replaced_width)) {
            c = replacement;
            width = replaced_width;
        } else if (c == '`') {
            c = '\'';
        }

        if (std::isspace(static_cast<unsigned char>(c))) {
            pending_space = !result.empty();
        } else {
            if (pending_space) {
                result.push_back(' ');
                pending_space = false;
            }
            result.push_back(c);
        }
        i += width;
    }
    return result;
}

const std::vector<InjectionDetector::Rule>& InjectionDetector::DefaultRules() {
    static const std::vector<Rule> rules = [] {
        std::vector<Rule> compiled;
        compiled.reserve(std::size(kRuleSpecs));
        for (const auto& spec : kRuleSpecs) {
            compiled.push_back(Rule{
                std::regex(spec.pattern, std::regex::icase | std::regex::optimize),
                spec.category,
                spec.weight,
                spec.description});
        }
        return compiled;
    }();
    return rules;
}

const std::vector<std::string>& InjectionDetector::DefaultPhrases() {
    static const std::vector<std::string> phrases(
        std::begin(kDefaultPhrases), std::end(kDefaultPhrases));
    return phrases;
}

std::string InjectionCategoryToString(InjectionCategory category) {
    switch (category) {
        case InjectionCategory::kJailbreak: return "jailbreak";
        case InjectionCategory::kInstructionOverride: return "instruction_override";
        case InjectionCategory::kContextManipulation: return "context_manipulation";
        case InjectionCategory::kRoleHijack: return "role_hijack";
    }
    return "unknown";
}

}  // namespace aegis::guardrails
