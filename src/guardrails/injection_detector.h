#pragma once

/// @file injection_detector.h
/// @brief Prompt injection and jailbreak detection
///
/// Weighted rule table over normalized text:
/// - Jailbreak personas and safety bypass requests
/// - Instruction override ("ignore previous instructions")
/// - Context manipulation (system prompt extraction, fake role markers)
/// - Role hijacking ("you are now ...")
///
/// Each matching rule adds its weight; each suspicious phrase adds 0.30.
/// The sum is clamped to 1.0 and compared against the configured threshold.

#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace aegis::guardrails {

/// @brief Family a detection rule belongs to
enum class InjectionCategory {
    kJailbreak,
    kInstructionOverride,
    kContextManipulation,
    kRoleHijack
};

/// @brief Result of injection detection
struct InjectionResult {
    bool is_injection = false;
    double confidence = 0.0;  ///< 0.0 - 1.0

    /// Descriptions of matched rules (table order), then matched phrases
    std::vector<std::string> patterns;

    /// Category with the most matched rules; unset when no rule matched
    std::optional<InjectionCategory> category;
};

/// @brief Configuration for prompt injection detection
struct PromptInjectionConfig {
    bool enabled = true;

    /// Confidence at or above which text counts as an injection
    double confidence_threshold = 0.7;

    /// Block the input when an injection is detected
    bool block_on_detection = true;

    /// Extra case-insensitive phrases, each weighted like the built-in ones
    std::vector<std::string> additional_phrases;
};

/// @brief Stateless prompt injection detector
///
/// The rule table is compiled once per process and shared by every
/// instance; Detect() is const and safe to call from any thread.
///
/// Example:
/// @code
///   PromptInjectionConfig config;
///   config.confidence_threshold = 0.8;
///   InjectionDetector detector(config);
///
///   auto result = detector.Detect(user_input);
///   if (result.is_injection) {
///       AEGIS_LOG_WARN("Injection attempt: {}", detector.Explain(result));
///   }
/// @endcode
class InjectionDetector {
public:
    /// Weight contributed by each suspicious phrase found in the text
    static constexpr double kPhraseWeight = 0.30;

    explicit InjectionDetector(PromptInjectionConfig config = {});

    /// @brief Detect injection in text
    InjectionResult Detect(const std::string& content) const;

    /// @brief One-line human readable summary of a result
    std::string Explain(const InjectionResult& result) const;

    const PromptInjectionConfig& GetConfig() const { return config_; }

    /// @brief Collapse whitespace runs and map typographic quotes to ASCII
    static std::string NormalizeText(const std::string& text);

    /// @brief A single weighted detection rule
    struct Rule {
        std::regex regex;
        InjectionCategory category;
        double weight;
        std::string description;
    };

    /// @brief Built-in rule table, compiled on first use
    static const std::vector<Rule>& DefaultRules();

    /// @brief Built-in suspicious phrases (lowercase)
    static const std::vector<std::string>& DefaultPhrases();

private:
    PromptInjectionConfig config_;

    /// Built-in plus configured phrases, lowercased
    std::vector<std::string> phrases_;
};

/// @brief Convert category to string
std::string InjectionCategoryToString(InjectionCategory category);

}  // namespace aegis::guardrails
