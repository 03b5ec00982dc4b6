/// @file guardrails_config.cpp
/// @brief Guardrail settings loading and validation

#include "guardrails/guardrails_config.h"

#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>

#include "common/error.h"

namespace aegis::guardrails {

namespace {

/// Strict typed reads under a key prefix; absent keys leave the target untouched
class SectionReader {
public:
    SectionReader(const Config& config, std::string prefix)
        : config_(config), prefix_(std::move(prefix)) {}

    SectionReader Child(std::string_view name) const {
        return SectionReader(config_, absl::StrCat(prefix_, ".", absl::string_view(name.data(), name.size())));
    }

    absl::Status Read(std::string_view key, bool& out) const {
        const std::string path = Path(key);
        if (!config_.HasKey(path)) return absl::OkStatus();
        if (!absl::SimpleAtob(config_.GetString(path), &out)) {
            return Malformed(path, "a boolean");
        }
        return absl::OkStatus();
    }

    absl::Status Read(std::string_view key, double& out) const {
        const std::string path = Path(key);
        if (!config_.HasKey(path)) return absl::OkStatus();
        if (!absl::SimpleAtod(config_.GetString(path), &out)) {
            return Malformed(path, "a number");
        }
        return absl::OkStatus();
    }

    absl::Status Read(std::string_view key, int& out) const {
        const std::string path = Path(key);
        if (!config_.HasKey(path)) return absl::OkStatus();
        if (!absl::SimpleAtoi(config_.GetString(path), &out)) {
            return Malformed(path, "an integer");
        }
        return absl::OkStatus();
    }

    absl::Status Read(std::string_view key, std::string& out) const {
        const std::string path = Path(key);
        if (config_.HasKey(path)) {
            out = config_.GetString(path, out);
        }
        return absl::OkStatus();
    }

    absl::Status Read(std::string_view key, std::vector<std::string>& out) const {
        const std::string path = Path(key);
        if (config_.HasKey(path)) {
            out = config_.GetStringList(path);
        }
        return absl::OkStatus();
    }

    /// Read a list of names and convert each with parse
    template <typename T, typename ParseFn>
    absl::Status ReadNames(std::string_view key, std::vector<T>& out, ParseFn parse) const {
        const std::string path = Path(key);
        if (!config_.HasKey(path)) return absl::OkStatus();

        std::vector<T> parsed;
        for (const auto& name : config_.GetStringList(path)) {
            auto value = parse(name);
            if (!value.ok()) {
                return MakeError(ErrorCode::kInvalidArgument,
                                 absl::StrCat(path, ": ", value.status().message()));
            }
            parsed.push_back(*value);
        }
        out = std::move(parsed);
        return absl::OkStatus();
    }

    /// Read a single name and convert it with parse
    template <typename T, typename ParseFn>
    absl::Status ReadName(std::string_view key, T& out, ParseFn parse) const {
        const std::string path = Path(key);
        if (!config_.HasKey(path)) return absl::OkStatus();

        auto value = parse(config_.GetString(path));
        if (!value.ok()) {
            return MakeError(ErrorCode::kInvalidArgument,
                             absl::StrCat(path, ": ", value.status().message()));
        }
        out = *value;
        return absl::OkStatus();
    }

private:
    std::string Path(std::string_view key) const {
        return absl::StrCat(prefix_, ".", absl::string_view(key.data(), key.size()));
    }

    static absl::Status Malformed(const std::string& path, std::string_view expected) {
        return MakeError(ErrorCode::kInvalidArgument,
                         absl::StrCat(path, " must be ", absl::string_view(expected.data(), expected.size())));
    }

    const Config& config_;
    std::string prefix_;
};

absl::Status CheckUnitInterval(std::string_view name, double value) {
    if (value < 0.0 || value > 1.0) {
        return MakeError(ErrorCode::kValidationError,
                         absl::StrCat(absl::string_view(name.data(), name.size()), " must be within [0, 1], got ", value));
    }
    return absl::OkStatus();
}

}  // namespace

GuardrailsConfig GuardrailsConfig::Default() {
    return GuardrailsConfig{};
}

absl::StatusOr<GuardrailsConfig> GuardrailsConfig::FromConfig(const Config& config) {
    GuardrailsConfig result = Default();
    const SectionReader root(config, "guardrails");

    AEGIS_RETURN_IF_ERROR(root.Read("enabled", result.enabled));

    // Prompt injection
    const auto injection = root.Child("prompt_injection");
    AEGIS_RETURN_IF_ERROR(injection.Read("enabled", result.prompt_injection.enabled));
    AEGIS_RETURN_IF_ERROR(injection.Read("confidence_threshold",
                                         result.prompt_injection.confidence_threshold));
    AEGIS_RETURN_IF_ERROR(injection.Read("block_on_detection",
                                         result.prompt_injection.block_on_detection));
    AEGIS_RETURN_IF_ERROR(injection.Read("additional_phrases",
                                         result.prompt_injection.additional_phrases));

    // Content moderation
    auto& moderation = result.content_moderation;
    const auto mod = root.Child("content_moderation");
    AEGIS_RETURN_IF_ERROR(mod.Read("enabled", moderation.enabled));
    AEGIS_RETURN_IF_ERROR(mod.ReadName("provider", moderation.provider, ParseProviderSelection));
    AEGIS_RETURN_IF_ERROR(mod.Read("score_threshold", moderation.score_threshold));
    AEGIS_RETURN_IF_ERROR(mod.ReadNames("block_categories", moderation.block_categories,
                                        ParseModerationCategory));
    AEGIS_RETURN_IF_ERROR(mod.ReadName("failure_policy", moderation.failure_policy,
                                       ParseFailurePolicy));
    AEGIS_RETURN_IF_ERROR(mod.Read("api_endpoint", moderation.api_endpoint));
    AEGIS_RETURN_IF_ERROR(mod.Read("api_key", moderation.api_key));
    AEGIS_RETURN_IF_ERROR(mod.Read("model", moderation.model));
    AEGIS_RETURN_IF_ERROR(mod.Read("llm_endpoint", moderation.llm_endpoint));
    AEGIS_RETURN_IF_ERROR(mod.Read("llm_model", moderation.llm_model));
    AEGIS_RETURN_IF_ERROR(mod.Read("timeout_ms", moderation.timeout_ms));

    // PII
    const auto pii = root.Child("pii_redaction");
    AEGIS_RETURN_IF_ERROR(pii.Read("enabled", result.pii_redaction.enabled));
    AEGIS_RETURN_IF_ERROR(pii.ReadNames("types_to_redact", result.pii_redaction.types_to_redact,
                                        ParsePIIType));
    AEGIS_RETURN_IF_ERROR(pii.Read("redact_in_logs", result.pii_redaction.redact_in_logs));
    AEGIS_RETURN_IF_ERROR(pii.Read("redact_in_responses",
                                   result.pii_redaction.redact_in_responses));

    // Blocking
    const auto blocking = root.Child("blocking");
    AEGIS_RETURN_IF_ERROR(blocking.Read("block_on_violation", result.blocking.block_on_violation));
    AEGIS_RETURN_IF_ERROR(blocking.Read("block_message", result.blocking.block_message));
    AEGIS_RETURN_IF_ERROR(blocking.Read("allow_bypass", result.blocking.allow_bypass));
    AEGIS_RETURN_IF_ERROR(blocking.Read("bypass_roles", result.blocking.bypass_roles));

    // Audit logging
    const auto logging = root.Child("logging");
    AEGIS_RETURN_IF_ERROR(logging.Read("log_violations", result.logging.log_violations));
    AEGIS_RETURN_IF_ERROR(logging.Read("log_all_checks", result.logging.log_all_checks));
    AEGIS_RETURN_IF_ERROR(logging.Read("redact_sensitive_data",
                                       result.logging.redact_sensitive_data));

    // Severity
    const auto severity = root.Child("severity");
    AEGIS_RETURN_IF_ERROR(severity.Read("critical_threshold", result.severity.critical));
    AEGIS_RETURN_IF_ERROR(severity.Read("high_threshold", result.severity.high));

    AEGIS_RETURN_IF_ERROR(result.Validate());
    return result;
}

absl::StatusOr<GuardrailsConfig> GuardrailsConfig::Load(
    const std::optional<std::filesystem::path>& path,
    std::string_view env_prefix) {
    AEGIS_ASSIGN_OR_RETURN(auto config, Config::LoadLayered(path, env_prefix));
    return FromConfig(config);
}

absl::Status GuardrailsConfig::Validate() const {
    AEGIS_RETURN_IF_ERROR(CheckUnitInterval("prompt_injection.confidence_threshold",
                                            prompt_injection.confidence_threshold));
    AEGIS_RETURN_IF_ERROR(CheckUnitInterval("content_moderation.score_threshold",
                                            content_moderation.score_threshold));
    AEGIS_RETURN_IF_ERROR(CheckUnitInterval("severity.critical_threshold", severity.critical));
    AEGIS_RETURN_IF_ERROR(CheckUnitInterval("severity.high_threshold", severity.high));

    if (severity.high > severity.critical) {
        return MakeError(ErrorCode::kValidationError,
                         "severity.high_threshold must not exceed severity.critical_threshold");
    }
    if (content_moderation.timeout_ms <= 0) {
        return MakeError(ErrorCode::kValidationError,
                         "content_moderation.timeout_ms must be positive");
    }
    if (blocking.block_message.empty()) {
        return MakeError(ErrorCode::kValidationError, "blocking.block_message must not be empty");
    }
    return absl::OkStatus();
}

}  // namespace aegis::guardrails
