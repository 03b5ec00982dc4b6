/// @file main.cpp
/// @brief aegis_check: run the guardrail pipeline over a piece of text

#include <filesystem>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include "common/config.h"
#include "common/logging.h"
#include "guardrails/guardrails_config.h"
#include "guardrails/guardrails_service.h"

namespace {

enum ExitCode {
    kExitPassed = 0,
    kExitViolations = 1,
    kExitBlocked = 2,
    kExitConfigError = 3,
};

std::string ReadStdin() {
    return std::string(std::istreambuf_iterator<char>(std::cin),
                       std::istreambuf_iterator<char>());
}

}  // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"aegis_check - screen text with the Aegis guardrail pipeline"};

    std::string config_path;
    std::string mode = "input";
    std::optional<std::string> text;
    std::optional<std::string> user_id;
    std::optional<std::string> session_id;
    std::optional<std::string> role;
    std::string log_level;
    std::string audit_file;
    bool bypass = false;
    bool skip_injection = false;
    bool skip_moderation = false;
    bool skip_pii = false;
    bool pretty = false;

    app.add_option("-c,--config", config_path, "Path to YAML configuration file")
        ->check(CLI::ExistingFile);
    app.add_option("-m,--mode", mode, "Which side of the model to check")
        ->check(CLI::IsMember({"input", "output"}));
    app.add_option("-t,--text", text, "Text to check (read from stdin when omitted)");
    app.add_option("--user-id", user_id, "Caller user id recorded in the audit entry");
    app.add_option("--session-id", session_id, "Caller session id recorded in the audit entry");
    app.add_option("--role", role, "Caller role, consulted for bypass");
    app.add_flag("--bypass", bypass, "Request that a block be bypassed");
    app.add_flag("--skip-injection", skip_injection, "Skip prompt injection detection");
    app.add_flag("--skip-moderation", skip_moderation, "Skip content moderation");
    app.add_flag("--skip-pii", skip_pii, "Skip PII detection / redaction");
    app.add_option("--log-level", log_level, "Log level (trace, debug, info, warn, error, off)");
    app.add_option("--audit-file", audit_file, "Write audit records to this file");
    app.add_flag("--pretty", pretty, "Indent the JSON result");

    CLI11_PARSE(app, argc, argv);

    // Configuration tree: file, then AEGIS_* environment overrides
    std::optional<std::filesystem::path> path;
    if (!config_path.empty()) {
        path = config_path;
    }
    auto tree_or = aegis::Config::LoadLayered(path);
    if (!tree_or.ok()) {
        std::cerr << "Failed to load configuration: " << tree_or.status().message() << std::endl;
        return kExitConfigError;
    }
    const aegis::Config& tree = *tree_or;

    // Logging goes to stderr so stdout carries only the result
    aegis::LogConfig log_config;
    log_config.name = "aegis";
    log_config.console_stderr = true;
    log_config.level = aegis::LogLevel::kWarn;
    if (log_level.empty()) {
        log_level = tree.GetString("logging.level");
    }
    if (!log_level.empty()) {
        auto level = aegis::ParseLogLevel(log_level);
        if (!level.ok()) {
            std::cerr << level.status().message() << std::endl;
            return kExitConfigError;
        }
        log_config.level = *level;
    }
    log_config.audit_file_path = audit_file.empty() ? tree.GetString("logging.audit_file")
                                                    : audit_file;
    aegis::InitLogging(log_config);

    auto config_or = aegis::guardrails::GuardrailsConfig::FromConfig(tree);
    if (!config_or.ok()) {
        AEGIS_LOG_ERROR("Invalid guardrails configuration: {}", config_or.status().ToString());
        aegis::ShutdownLogging();
        return kExitConfigError;
    }
    if (!config_path.empty()) {
        AEGIS_LOG_INFO("Loaded configuration from {}", config_path);
    }

    aegis::guardrails::GuardrailsService service(*config_or);

    aegis::guardrails::CheckOptions options;
    options.user_id = user_id;
    options.session_id = session_id;
    options.user_role = role;
    options.bypass_blocking = bypass;
    options.skip_prompt_injection = skip_injection;
    options.skip_content_moderation = skip_moderation;
    options.skip_pii_redaction = skip_pii;

    const std::string content = text ? *text : ReadStdin();

    const auto result = mode == "output" ? service.CheckOutput(content, options)
                                         : service.CheckInput(content, options);

    std::cout << aegis::guardrails::ToJson(result).dump(
                     pretty ? 2 : -1, ' ', false, nlohmann::json::error_handler_t::replace)
              << std::endl;

    aegis::ShutdownLogging();

    if (result.blocked) {
        return kExitBlocked;
    }
    return result.passed ? kExitPassed : kExitViolations;
}
