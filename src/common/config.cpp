#include "config.h"

#include <cstdlib>
#include <functional>
#include <utility>

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_split.h>
#include <absl/strings/strip.h>

namespace aegis {

namespace {

/// Environment variable suffix -> configuration key
constexpr std::pair<const char*, const char*> kEnvironmentKeys[] = {
    {"GUARDRAILS_ENABLED", "guardrails.enabled"},
    {"MODERATION_PROVIDER", "guardrails.content_moderation.provider"},
    {"MODERATION_API_KEY", "guardrails.content_moderation.api_key"},
    {"MODERATION_ENDPOINT", "guardrails.content_moderation.api_endpoint"},
    {"MODERATION_FAILURE_POLICY", "guardrails.content_moderation.failure_policy"},
    {"MODERATION_TIMEOUT_MS", "guardrails.content_moderation.timeout_ms"},
    {"INJECTION_THRESHOLD", "guardrails.prompt_injection.confidence_threshold"},
    {"PII_TYPES", "guardrails.pii_redaction.types_to_redact"},
    {"ALLOW_BYPASS", "guardrails.blocking.allow_bypass"},
    {"BLOCK_MESSAGE", "guardrails.blocking.block_message"},
    {"LOG_ALL_CHECKS", "guardrails.logging.log_all_checks"},
    {"LOG_LEVEL", "logging.level"},
    {"AUDIT_LOG_FILE", "logging.audit_file"},
};

}  // namespace

absl::StatusOr<Config> Config::LoadFromFile(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return absl::NotFoundError(
            absl::StrCat("Configuration file not found: ", path.string()));
    }

    try {
        Config config;
        config.root_ = YAML::LoadFile(path.string());
        return config;
    } catch (const YAML::Exception& e) {
        return absl::InvalidArgumentError(
            absl::StrCat("Failed to parse YAML configuration: ", e.what()));
    }
}

absl::StatusOr<Config> Config::LoadFromString(std::string_view yaml_content) {
    try {
        Config config;
        config.root_ = YAML::Load(std::string(yaml_content));
        return config;
    } catch (const YAML::Exception& e) {
        return absl::InvalidArgumentError(
            absl::StrCat("Failed to parse YAML content: ", e.what()));
    }
}

Config Config::LoadFromEnvironment(std::string_view prefix) {
    Config config;

    auto get_env = [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value != nullptr && *value != '\0') {
            return std::string(value);
        }
        return std::nullopt;
    };

    for (const auto& [suffix, key] : kEnvironmentKeys) {
        if (auto val = get_env(absl::StrCat(absl::string_view(prefix.data(), prefix.size()), suffix))) {
            config.Set(key, *val);
        }
    }

    return config;
}

absl::StatusOr<Config> Config::LoadLayered(
    const std::optional<std::filesystem::path>& path,
    std::string_view env_prefix) {
    Config config;

    if (path.has_value()) {
        auto file_config = LoadFromFile(*path);
        if (!file_config.ok()) {
            return file_config.status();
        }
        config.Merge(*file_config);
    }

    // Environment variables have the highest priority
    config.Merge(LoadFromEnvironment(env_prefix));

    // The conventional OpenAI variable only fills a key nobody configured
    constexpr const char* kApiKey = "guardrails.content_moderation.api_key";
    if (!config.HasKey(kApiKey)) {
        const char* openai_key = std::getenv("OPENAI_API_KEY");
        if (openai_key != nullptr && *openai_key != '\0') {
            config.Set(kApiKey, std::string(openai_key));
        }
    }
    return config;
}

void Config::Merge(const Config& other) {
    // Deep merge YAML nodes
    std::function<void(YAML::Node&, const YAML::Node&)> merge_nodes;
    merge_nodes = [&merge_nodes](YAML::Node& base, const YAML::Node& overlay) {
        if (overlay.IsMap()) {
            for (const auto& kv : overlay) {
                const std::string key = kv.first.as<std::string>();
                if (base[key] && base[key].IsMap() && kv.second.IsMap()) {
                    YAML::Node base_child = base[key];
                    merge_nodes(base_child, kv.second);
                } else {
                    base[key] = kv.second;
                }
            }
        }
    };

    merge_nodes(root_, other.root_);
}

std::optional<YAML::Node> Config::GetNestedNode(std::string_view key) const {
    std::vector<std::string> parts = absl::StrSplit(absl::string_view(key.data(), key.size()), '.');

    // Const lookups never insert; reset() rebinds instead of assigning through
    YAML::Node current;
    current.reset(root_);
    for (const auto& part : parts) {
        if (!current || !current.IsMap()) {
            return std::nullopt;
        }
        const YAML::Node& parent = current;
        YAML::Node child = parent[part];
        if (!child) {
            return std::nullopt;
        }
        current.reset(child);
    }

    if (!current || current.IsNull()) {
        return std::nullopt;
    }

    return current;
}

std::string Config::GetString(std::string_view key, std::string_view default_value) const {
    auto node = GetNestedNode(key);
    if (node && node->IsScalar()) {
        return node->as<std::string>();
    }
    return std::string(default_value);
}

std::vector<std::string> Config::GetStringList(std::string_view key) const {
    std::vector<std::string> result;
    auto node = GetNestedNode(key);
    if (!node) {
        return result;
    }

    if (node->IsSequence()) {
        for (const auto& item : *node) {
            if (item.IsScalar()) {
                result.push_back(item.as<std::string>());
            }
        }
    } else if (node->IsScalar()) {
        for (absl::string_view part :
             absl::StrSplit(node->Scalar(), ',', absl::SkipWhitespace())) {
            result.emplace_back(absl::StripAsciiWhitespace(part));
        }
    }
    return result;
}

bool Config::HasKey(std::string_view key) const {
    return GetNestedNode(key).has_value();
}

void Config::Set(std::string_view key, ConfigValue value) {
    std::vector<std::string> parts = absl::StrSplit(absl::string_view(key.data(), key.size()), '.');

    // A default-constructed node has no storage to share yet
    if (!root_.IsMap()) {
        root_ = YAML::Node(YAML::NodeType::Map);
    }

    // yaml-cpp nodes are handles; walk with values so each step rebinds to the child
    YAML::Node current = root_;
    for (size_t i = 0; i < parts.size() - 1; ++i) {
        if (!current[parts[i]] || !current[parts[i]].IsMap()) {
            current[parts[i]] = YAML::Node(YAML::NodeType::Map);
        }
        current.reset(current[parts[i]]);
    }

    std::visit([&](auto&& val) {
        using T = std::decay_t<decltype(val)>;
        if constexpr (std::is_same_v<T, std::vector<std::string>>) {
            YAML::Node seq(YAML::NodeType::Sequence);
            for (const auto& item : val) {
                seq.push_back(item);
            }
            current[parts.back()] = seq;
        } else if constexpr (std::is_same_v<T, std::unordered_map<std::string, std::string>>) {
            YAML::Node map(YAML::NodeType::Map);
            for (const auto& [k, v] : val) {
                map[k] = v;
            }
            current[parts.back()] = map;
        } else {
            current[parts.back()] = val;
        }
    }, value);
}

}  // namespace aegis
