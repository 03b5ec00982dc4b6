#pragma once

/// @file config.h
/// @brief Aegis configuration management

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include <absl/status/statusor.h>
#include <yaml-cpp/yaml.h>

namespace aegis {

/// @brief Configuration value that can hold different types
using ConfigValue = std::variant<
    bool,
    int64_t,
    double,
    std::string,
    std::vector<std::string>,
    std::unordered_map<std::string, std::string>
>;

/// @brief Configuration tree loaded from YAML and environment variables
///
/// Values are addressed with dot notation ("guardrails.blocking.allow_bypass").
/// A Config is filled once at startup and then only read; typed settings
/// structs (see guardrails/guardrails_config.h) are built from it.
class Config {
public:
    /// @brief Default constructor creates empty configuration
    Config() = default;

    /// @brief Load configuration from a YAML file
    /// @param path Path to the YAML configuration file
    /// @return Status indicating success or failure
    static absl::StatusOr<Config> LoadFromFile(const std::filesystem::path& path);

    /// @brief Load configuration from a YAML string
    /// @param yaml_content YAML content as a string
    /// @return Status indicating success or failure
    static absl::StatusOr<Config> LoadFromString(std::string_view yaml_content);

    /// @brief Load configuration from environment variables with a prefix
    /// @param prefix Environment variable prefix (e.g., "AEGIS_")
    /// @return Configuration loaded from environment
    static Config LoadFromEnvironment(std::string_view prefix = "AEGIS_");

    /// @brief Load a file (optional) and overlay environment variables on top
    /// @param path Path to YAML file, or nullopt to start from an empty tree
    /// @param env_prefix Environment variable prefix
    static absl::StatusOr<Config> LoadLayered(
        const std::optional<std::filesystem::path>& path,
        std::string_view env_prefix = "AEGIS_");

    /// @brief Merge another configuration into this one (other takes precedence)
    /// @param other Configuration to merge
    void Merge(const Config& other);

    /// @brief Get a string value
    /// @param key Configuration key (supports dot notation)
    /// @param default_value Default value if key not found
    std::string GetString(std::string_view key, std::string_view default_value = "") const;

    /// @brief Get a list of strings
    ///
    /// Accepts a YAML sequence or a comma-separated scalar (the form
    /// environment overrides take).
    /// @return List of strings or empty vector if not found
    std::vector<std::string> GetStringList(std::string_view key) const;

    /// @brief Check if a key exists
    bool HasKey(std::string_view key) const;

    /// @brief Set a configuration value
    void Set(std::string_view key, ConfigValue value);

    /// @brief Get the underlying YAML node for advanced access
    const YAML::Node& GetNode() const { return root_; }

private:
    YAML::Node root_;

    /// @brief Navigate to a nested node using dot notation
    std::optional<YAML::Node> GetNestedNode(std::string_view key) const;
};

}  // namespace aegis
