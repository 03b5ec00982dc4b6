/// @file config_test.cpp
/// @brief Tests for Aegis configuration management

#include <gtest/gtest.h>

#include <cstdlib>

#include "common/config.h"

namespace aegis {
namespace {

TEST(ConfigTest, LoadFromString) {
    const std::string yaml_content = R"(
guardrails:
  enabled: true
  prompt_injection:
    confidence_threshold: 0.75
  content_moderation:
    provider: pattern
    block_categories:
      - violence
      - hate/threatening
logging:
  level: debug
)";

    auto result = Config::LoadFromString(yaml_content);
    ASSERT_TRUE(result.ok()) << result.status().message();

    Config config = std::move(*result);

    EXPECT_EQ(config.GetString("guardrails.enabled"), "true");
    EXPECT_EQ(config.GetString("guardrails.prompt_injection.confidence_threshold"), "0.75");
    EXPECT_EQ(config.GetString("guardrails.content_moderation.provider"), "pattern");
    EXPECT_EQ(config.GetString("logging.level"), "debug");

    auto categories = config.GetStringList("guardrails.content_moderation.block_categories");
    ASSERT_EQ(categories.size(), 2u);
    EXPECT_EQ(categories[0], "violence");
    EXPECT_EQ(categories[1], "hate/threatening");
}

TEST(ConfigTest, DefaultValues) {
    Config config;

    EXPECT_EQ(config.GetString("nonexistent.key", "default"), "default");
    EXPECT_EQ(config.GetString("nonexistent.key"), "");
    EXPECT_TRUE(config.GetStringList("nonexistent.key").empty());
}

TEST(ConfigTest, NonScalarFallsBackToDefault) {
    auto result = Config::LoadFromString(R"(
guardrails:
  blocking:
    bypass_roles: [admin]
)");
    ASSERT_TRUE(result.ok());

    EXPECT_EQ(result->GetString("guardrails.blocking", "none"), "none");
    EXPECT_EQ(result->GetString("guardrails.blocking.bypass_roles", "none"), "none");
}

TEST(ConfigTest, SetValues) {
    Config config;

    config.Set("test.string", std::string("value"));
    config.Set("test.int", static_cast<int64_t>(123));
    config.Set("test.bool", true);
    config.Set("test.list", std::vector<std::string>{"a", "b"});

    EXPECT_EQ(config.GetString("test.string"), "value");
    EXPECT_EQ(config.GetString("test.int"), "123");
    EXPECT_EQ(config.GetString("test.bool"), "true");
    EXPECT_EQ(config.GetStringList("test.list"), (std::vector<std::string>{"a", "b"}));
}

TEST(ConfigTest, SetNestedKeepsSiblings) {
    auto result = Config::LoadFromString(R"(
guardrails:
  blocking:
    allow_bypass: false
    block_message: blocked
)");
    ASSERT_TRUE(result.ok());
    Config config = std::move(*result);

    config.Set("guardrails.blocking.allow_bypass", true);

    EXPECT_EQ(config.GetString("guardrails.blocking.allow_bypass"), "true");
    EXPECT_EQ(config.GetString("guardrails.blocking.block_message"), "blocked");
    EXPECT_FALSE(config.HasKey("allow_bypass"));
}

TEST(ConfigTest, LookupDoesNotInsertKeys) {
    Config config;
    config.Set("a.b", std::string("x"));

    EXPECT_FALSE(config.HasKey("a.c"));
    EXPECT_FALSE(config.HasKey("a.c"));
    EXPECT_EQ(config.GetString("a.c", "unset"), "unset");
    EXPECT_FALSE(config.HasKey("a.c"));
    EXPECT_EQ(config.GetNode()["a"].size(), 1u);
    EXPECT_EQ(config.GetString("a.b"), "x");
}

TEST(ConfigTest, CommaSeparatedList) {
    Config config;
    config.Set("guardrails.pii_redaction.types_to_redact", std::string("email, ssn ,phone"));

    auto types = config.GetStringList("guardrails.pii_redaction.types_to_redact");
    EXPECT_EQ(types, (std::vector<std::string>{"email", "ssn", "phone"}));
}

TEST(ConfigTest, HasKey) {
    auto result = Config::LoadFromString(R"(
existing:
  key: value
)");
    ASSERT_TRUE(result.ok());

    Config config = std::move(*result);

    EXPECT_TRUE(config.HasKey("existing.key"));
    EXPECT_FALSE(config.HasKey("nonexistent.key"));
    EXPECT_FALSE(config.HasKey("existing.key.deeper"));
}

TEST(ConfigTest, MergeConfigs) {
    auto base_result = Config::LoadFromString(R"(
key1: value1
nested:
  a: 1
  b: 2
)");
    auto overlay_result = Config::LoadFromString(R"(
key2: value2
nested:
  b: 20
  c: 3
)");
    ASSERT_TRUE(base_result.ok());
    ASSERT_TRUE(overlay_result.ok());

    Config base = std::move(*base_result);
    base.Merge(*overlay_result);

    EXPECT_EQ(base.GetString("key1"), "value1");
    EXPECT_EQ(base.GetString("key2"), "value2");
    EXPECT_EQ(base.GetString("nested.a"), "1");
    EXPECT_EQ(base.GetString("nested.b"), "20");  // Overwritten
    EXPECT_EQ(base.GetString("nested.c"), "3");   // Added
}

TEST(ConfigTest, EnvironmentOverrides) {
    ::setenv("AEGISTEST_MODERATION_PROVIDER", "llm", 1);
    ::setenv("AEGISTEST_INJECTION_THRESHOLD", "0.55", 1);
    ::setenv("AEGISTEST_ALLOW_BYPASS", "true", 1);

    Config config = Config::LoadFromEnvironment("AEGISTEST_");

    EXPECT_EQ(config.GetString("guardrails.content_moderation.provider"), "llm");
    EXPECT_EQ(config.GetString("guardrails.prompt_injection.confidence_threshold"), "0.55");
    EXPECT_EQ(config.GetString("guardrails.blocking.allow_bypass"), "true");
    EXPECT_FALSE(config.HasKey("guardrails.enabled"));

    ::unsetenv("AEGISTEST_MODERATION_PROVIDER");
    ::unsetenv("AEGISTEST_INJECTION_THRESHOLD");
    ::unsetenv("AEGISTEST_ALLOW_BYPASS");
}

TEST(ConfigTest, LayeredEnvironmentWinsOverFile) {
    ::setenv("AEGISLAYER_MODERATION_FAILURE_POLICY", "fail_closed", 1);

    auto result = Config::LoadLayered(std::nullopt, "AEGISLAYER_");
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result->GetString("guardrails.content_moderation.failure_policy"), "fail_closed");

    ::unsetenv("AEGISLAYER_MODERATION_FAILURE_POLICY");
}

TEST(ConfigTest, LayeredMissingFile) {
    auto result = Config::LoadLayered(std::filesystem::path("/nonexistent/aegis.yaml"));
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.status().code(), absl::StatusCode::kNotFound);
}

TEST(ConfigTest, InvalidYaml) {
    auto result = Config::LoadFromString("{ invalid yaml [");
    EXPECT_FALSE(result.ok());
}

}  // namespace
}  // namespace aegis
