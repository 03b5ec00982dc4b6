/// @file remote_moderation_provider_test.cpp
/// @brief Tests for the OpenAI and chat-model moderation providers

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "guardrails/llm_moderation_provider.h"
#include "guardrails/openai_moderation_provider.h"
#include "mocks/guardrails_mocks.h"

namespace aegis::guardrails {
namespace {

using ::testing::_;
using ::testing::Contains;
using ::testing::DoAll;
using ::testing::Pair;
using ::testing::Return;
using ::testing::SaveArg;
using testing::MockHttpTransport;

using json = nlohmann::json;

constexpr const char* kOpenAIBody = R"({
  "id": "modr-123",
  "model": "omni-moderation-latest",
  "results": [{
    "flagged": true,
    "categories": {"violence": true, "hate": false, "self-harm/intent": false},
    "category_scores": {"violence": 0.97, "hate": 0.01, "self-harm/intent": 0.002}
  }]
})";

// =============================================================================
// OpenAI
// =============================================================================

TEST(OpenAIModerationProviderTest, ParsesResponse) {
    auto result = ParseOpenAIModerationResponse(kOpenAIBody);
    ASSERT_TRUE(result.ok()) << result.status();

    EXPECT_TRUE(result->flagged);
    EXPECT_EQ(result->provider, ProviderKind::kOpenAI);
    EXPECT_TRUE(result->categories.at(ModerationCategory::kViolence));
    EXPECT_DOUBLE_EQ(result->category_scores.at(ModerationCategory::kViolence), 0.97);

    // Keys absent from the response are present and zeroed
    EXPECT_EQ(result->categories.size(), kAllModerationCategories.size());
    EXPECT_FALSE(result->categories.at(ModerationCategory::kIllicit));
    EXPECT_DOUBLE_EQ(result->category_scores.at(ModerationCategory::kIllicit), 0.0);
}

TEST(OpenAIModerationProviderTest, RejectsMalformedBodies) {
    for (const char* body : {"not json", "{}", R"({"results": []})",
                             R"({"results": [{"flagged": true}]})"}) {
        auto result = ParseOpenAIModerationResponse(body);
        EXPECT_FALSE(result.ok()) << body;
        EXPECT_EQ(result.status().code(), absl::StatusCode::kInternal) << body;
    }
}

TEST(OpenAIModerationProviderTest, SendsAuthenticatedRequest) {
    auto transport = std::make_shared<MockHttpTransport>();
    OpenAIModerationProvider provider({"", "sk-test", ""}, transport);

    std::string url;
    std::string body;
    HttpHeaders headers;
    EXPECT_CALL(*transport, PostJson(_, _, _))
        .WillOnce(DoAll(SaveArg<0>(&url), SaveArg<1>(&body), SaveArg<2>(&headers),
                        Return(HttpResponse{200, kOpenAIBody})));

    auto result = provider.Moderate("some text");
    ASSERT_TRUE(result.ok()) << result.status();
    EXPECT_TRUE(result->flagged);

    EXPECT_EQ(url, OpenAIModerationProvider::kDefaultUrl);
    auto request = json::parse(body);
    EXPECT_EQ(request["input"], "some text");
    EXPECT_EQ(request["model"], OpenAIModerationProvider::kDefaultModel);
    EXPECT_THAT(headers, Contains(Pair("Authorization", "Bearer sk-test")));
}

TEST(OpenAIModerationProviderTest, HttpErrorIsUnavailable) {
    auto transport = std::make_shared<MockHttpTransport>();
    OpenAIModerationProvider provider({"", "sk-test", ""}, transport);

    EXPECT_CALL(*transport, PostJson(_, _, _))
        .WillOnce(Return(HttpResponse{429, R"({"error": "rate limited"})"}));

    auto result = provider.Moderate("text");
    EXPECT_EQ(result.status().code(), absl::StatusCode::kUnavailable);
}

TEST(OpenAIModerationProviderTest, TransportErrorPropagates) {
    auto transport = std::make_shared<MockHttpTransport>();
    OpenAIModerationProvider provider({"", "sk-test", ""}, transport);

    EXPECT_CALL(*transport, PostJson(_, _, _))
        .WillOnce(Return(absl::DeadlineExceededError("timed out")));

    auto result = provider.Moderate("text");
    EXPECT_EQ(result.status().code(), absl::StatusCode::kDeadlineExceeded);
}

TEST(OpenAIModerationProviderTest, UnavailableWithoutKey) {
    auto transport = std::make_shared<MockHttpTransport>();
    OpenAIModerationProvider provider({}, transport);

    EXPECT_CALL(*transport, PostJson(_, _, _)).Times(0);

    EXPECT_FALSE(provider.IsAvailable());
    EXPECT_FALSE(provider.Moderate("text").ok());
}

// =============================================================================
// Chat model
// =============================================================================

std::string ChatResponse(const std::string& content) {
    json response = {
        {"choices", json::array({{{"message", {{"role", "assistant"}, {"content", content}}}}})}
    };
    return response.dump();
}

TEST(LlmModerationProviderTest, ParsesVerdictFromMessageContent) {
    const std::string verdict =
        R"({"flagged": true, "categories": {"hate": true}, "category_scores": {"hate": 0.85}})";

    auto result = ParseLlmModerationResponse(ChatResponse(verdict));
    ASSERT_TRUE(result.ok()) << result.status();
    EXPECT_EQ(result->provider, ProviderKind::kLLM);
    EXPECT_TRUE(result->flagged);
    EXPECT_TRUE(result->categories.at(ModerationCategory::kHate));
    EXPECT_DOUBLE_EQ(result->category_scores.at(ModerationCategory::kHate), 0.85);
}

TEST(LlmModerationProviderTest, ClampsScoresAndDerivesFlagged) {
    const std::string verdict =
        R"({"categories": {"violence": true}, "category_scores": {"violence": 1.7}})";

    auto result = ParseLlmModerationResponse(ChatResponse(verdict));
    ASSERT_TRUE(result.ok());
    EXPECT_TRUE(result->flagged);
    EXPECT_DOUBLE_EQ(result->category_scores.at(ModerationCategory::kViolence), 1.0);
}

TEST(LlmModerationProviderTest, RejectsNonJsonVerdict) {
    auto result = ParseLlmModerationResponse(ChatResponse("This looks fine to me."));
    EXPECT_EQ(result.status().code(), absl::StatusCode::kInternal);

    EXPECT_FALSE(ParseLlmModerationResponse(R"({"choices": []})").ok());
}

TEST(LlmModerationProviderTest, RequestsJsonObjectResponse) {
    auto transport = std::make_shared<MockHttpTransport>();
    LlmModerationProvider provider({"http://localhost:8000/v1/chat/completions", "key", "small"},
                                   transport);

    std::string url;
    std::string body;
    EXPECT_CALL(*transport, PostJson(_, _, _))
        .WillOnce(DoAll(SaveArg<0>(&url), SaveArg<1>(&body),
                        Return(HttpResponse{200, ChatResponse(R"({"flagged": false, "categories": {}})")})));

    auto result = provider.Moderate("hello");
    ASSERT_TRUE(result.ok()) << result.status();
    EXPECT_FALSE(result->flagged);

    EXPECT_EQ(url, "http://localhost:8000/v1/chat/completions");
    auto request = json::parse(body);
    EXPECT_EQ(request["model"], "small");
    EXPECT_EQ(request["response_format"]["type"], "json_object");
    EXPECT_EQ(request["messages"][0]["role"], "system");
    EXPECT_EQ(request["messages"][1]["content"], "hello");
}

// =============================================================================
// URL handling
// =============================================================================

TEST(SplitUrlTest, SeparatesHostAndPath) {
    auto parts = SplitUrl("https://api.openai.com/v1/moderations");
    ASSERT_TRUE(parts.ok());
    EXPECT_EQ(parts->first, "https://api.openai.com");
    EXPECT_EQ(parts->second, "/v1/moderations");

    auto bare = SplitUrl("HTTP://localhost:8080");
    ASSERT_TRUE(bare.ok());
    EXPECT_EQ(bare->first, "http://localhost:8080");
    EXPECT_EQ(bare->second, "/");

    EXPECT_FALSE(SplitUrl("ftp://example.com/file").ok());
    EXPECT_FALSE(SplitUrl("not a url").ok());
}

}  // namespace
}  // namespace aegis::guardrails
