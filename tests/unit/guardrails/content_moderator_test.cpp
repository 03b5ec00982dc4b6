/// @file content_moderator_test.cpp
/// @brief Tests for provider selection, failure policies and blocking

#include <new>
#include <stdexcept>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "guardrails/content_moderator.h"
#include "mocks/guardrails_mocks.h"

namespace aegis::guardrails {
namespace {

using ::testing::_;
using ::testing::HasSubstr;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;
using testing::FlaggedResult;
using testing::MockHttpTransport;
using testing::MockModerationProvider;

class ContentModeratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        remote_ = std::make_shared<NiceMock<MockModerationProvider>>();
        ON_CALL(*remote_, Kind()).WillByDefault(Return(ProviderKind::kOpenAI));
        ON_CALL(*remote_, IsAvailable()).WillByDefault(Return(true));
    }

    ContentModerator MakeModerator() const {
        return ContentModerator(config_, SeverityThresholds{}, remote_);
    }

    ContentModerationConfig config_;
    std::shared_ptr<NiceMock<MockModerationProvider>> remote_;
};

// =============================================================================
// Provider selection
// =============================================================================

TEST_F(ContentModeratorTest, AutoUsesRemoteWhenAvailable) {
    EXPECT_CALL(*remote_, Moderate("text"))
        .WillOnce(Return(FlaggedResult(ModerationCategory::kHate, 0.6)));

    auto result = MakeModerator().Moderate("text");
    EXPECT_TRUE(result.flagged);
    EXPECT_EQ(result.provider, ProviderKind::kOpenAI);
    EXPECT_FALSE(result.degraded);
}

TEST_F(ContentModeratorTest, AutoUsesPatternWhenRemoteUnavailable) {
    ON_CALL(*remote_, IsAvailable()).WillByDefault(Return(false));
    EXPECT_CALL(*remote_, Moderate(_)).Times(0);

    auto result = MakeModerator().Moderate("how to make a bomb");
    EXPECT_EQ(result.provider, ProviderKind::kPattern);
    EXPECT_TRUE(result.flagged);
    EXPECT_DOUBLE_EQ(result.category_scores.at(ModerationCategory::kViolence), 0.95);
}

TEST_F(ContentModeratorTest, AutoWithoutApiKeyUsesPattern) {
    auto transport = std::make_shared<MockHttpTransport>();
    EXPECT_CALL(*transport, PostJson(_, _, _)).Times(0);

    ContentModerator moderator(config_, SeverityThresholds{}, transport);
    auto result = moderator.Moderate("Hello there");
    EXPECT_EQ(result.provider, ProviderKind::kPattern);
    EXPECT_FALSE(result.flagged);
    EXPECT_FALSE(result.degraded);
}

TEST_F(ContentModeratorTest, PatternSelectionNeverCallsRemote) {
    config_.provider = ProviderSelection::kPattern;
    EXPECT_CALL(*remote_, Moderate(_)).Times(0);

    auto result = MakeModerator().Moderate("what a nice day");
    EXPECT_EQ(result.provider, ProviderKind::kPattern);
    EXPECT_FALSE(result.flagged);
}

TEST_F(ContentModeratorTest, DisabledReturnsEmptyResult) {
    config_.enabled = false;
    EXPECT_CALL(*remote_, Moderate(_)).Times(0);

    auto result = MakeModerator().Moderate("how to make a bomb");
    EXPECT_FALSE(result.flagged);
    EXPECT_EQ(result.categories.size(), kAllModerationCategories.size());
}

// =============================================================================
// Failure policies
// =============================================================================

TEST_F(ContentModeratorTest, FallbackRerunsWithPattern) {
    config_.provider = ProviderSelection::kOpenAI;
    config_.failure_policy = FailurePolicy::kFallback;
    EXPECT_CALL(*remote_, Moderate(_))
        .WillOnce(Return(absl::UnavailableError("connection refused")));

    auto result = MakeModerator().Moderate("how to make a bomb");
    EXPECT_TRUE(result.degraded);
    EXPECT_EQ(result.provider, ProviderKind::kPattern);
    EXPECT_TRUE(result.flagged);
    EXPECT_THAT(result.degraded_reason, HasSubstr("openai provider failed"));
    EXPECT_THAT(result.degraded_reason, HasSubstr("connection refused"));
}

TEST_F(ContentModeratorTest, FailOpenAndFailClosedReturnUnflaggedDegraded) {
    config_.provider = ProviderSelection::kOpenAI;
    for (auto policy : {FailurePolicy::kFailOpen, FailurePolicy::kFailClosed}) {
        config_.failure_policy = policy;
        EXPECT_CALL(*remote_, Moderate(_))
            .WillOnce(Return(absl::DeadlineExceededError("timed out")));

        auto result = MakeModerator().Moderate("how to make a bomb");
        EXPECT_TRUE(result.degraded);
        EXPECT_FALSE(result.flagged);
        EXPECT_EQ(result.provider, ProviderKind::kOpenAI);
        EXPECT_THAT(result.degraded_reason, HasSubstr("timed out"));
    }
}

TEST_F(ContentModeratorTest, ThrowingProviderFallsBack) {
    config_.provider = ProviderSelection::kOpenAI;
    config_.failure_policy = FailurePolicy::kFallback;
    EXPECT_CALL(*remote_, Moderate(_))
        .WillOnce(Throw(std::runtime_error("connection reset")));

    auto result = MakeModerator().Moderate("how to make a bomb");
    EXPECT_TRUE(result.degraded);
    EXPECT_EQ(result.provider, ProviderKind::kPattern);
    EXPECT_TRUE(result.flagged);
    EXPECT_THAT(result.degraded_reason, HasSubstr("openai provider failed (unavailable)"));
    EXPECT_THAT(result.degraded_reason, HasSubstr("connection reset"));
}

TEST_F(ContentModeratorTest, ThrowingProviderFailsOpenOrClosed) {
    config_.provider = ProviderSelection::kOpenAI;
    for (auto policy : {FailurePolicy::kFailOpen, FailurePolicy::kFailClosed}) {
        config_.failure_policy = policy;
        EXPECT_CALL(*remote_, Moderate(_))
            .WillOnce(Throw(std::bad_alloc()));

        auto result = MakeModerator().Moderate("how to make a bomb");
        EXPECT_TRUE(result.degraded);
        EXPECT_FALSE(result.flagged);
        EXPECT_EQ(result.provider, ProviderKind::kOpenAI);
        EXPECT_THAT(result.degraded_reason, HasSubstr("unavailable"));
    }
}

// =============================================================================
// Blocking and severity
// =============================================================================

TEST_F(ContentModeratorTest, BlocksOnBlockCategory) {
    auto moderator = MakeModerator();
    EXPECT_TRUE(moderator.ShouldBlock(FlaggedResult(ModerationCategory::kViolence, 0.3)));
    EXPECT_FALSE(moderator.ShouldBlock(FlaggedResult(ModerationCategory::kHate, 0.3)));
}

TEST_F(ContentModeratorTest, BlocksOnScoreThreshold) {
    auto moderator = MakeModerator();
    EXPECT_TRUE(moderator.ShouldBlock(FlaggedResult(ModerationCategory::kHate, 0.8)));
    EXPECT_FALSE(moderator.ShouldBlock(FlaggedResult(ModerationCategory::kHate, 0.79)));
}

TEST_F(ContentModeratorTest, UnflaggedNeverBlocks) {
    auto result = FlaggedResult(ModerationCategory::kViolence, 0.99);
    result.flagged = false;
    EXPECT_FALSE(MakeModerator().ShouldBlock(result));
}

TEST_F(ContentModeratorTest, SeverityForScore) {
    auto moderator = MakeModerator();
    EXPECT_EQ(moderator.SeverityForScore(0.95), Severity::kCritical);
    EXPECT_EQ(moderator.SeverityForScore(0.9), Severity::kCritical);
    EXPECT_EQ(moderator.SeverityForScore(0.7), Severity::kHigh);
    EXPECT_EQ(moderator.SeverityForScore(0.69), Severity::kMedium);
}

TEST_F(ContentModeratorTest, Explain) {
    auto moderator = MakeModerator();
    EXPECT_THAT(moderator.Explain(FlaggedResult(ModerationCategory::kHate, 0.5)),
                HasSubstr("hate (0.50)"));
    EXPECT_THAT(moderator.Explain(ModerationResult::Empty(ProviderKind::kPattern)),
                HasSubstr("not flagged"));
}

// =============================================================================
// Mappings
// =============================================================================

TEST(ContentModerationMappingTest, ViolationTypeForCategory) {
    EXPECT_EQ(ViolationTypeForCategory(ModerationCategory::kHateThreatening),
              ViolationType::kHateSpeech);
    EXPECT_EQ(ViolationTypeForCategory(ModerationCategory::kHarassment),
              ViolationType::kHarmfulContent);
    EXPECT_EQ(ViolationTypeForCategory(ModerationCategory::kSelfHarmIntent),
              ViolationType::kSelfHarm);
    EXPECT_EQ(ViolationTypeForCategory(ModerationCategory::kSexualMinors),
              ViolationType::kSexualContent);
    EXPECT_EQ(ViolationTypeForCategory(ModerationCategory::kViolenceGraphic),
              ViolationType::kViolence);
    EXPECT_EQ(ViolationTypeForCategory(ModerationCategory::kIllicit),
              ViolationType::kPolicyViolation);
}

TEST(ContentModerationMappingTest, ParseNames) {
    EXPECT_EQ(*ParseProviderSelection("OpenAI"), ProviderSelection::kOpenAI);
    EXPECT_EQ(*ParseProviderSelection("llm"), ProviderSelection::kLLM);
    EXPECT_FALSE(ParseProviderSelection("azure").ok());

    EXPECT_EQ(*ParseFailurePolicy("fail_closed"), FailurePolicy::kFailClosed);
    EXPECT_EQ(FailurePolicyToString(FailurePolicy::kFailOpen), "fail_open");
    EXPECT_FALSE(ParseFailurePolicy("retry").ok());
}

}  // namespace
}  // namespace aegis::guardrails
