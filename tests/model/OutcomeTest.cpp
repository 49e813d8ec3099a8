#include "model/Outcome.h"
#include <gtest/gtest.h>

namespace VCH {
namespace Tests {

TEST(OutcomeTest, TagsAndSerializedShapes) {
    EXPECT_EQ(outcomeToJson(ValidOutcome{}), json("valid"));
    EXPECT_EQ(outcomeToJson(InvalidOutcome{}), json("invalid"));

    json errored = outcomeToJson(ErroredOutcome::forCase({{"message", "crashed"}}));
    EXPECT_EQ(errored["outcome"], "error");
    EXPECT_EQ(errored["context"]["message"], "crashed");
    EXPECT_EQ(errored["in_errored_case"], true);

    json single = outcomeToJson(ErroredOutcome{});
    EXPECT_FALSE(single.contains("in_errored_case"));

    json skipped = outcomeToJson(SkippedOutcome{"unsupported", "https://example.com/1"});
    EXPECT_EQ(skipped["outcome"], "skipped");
    EXPECT_EQ(skipped["issue_url"], "https://example.com/1");

    EXPECT_EQ(outcomeTag(SkippedOutcome{}), "skipped");
    EXPECT_EQ(outcomeTag(ErroredOutcome{}), "error");
}

TEST(OutcomeTest, ParsesWhatItWrites) {
    Outcome errored = ErroredOutcome::forCase({{"stderr", "BOOM!"}});
    EXPECT_EQ(outcomeFromJson(outcomeToJson(errored)), errored);

    Outcome skipped = SkippedOutcome{"nope", std::nullopt};
    EXPECT_EQ(outcomeFromJson(outcomeToJson(skipped)), skipped);
}

TEST(OutcomeTest, UnknownTagIsAnError) {
    std::string error;
    EXPECT_FALSE(outcomeFromJson(json("maybe"), &error).has_value());
    EXPECT_NE(error.find("unknown outcome"), std::string::npos);
    EXPECT_FALSE(outcomeFromJson(json(42)).has_value());
}

TEST(OutcomeTest, FailureAccountingFollowsExpectations) {
    VCH::Test expectValid{"t", 1, true, std::nullopt};
    VCH::Test expectInvalid{"t", 1, false, std::nullopt};
    VCH::Test noExpectation{"t", 1, std::nullopt, std::nullopt};

    EXPECT_FALSE(isFailure(ValidOutcome{}, expectValid));
    EXPECT_TRUE(isFailure(InvalidOutcome{}, expectValid));
    EXPECT_FALSE(isFailure(InvalidOutcome{}, expectInvalid));
    EXPECT_TRUE(isFailure(ValidOutcome{}, expectInvalid));

    EXPECT_FALSE(isFailure(ValidOutcome{}, noExpectation));
    EXPECT_TRUE(isFailure(InvalidOutcome{}, noExpectation));

    EXPECT_TRUE(isFailure(ErroredOutcome{}, expectValid));
    EXPECT_TRUE(isFailure(SkippedOutcome{}, expectInvalid));
}

}  // namespace Tests
}  // namespace VCH
