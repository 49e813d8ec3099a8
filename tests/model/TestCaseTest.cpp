#include "model/TestCase.h"
#include <gtest/gtest.h>

namespace VCH {
namespace Tests {

class TestCaseTest : public ::testing::Test {
protected:
    json rawCase() {
        return json::parse(R"({
            "description": "integer type",
            "schema": {"type": "integer"},
            "registry": {"urn:example:other": {"type": "string"}},
            "tests": [
                {"description": "an integer", "instance": 1, "valid": true},
                {"description": "a string", "instance": "foo", "valid": false},
                {"description": "no expectation", "instance": null}
            ]
        })");
    }
};

TEST_F(TestCaseTest, ParsesCaseWithRegistryAndExpectations) {
    std::string error;
    auto testCase = TestCase::fromJson(rawCase(), &error);
    ASSERT_TRUE(testCase.has_value()) << error;

    EXPECT_EQ(testCase->description, "integer type");
    ASSERT_TRUE(testCase->registry.has_value());
    ASSERT_EQ(testCase->tests.size(), 3u);
    EXPECT_EQ(testCase->tests[0].valid, true);
    EXPECT_EQ(testCase->tests[1].valid, false);
    EXPECT_FALSE(testCase->tests[2].valid.has_value());
    EXPECT_TRUE(testCase->tests[2].instance.is_null());

    EXPECT_EQ(TestCase::fromJson(testCase->toJson()), testCase);
}

TEST_F(TestCaseTest, RejectsEmptyTests) {
    json raw = rawCase();
    raw["tests"] = json::array();

    std::string error;
    EXPECT_FALSE(TestCase::fromJson(raw, &error).has_value());
    EXPECT_NE(error.find("non-empty"), std::string::npos);
}

TEST_F(TestCaseTest, RejectsTestWithoutInstance) {
    json raw = rawCase();
    raw["tests"][1].erase("instance");

    std::string error;
    EXPECT_FALSE(TestCase::fromJson(raw, &error).has_value());
    EXPECT_NE(error.find("'instance'"), std::string::npos);
}

TEST_F(TestCaseTest, BooleanSchemaIsAccepted) {
    json raw = rawCase();
    raw["schema"] = false;

    auto testCase = TestCase::fromJson(raw);
    ASSERT_TRUE(testCase.has_value());
    EXPECT_FALSE(testCase->declaredDialect().has_value());
}

TEST_F(TestCaseTest, WithDialectOnlyFillsMissingSchemaKeyword) {
    auto testCase = *TestCase::fromJson(rawCase());
    const Dialect &dialect = DialectRegistry::known().newest();

    auto injected = testCase.withDialect(dialect);
    EXPECT_EQ(injected.declaredDialect(), dialect.uri);

    auto draft7 = *DialectRegistry::known().byShortName("draft7");
    EXPECT_EQ(injected.withDialect(draft7).declaredDialect(), dialect.uri);

    testCase.schema = true;
    EXPECT_EQ(testCase.withDialect(dialect).schema, json(true));
}

}  // namespace Tests
}  // namespace VCH
