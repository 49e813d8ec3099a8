#include "harness/TestCaseSource.h"
#include <gtest/gtest.h>
#include <sstream>

namespace VCH {
namespace Tests {

TEST(JsonLinesTestCaseSourceTest, ReadsCasesInOrderSkippingBlankLines) {
    std::istringstream input(
        R"({"description": "first", "schema": {}, "tests": [{"description": "t", "instance": 1}]})"
        "\n\n"
        R"({"description": "second", "schema": true, "tests": [{"description": "t", "instance": 2}]})"
        "\n");
    JsonLinesTestCaseSource source(input);

    auto first = source.next();
    auto second = source.next();
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(first->description, "first");
    EXPECT_EQ(second->description, "second");
    EXPECT_FALSE(source.next().has_value());
}

TEST(JsonLinesTestCaseSourceTest, MalformedLineNamesItsLineNumber) {
    std::istringstream input(
        R"({"description": "ok", "schema": {}, "tests": [{"description": "t", "instance": 1}]})"
        "\n"
        "{oops\n");
    JsonLinesTestCaseSource source(input);

    EXPECT_TRUE(source.next().has_value());
    try {
        source.next();
        FAIL() << "expected TestCaseSourceError";
    } catch (const TestCaseSourceError &e) {
        EXPECT_NE(std::string(e.what()).find("input line 2"), std::string::npos);
    }
}

TEST(JsonLinesTestCaseSourceTest, CaseWithoutTestsIsRejected) {
    std::istringstream input(R"({"description": "empty", "schema": {}, "tests": []})");
    JsonLinesTestCaseSource source(input);
    EXPECT_THROW(source.next(), TestCaseSourceError);
}

TEST(JsonLinesTestCaseSourceTest, EmptyInputHasNoCases) {
    std::istringstream input("");
    JsonLinesTestCaseSource source(input);
    EXPECT_FALSE(source.next().has_value());
}

}  // namespace Tests
}  // namespace VCH
