#include "model/Dialect.h"
#include <gtest/gtest.h>

namespace VCH {
namespace Tests {

class DialectTest : public ::testing::Test {
protected:
    const DialectRegistry &registry = DialectRegistry::known();
};

TEST_F(DialectTest, NewestFirstOrdering) {
    const auto &dialects = registry.newestFirst();
    ASSERT_EQ(dialects.size(), 6u);
    EXPECT_EQ(registry.newest().shortName, "draft2020-12");
    for (size_t i = 1; i < dialects.size(); ++i) {
        EXPECT_GT(dialects[i - 1].firstPublished, dialects[i].firstPublished) << dialects[i].shortName;
    }
}

TEST_F(DialectTest, LookupByUriIgnoresEmptyFragment) {
    auto withHash = registry.byUri("http://json-schema.org/draft-07/schema#");
    auto withoutHash = registry.byUri("http://json-schema.org/draft-07/schema");
    ASSERT_TRUE(withHash.has_value());
    ASSERT_TRUE(withoutHash.has_value());
    EXPECT_EQ(*withHash, *withoutHash);
    EXPECT_EQ(withHash->shortName, "draft7");

    EXPECT_TRUE(registry.byUri("https://json-schema.org/draft/2020-12/schema#").has_value());
    EXPECT_FALSE(registry.byUri("https://example.com/my-dialect").has_value());
}

TEST_F(DialectTest, LookupByShortNameAndAlias) {
    EXPECT_EQ(registry.byShortName("draft7")->uri, "http://json-schema.org/draft-07/schema#");
    EXPECT_EQ(registry.byShortName("7")->shortName, "draft7");
    EXPECT_EQ(registry.byShortName("2020-12")->shortName, "draft2020-12");
    EXPECT_EQ(registry.byShortName("2020")->shortName, "draft2020-12");
    EXPECT_EQ(registry.byShortName("2019")->shortName, "draft2019-09");
    EXPECT_EQ(registry.lookup("draft2019")->shortName, "draft2019-09");
    EXPECT_FALSE(registry.byShortName("2018").has_value());
    EXPECT_FALSE(registry.byShortName("draft").has_value());
    EXPECT_FALSE(registry.byShortName("draft5").has_value());
}

TEST_F(DialectTest, LookupTriesUriThenName) {
    EXPECT_EQ(registry.lookup("https://json-schema.org/draft/2019-09/schema")->shortName, "draft2019-09");
    EXPECT_EQ(registry.lookup("draft4")->shortName, "draft4");
}

TEST_F(DialectTest, BooleanSchemasOnlyFromDraft6) {
    EXPECT_TRUE(registry.byShortName("draft6")->hasBooleanSchemas);
    EXPECT_FALSE(registry.byShortName("draft4")->hasBooleanSchemas);
    EXPECT_FALSE(registry.byShortName("draft3")->hasBooleanSchemas);
}

}  // namespace Tests
}  // namespace VCH
