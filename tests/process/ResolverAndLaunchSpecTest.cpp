#include "harness/ImplementationResolver.h"
#include "process/LaunchSpec.h"
#include <gtest/gtest.h>

namespace VCH {
namespace Tests {

using Argv = std::vector<std::string>;

class ImplementationResolverTest : public ::testing::Test {
protected:
    DefaultImplementationResolver resolver{"podman"};
};

TEST_F(ImplementationResolverTest, BareReferenceRunsIsolatedImage) {
    auto spec = resolver.resolve("ghcr.io/example/python-jsonschema");
    ASSERT_TRUE(spec.has_value());
    EXPECT_EQ(spec->id, "ghcr.io/example/python-jsonschema");
    EXPECT_EQ(spec->argv, (Argv{"podman", "run", "--rm", "--interactive", "--network=none",
                                "ghcr.io/example/python-jsonschema"}));
}

TEST_F(ImplementationResolverTest, ImagePrefixIsStripped) {
    auto spec = resolver.resolve("image:example/impl:1.0");
    ASSERT_TRUE(spec.has_value());
    EXPECT_EQ(spec->id, "image:example/impl:1.0");
    EXPECT_EQ(spec->argv.back(), "example/impl:1.0");
}

TEST_F(ImplementationResolverTest, ExecRunsProgramWithArguments) {
    auto spec = resolver.resolve("exec:/usr/local/bin/impl --strict");
    ASSERT_TRUE(spec.has_value());
    EXPECT_EQ(spec->argv, (Argv{"/usr/local/bin/impl", "--strict"}));
}

TEST_F(ImplementationResolverTest, ContainerAttaches) {
    auto spec = resolver.resolve("container:abc123");
    ASSERT_TRUE(spec.has_value());
    EXPECT_EQ(spec->argv, (Argv{"podman", "start", "--attach", "--interactive", "abc123"}));
}

TEST_F(ImplementationResolverTest, EmptyTargetsAreRejected) {
    std::string error;
    EXPECT_FALSE(resolver.resolve("exec:", &error).has_value());
    EXPECT_NE(error.find("exec:"), std::string::npos);
    EXPECT_FALSE(resolver.resolve("container:").has_value());
    EXPECT_FALSE(resolver.resolve("image:").has_value());
    EXPECT_FALSE(resolver.resolve("two words").has_value());
}

}  // namespace Tests
}  // namespace VCH
