/**
 * @file test_version.cpp
 * @brief Unit tests for version information and the umbrella header
 */

#include <gtest/gtest.h>
#include <kcenon/stage_transfer/stage_transfer.h>

#include <type_traits>

namespace kcenon::stage_transfer::test {

TEST(VersionTest, Components) {
    EXPECT_EQ(version::major, 0);
    EXPECT_EQ(version::minor, 1);
    EXPECT_EQ(version::patch, 0);
}

TEST(VersionTest, StringJoinsComponents) {
    EXPECT_EQ(version::to_string(), "0.1.0");
}

// The umbrella header is enough to run a command and read its report
TEST(UmbrellaHeaderTest, ExposesCommandSurface) {
    static_assert(std::is_abstract_v<stage_session>);
    static_assert(std::is_abstract_v<storage_client>);
    static_assert(!std::is_copy_constructible_v<transfer_agent>);

    auto report = run_transfer_command("PUT file:///tmp/x.csv @stage", transfer_context{});
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(category_of(report.error().code), error_category::credential_resolution);
}

}  // namespace kcenon::stage_transfer::test
