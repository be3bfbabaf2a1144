/**
 * @file test_version.cpp
 * @brief Unit tests for version information
 */

#include <gtest/gtest.h>
#include <kcenon/media_relay/media_relay.h>

namespace kcenon::media_relay::test {

class VersionTest : public ::testing::Test {};

TEST_F(VersionTest, VersionComponents) {
    EXPECT_EQ(version::major, 0);
    EXPECT_EQ(version::minor, 1);
    EXPECT_EQ(version::patch, 0);
}

TEST_F(VersionTest, VersionString) {
    EXPECT_EQ(version::to_string(), "0.1.0");
}

TEST_F(VersionTest, UmbrellaHeaderExposesPipeline) {
    orchestrator_config config;
    EXPECT_TRUE(config.validate().has_value());
    EXPECT_STREQ(to_string(item_state::published), "published");
}

}  // namespace kcenon::media_relay::test
