/**
 * @file test_publish_metadata_builder.cpp
 * @brief Unit tests for publish metadata construction
 */

#include <gtest/gtest.h>

#include <kcenon/media_relay/transfer/publish_metadata_builder.h>

#include <chrono>
#include <ctime>
#include <string>
#include <vector>

namespace kcenon::media_relay::test {

namespace {

auto local_noon(int year, int month, int day) -> std::chrono::system_clock::time_point {
    std::tm tm_buf{};
    tm_buf.tm_year = year - 1900;
    tm_buf.tm_mon = month - 1;
    tm_buf.tm_mday = day;
    tm_buf.tm_hour = 12;
    tm_buf.tm_isdst = -1;
    return std::chrono::system_clock::from_time_t(std::mktime(&tm_buf));
}

}  // namespace

class PublishMetadataBuilderTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto doc = json_value::parse(R"({
            "id": 7,
            "dish_name": "Banana Pancakes",
            "prep_time": "10 minutes",
            "cook_time": "15 minutes",
            "ingredients": ["2 ripe bananas, mashed", "1 cup flour", "2 eggs"],
            "instructions": ["Mash the bananas.", "Whisk in eggs.", "Fry."],
            "dish_type": "Breakfast",
            "taste_category": "Sweet"
        })");
        ASSERT_TRUE(doc.has_value());
        item_.id = "7";
        item_.display_name = "Banana Pancakes";
        item_.locator = "https://drive.google.com/file/d/AAA/view";
        item_.metadata = doc.value();
    }

    media_item item_;
};

// =============================================================================
// Tag helpers
// =============================================================================

TEST_F(PublishMetadataBuilderTest, DeriveTagTakesLastWordBeforeComma) {
    EXPECT_EQ(derive_tag("2 cups flour, sifted"), "flour");
    EXPECT_EQ(derive_tag("salt"), "salt");
    EXPECT_EQ(derive_tag("1 tbsp olive oil  "), "oil");
    EXPECT_EQ(derive_tag("   "), "");
    EXPECT_EQ(derive_tag(", garnish"), "");
}

TEST_F(PublishMetadataBuilderTest, TrimTagsRespectsCeilingAndMinimum) {
    std::vector<std::string> tags = {"aaaa", "bbbb", "cccc", "dddd"};

    trim_tags(tags, 10, 1);
    EXPECT_EQ(tags, (std::vector<std::string>{"aaaa", "bbbb"}));

    std::vector<std::string> protected_tags = {"aaaa", "bbbb", "cccc", "dddd"};
    trim_tags(protected_tags, 1, 3);
    EXPECT_EQ(protected_tags.size(), 3u);
    EXPECT_EQ(total_tag_length(protected_tags), 12u);
}

// =============================================================================
// Metadata
// =============================================================================

TEST_F(PublishMetadataBuilderTest, TitleCarriesDate) {
    publish_metadata_builder builder;
    EXPECT_EQ(builder.build_title(item_, local_noon(2025, 3, 14)),
              "Banana Pancakes Recipe - 2025-03-14");
}

TEST_F(PublishMetadataBuilderTest, DescriptionLayout) {
    publish_metadata_builder builder;

    const std::string expected =
        "Banana Pancakes\n\n"
        "Prep Time: 10 minutes\n"
        "Cook Time: 15 minutes\n"
        "\n"
        "INGREDIENTS:\n"
        "- 2 ripe bananas, mashed\n"
        "- 1 cup flour\n"
        "- 2 eggs\n"
        "\n"
        "INSTRUCTIONS:\n"
        "1. Mash the bananas.\n"
        "2. Whisk in eggs.\n"
        "3. Fry.\n"
        "\n"
        "Follow for more delicious recipes daily!";
    EXPECT_EQ(builder.build_description(item_), expected);
}

TEST_F(PublishMetadataBuilderTest, DescriptionSkipsMissingSections) {
    media_item bare;
    bare.id = "9";
    bare.display_name = "Toast";
    bare.metadata = json_value::make_object();

    publish_metadata_builder builder;
    EXPECT_EQ(builder.build_description(bare),
              "Toast\n\nFollow for more delicious recipes daily!");
}

TEST_F(PublishMetadataBuilderTest, TagsInPriorityOrder) {
    publish_metadata_builder builder;

    EXPECT_EQ(builder.build_tags(item_),
              (std::vector<std::string>{"Banana Pancakes", "Breakfast", "Sweet", "recipe",
                                        "cooking", "food", "homemade", "chef", "delicious",
                                        "bananas", "flour", "eggs"}));
}

TEST_F(PublishMetadataBuilderTest, TagsAreTrimmedToCeiling) {
    publish_template tmpl;
    tmpl.max_total_tag_length = 50;
    publish_metadata_builder builder(tmpl);

    auto tags = builder.build_tags(item_);
    EXPECT_LE(total_tag_length(tags), 50u);
    EXPECT_EQ(tags.size(), 6u);
    EXPECT_GE(tags.size(), tmpl.min_tag_count);
    EXPECT_EQ(tags.front(), "Banana Pancakes");
}

TEST_F(PublishMetadataBuilderTest, BuildFillsPlatformFields) {
    publish_template tmpl;
    tmpl.privacy_status = "unlisted";
    publish_metadata_builder builder(tmpl);

    auto metadata = builder.build(item_, local_noon(2025, 1, 2));
    EXPECT_EQ(metadata.title, "Banana Pancakes Recipe - 2025-01-02");
    EXPECT_EQ(metadata.category_id, "22");
    EXPECT_EQ(metadata.privacy_status, "unlisted");
    EXPECT_FALSE(metadata.made_for_kids);
    EXPECT_FALSE(metadata.tags.empty());
}

TEST_F(PublishMetadataBuilderTest, TemplateValidation) {
    publish_template tmpl;
    EXPECT_TRUE(tmpl.validate().has_value());

    tmpl.category_id.clear();
    EXPECT_FALSE(tmpl.validate().has_value());
}

}  // namespace kcenon::media_relay::test
