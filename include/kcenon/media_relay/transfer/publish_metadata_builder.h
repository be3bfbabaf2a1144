/**
 * @file publish_metadata_builder.h
 * @brief Builds the title, description and tags published with an item
 */

#ifndef KCENON_MEDIA_RELAY_TRANSFER_PUBLISH_METADATA_BUILDER_H
#define KCENON_MEDIA_RELAY_TRANSFER_PUBLISH_METADATA_BUILDER_H

#include <kcenon/media_relay/catalog/item.h>
#include <kcenon/media_relay/core/types.h>
#include <kcenon/media_relay/transfer/video_destination.h>

#include <chrono>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace kcenon::media_relay {

/**
 * @brief Labelled catalog field used in the description
 */
struct labelled_field {
    std::string label;  ///< Text shown in the description
    std::string field;  ///< Catalog member name
};

/**
 * @brief Template mapping catalog fields onto publish metadata
 */
struct publish_template {
    std::string title_suffix = " Recipe";

    /// "Label: value" lines after the name
    std::vector<labelled_field> scalar_fields = {
        {"Prep Time", "prep_time"},
        {"Cook Time", "cook_time"},
        {"Yield", "yield"},
    };

    /// "LABEL:" followed by "- entry" lines
    std::vector<labelled_field> bullet_sections = {{"INGREDIENTS", "ingredients"}};

    /// "LABEL:" followed by "1. entry" lines
    std::vector<labelled_field> numbered_sections = {{"INSTRUCTIONS", "instructions"}};

    std::string footer = "Follow for more delicious recipes daily!";

    /// Fields whose values become tags after the display name
    std::vector<std::string> tag_fields = {"dish_type", "taste_category"};

    std::vector<std::string> base_tags = {
        "recipe", "cooking", "food", "homemade", "chef", "delicious"};

    /// List field from which one tag per entry is derived
    std::string derived_tag_field = "ingredients";

    std::size_t max_total_tag_length = 490;
    std::size_t min_tag_count = 5;

    std::string category_id = "22";
    std::string privacy_status = "public";
    bool made_for_kids = false;

    [[nodiscard]] auto validate() const -> result<void>;
};

/**
 * @brief Derive a tag from a list entry
 *
 * Takes the text before the first comma and returns its last word, so
 * "2 cups flour, sifted" yields "flour".
 * @return Tag, or an empty string if the entry has no words
 */
[[nodiscard]] auto derive_tag(std::string_view entry) -> std::string;

/**
 * @brief Sum of tag lengths
 */
[[nodiscard]] auto total_tag_length(const std::vector<std::string>& tags) -> std::size_t;

/**
 * @brief Drop trailing tags while the total length exceeds the ceiling and
 *        more than min_count tags remain
 */
void trim_tags(std::vector<std::string>& tags, std::size_t max_total_length,
               std::size_t min_count);

/**
 * @brief Builds publish_metadata for catalog items
 */
class publish_metadata_builder {
public:
    explicit publish_metadata_builder(publish_template tmpl = {});

    /**
     * @brief Build metadata for an item
     * @param item Catalog item
     * @param when Date used in the title
     */
    [[nodiscard]] auto build(const media_item& item,
                             std::chrono::system_clock::time_point when =
                                 std::chrono::system_clock::now()) const
        -> publish_metadata;

    [[nodiscard]] auto build_title(const media_item& item,
                                   std::chrono::system_clock::time_point when) const
        -> std::string;

    [[nodiscard]] auto build_description(const media_item& item) const -> std::string;

    [[nodiscard]] auto build_tags(const media_item& item) const -> std::vector<std::string>;

    [[nodiscard]] auto get_template() const -> const publish_template& { return template_; }

private:
    publish_template template_;
};

}  // namespace kcenon::media_relay

#endif  // KCENON_MEDIA_RELAY_TRANSFER_PUBLISH_METADATA_BUILDER_H
