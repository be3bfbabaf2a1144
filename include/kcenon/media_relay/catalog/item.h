/**
 * @file item.h
 * @brief Catalog item model and identifier helpers
 */

#ifndef KCENON_MEDIA_RELAY_CATALOG_ITEM_H
#define KCENON_MEDIA_RELAY_CATALOG_ITEM_H

#include <kcenon/media_relay/core/json.h>
#include <kcenon/media_relay/core/types.h>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::media_relay {

/**
 * @brief One transferable media file described by the catalog
 *
 * The transfer engine only reads id, display_name and locator. The full
 * catalog entry is kept in metadata for the publish step.
 */
struct media_item {
    std::string id;            ///< Stable identifier, normalised to a string
    std::string display_name;  ///< Human-readable name
    std::string locator;       ///< Remote source URL
    json_value metadata;       ///< Original catalog entry

    /**
     * @brief Scalar metadata field as text
     * @return Text, or nullopt if absent, null, empty or not a scalar
     */
    [[nodiscard]] auto field_text(std::string_view name) const -> std::optional<std::string>;

    /**
     * @brief List metadata field as strings
     *
     * Non-scalar entries are skipped. A scalar field is returned as a
     * single-element list.
     */
    [[nodiscard]] auto field_list(std::string_view name) const -> std::vector<std::string>;
};

/**
 * @brief Three-way comparison of item identifiers
 *
 * All-digit identifiers compare numerically and sort before any other
 * identifier; the rest compare lexicographically.
 * @return Negative, zero or positive
 */
[[nodiscard]] auto compare_item_ids(std::string_view lhs, std::string_view rhs) -> int;

/**
 * @brief Strict weak ordering over identifiers for std::sort
 */
struct item_id_less {
    [[nodiscard]] auto operator()(std::string_view lhs, std::string_view rhs) const -> bool {
        return compare_item_ids(lhs, rhs) < 0;
    }
};

/**
 * @brief Extract the remote file identifier from a source locator
 *
 * Accepts ".../file/d/<id>/..." and "...?id=<id>&..." forms.
 * @return File identifier or invalid_locator
 */
[[nodiscard]] auto extract_source_file_id(std::string_view locator) -> result<std::string>;

}  // namespace kcenon::media_relay

#endif  // KCENON_MEDIA_RELAY_CATALOG_ITEM_H
