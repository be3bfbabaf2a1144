/**
 * @file catalog_store.h
 * @brief Loads the list of transferable items from a JSON document
 */

#ifndef KCENON_MEDIA_RELAY_CATALOG_CATALOG_STORE_H
#define KCENON_MEDIA_RELAY_CATALOG_CATALOG_STORE_H

#include <kcenon/media_relay/catalog/item.h>
#include <kcenon/media_relay/core/types.h>

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::media_relay {

/**
 * @brief Catalog document layout
 */
struct catalog_config {
    std::filesystem::path path;               ///< Catalog file
    std::string items_key = "recipes";        ///< Member holding the item array
    std::string id_field = "id";
    std::string name_field = "dish_name";
    std::string locator_field = "public_url";

    [[nodiscard]] auto validate() const -> result<void>;
};

/**
 * @brief Remove control bytes 0x00-0x1F other than TAB, LF and CR
 *
 * Catalogs exported from spreadsheets sometimes carry stray control bytes
 * that make an otherwise valid document unparseable.
 * @return Number of bytes removed
 */
auto sanitize_control_bytes(std::string& text) -> std::size_t;

/**
 * @brief Read-only view of the catalog
 *
 * Entries without an id, name or locator are skipped with a warning.
 * Duplicate identifiers keep the first occurrence.
 *
 * @code
 * catalog_store catalog({.path = "recipes.json"});
 * if (auto r = catalog.load(); !r) { ... }
 * for (const auto& item : catalog.items()) { ... }
 * @endcode
 */
class catalog_store {
public:
    explicit catalog_store(catalog_config config);
    ~catalog_store();

    catalog_store(const catalog_store&) = delete;
    auto operator=(const catalog_store&) -> catalog_store& = delete;
    catalog_store(catalog_store&&) noexcept;
    auto operator=(catalog_store&&) noexcept -> catalog_store&;

    /**
     * @brief Load the catalog file named in the configuration
     * @return Success, file_not_found, file_read_error or catalog_parse_error
     */
    [[nodiscard]] auto load() -> result<void>;

    /**
     * @brief Load the catalog from document text
     */
    [[nodiscard]] auto load_from_string(std::string text) -> result<void>;

    /**
     * @brief Items in document order
     */
    [[nodiscard]] auto items() const -> const std::vector<media_item>&;

    /**
     * @brief Look up an item by identifier
     * @return Pointer into the catalog, or nullptr
     */
    [[nodiscard]] auto find(std::string_view id) const -> const media_item*;

    [[nodiscard]] auto size() const -> std::size_t;

    [[nodiscard]] auto config() const -> const catalog_config&;

private:
    class impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::media_relay

#endif  // KCENON_MEDIA_RELAY_CATALOG_CATALOG_STORE_H
