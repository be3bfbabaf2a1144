/**
 * @file json.h
 * @brief Minimal JSON document model used by the catalog and state stores
 *
 * Objects keep their members in insertion order so persisted state files
 * diff cleanly between runs. Numbers keep their source text, which lets a
 * numeric identifier such as 7 round-trip as "7" without float formatting.
 */

#ifndef KCENON_MEDIA_RELAY_CORE_JSON_H
#define KCENON_MEDIA_RELAY_CORE_JSON_H

#include <kcenon/media_relay/core/types.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace kcenon::media_relay {

/**
 * @brief A parsed JSON value
 */
class json_value {
public:
    enum class kind { null, boolean, number, string, array, object };

    using array_type = std::vector<json_value>;
    using member_type = std::pair<std::string, json_value>;
    using object_type = std::vector<member_type>;

    json_value() = default;

    [[nodiscard]] static auto make_bool(bool value) -> json_value;
    [[nodiscard]] static auto make_number(int64_t value) -> json_value;
    [[nodiscard]] static auto make_number(double value) -> json_value;
    [[nodiscard]] static auto make_string(std::string value) -> json_value;
    [[nodiscard]] static auto make_array() -> json_value;
    [[nodiscard]] static auto make_object() -> json_value;

    /**
     * @brief Parse a complete JSON document
     * @param text Document text
     * @return Parsed value or malformed_document error with position
     */
    [[nodiscard]] static auto parse(std::string_view text) -> result<json_value>;

    /**
     * @brief Serialize the value
     * @param indent Spaces per nesting level; negative for compact output
     */
    [[nodiscard]] auto dump(int indent = -1) const -> std::string;

    [[nodiscard]] auto type() const noexcept -> kind { return kind_; }
    [[nodiscard]] auto is_null() const noexcept -> bool { return kind_ == kind::null; }
    [[nodiscard]] auto is_bool() const noexcept -> bool { return kind_ == kind::boolean; }
    [[nodiscard]] auto is_number() const noexcept -> bool { return kind_ == kind::number; }
    [[nodiscard]] auto is_string() const noexcept -> bool { return kind_ == kind::string; }
    [[nodiscard]] auto is_array() const noexcept -> bool { return kind_ == kind::array; }
    [[nodiscard]] auto is_object() const noexcept -> bool { return kind_ == kind::object; }

    [[nodiscard]] auto as_bool() const -> bool { return bool_; }
    [[nodiscard]] auto as_double() const -> double;
    [[nodiscard]] auto as_int64() const -> std::optional<int64_t>;

    /**
     * @brief String content, or the source text for numbers
     */
    [[nodiscard]] auto as_string() const -> const std::string& { return text_; }

    [[nodiscard]] auto as_array() const -> const array_type& { return array_; }
    [[nodiscard]] auto as_object() const -> const object_type& { return object_; }

    /**
     * @brief Render a scalar as text (strings verbatim, numbers by source text)
     * @return Text, or nullopt for null, arrays and objects
     */
    [[nodiscard]] auto scalar_text() const -> std::optional<std::string>;

    /**
     * @brief Look up an object member
     * @return Pointer to the member value, or nullptr if absent or not an object
     */
    [[nodiscard]] auto find(std::string_view key) const -> const json_value*;

    /**
     * @brief Insert or replace an object member
     */
    void set(std::string key, json_value value);

    /**
     * @brief Remove an object member
     * @return true if a member was removed
     */
    auto erase(std::string_view key) -> bool;

    /**
     * @brief Append to an array
     */
    void push_back(json_value value);

    [[nodiscard]] auto size() const noexcept -> std::size_t;

private:
    void dump_to(std::string& out, int indent, int depth) const;

    kind kind_ = kind::null;
    bool bool_ = false;
    std::string text_;
    array_type array_;
    object_type object_;

    friend class json_parser;
};

/**
 * @brief Escape a string for inclusion in a JSON document (without quotes)
 */
[[nodiscard]] auto escape_json(std::string_view input) -> std::string;

}  // namespace kcenon::media_relay

#endif  // KCENON_MEDIA_RELAY_CORE_JSON_H
