/**
 * @file catalog_store.cpp
 * @brief Implementation of catalog_store
 */

#include <kcenon/media_relay/catalog/catalog_store.h>
#include <kcenon/media_relay/core/logging.h>

#include <algorithm>
#include <fstream>
#include <sstream>
#include <unordered_map>

namespace kcenon::media_relay {

auto catalog_config::validate() const -> result<void> {
    if (items_key.empty() || id_field.empty() || name_field.empty() ||
        locator_field.empty()) {
        return unexpected(error{error_code::invalid_configuration,
                                "catalog field names must not be empty"});
    }
    return {};
}

auto sanitize_control_bytes(std::string& text) -> std::size_t {
    auto is_stray = [](char c) {
        auto b = static_cast<unsigned char>(c);
        return b < 0x20 && b != '\t' && b != '\n' && b != '\r';
    };
    auto new_end = std::remove_if(text.begin(), text.end(), is_stray);
    auto removed = static_cast<std::size_t>(std::distance(new_end, text.end()));
    text.erase(new_end, text.end());
    return removed;
}

// ============================================================================
// catalog_store::impl
// ============================================================================

class catalog_store::impl {
public:
    explicit impl(catalog_config cfg) : config_(std::move(cfg)) {}

    auto load() -> result<void> {
        std::error_code ec;
        if (!std::filesystem::exists(config_.path, ec)) {
            MR_LOG_ERROR(log_category::catalog,
                "Catalog file not found: " + config_.path.string());
            return unexpected(error{error_code::file_not_found,
                                    "catalog file not found: " + config_.path.string()});
        }

        std::ifstream file(config_.path, std::ios::binary);
        if (!file) {
            return unexpected(error{error_code::file_read_error,
                                    "failed to open catalog: " + config_.path.string()});
        }
        std::ostringstream oss;
        oss << file.rdbuf();
        if (file.bad()) {
            return unexpected(error{error_code::file_read_error,
                                    "failed to read catalog: " + config_.path.string()});
        }
        return load_from_string(oss.str());
    }

    auto load_from_string(std::string text) -> result<void> {
        auto removed = sanitize_control_bytes(text);
        if (removed > 0) {
            MR_LOG_WARN(log_category::catalog,
                "Stripped " + std::to_string(removed) + " control bytes from catalog");
        }

        auto parsed = json_value::parse(text);
        if (!parsed) {
            MR_LOG_ERROR(log_category::catalog,
                "Failed to parse catalog: " + parsed.error().message);
            return unexpected(error{error_code::catalog_parse_error, parsed.error().message});
        }

        const auto& root = parsed.value();
        const auto* list = root.find(config_.items_key);
        if (!list || !list->is_array()) {
            return unexpected(error{error_code::catalog_parse_error,
                                    "catalog has no '" + config_.items_key + "' array"});
        }

        std::vector<media_item> loaded;
        std::unordered_map<std::string, std::size_t> seen;
        loaded.reserve(list->size());

        std::size_t index = 0;
        for (const auto& entry : list->as_array()) {
            ++index;
            auto item = to_item(entry);
            if (!item) {
                MR_LOG_WARN(log_category::catalog,
                    "Skipping catalog entry #" + std::to_string(index) + ": " +
                    item.error().message);
                continue;
            }
            if (seen.count(item.value().id) > 0) {
                MR_LOG_WARN(log_category::catalog,
                    "Duplicate item id " + item.value().id + " ignored");
                continue;
            }
            seen.emplace(item.value().id, loaded.size());
            loaded.push_back(std::move(item.value()));
        }

        items_ = std::move(loaded);
        index_ = std::move(seen);

        MR_LOG_INFO(log_category::catalog,
            "Loaded " + std::to_string(items_.size()) + " items from catalog");
        return {};
    }

    auto find(std::string_view id) const -> const media_item* {
        auto it = index_.find(std::string(id));
        return it == index_.end() ? nullptr : &items_[it->second];
    }

    catalog_config config_;
    std::vector<media_item> items_;
    std::unordered_map<std::string, std::size_t> index_;

private:
    auto to_item(const json_value& entry) const -> result<media_item> {
        if (!entry.is_object()) {
            return unexpected(error{error_code::catalog_parse_error, "not an object"});
        }

        auto text_of = [&](const std::string& field) -> std::string {
            const auto* v = entry.find(field);
            if (!v) return {};
            return v->scalar_text().value_or(std::string{});
        };

        media_item item;
        item.id = text_of(config_.id_field);
        item.display_name = text_of(config_.name_field);
        item.locator = text_of(config_.locator_field);

        if (item.id.empty()) {
            return unexpected(error{error_code::catalog_parse_error,
                                    "missing '" + config_.id_field + "'"});
        }
        if (item.display_name.empty()) {
            return unexpected(error{error_code::catalog_parse_error,
                                    "item " + item.id + " missing '" + config_.name_field + "'"});
        }
        if (item.locator.empty()) {
            return unexpected(error{error_code::catalog_parse_error,
                                    "item " + item.id + " missing '" + config_.locator_field + "'"});
        }
        item.metadata = entry;
        return item;
    }
};

// ============================================================================
// catalog_store
// ============================================================================

catalog_store::catalog_store(catalog_config config)
    : impl_(std::make_unique<impl>(std::move(config))) {}

catalog_store::~catalog_store() = default;

catalog_store::catalog_store(catalog_store&&) noexcept = default;
auto catalog_store::operator=(catalog_store&&) noexcept -> catalog_store& = default;

auto catalog_store::load() -> result<void> {
    return impl_->load();
}

auto catalog_store::load_from_string(std::string text) -> result<void> {
    return impl_->load_from_string(std::move(text));
}

auto catalog_store::items() const -> const std::vector<media_item>& {
    return impl_->items_;
}

auto catalog_store::find(std::string_view id) const -> const media_item* {
    return impl_->find(id);
}

auto catalog_store::size() const -> std::size_t {
    return impl_->items_.size();
}

auto catalog_store::config() const -> const catalog_config& {
    return impl_->config_;
}

}  // namespace kcenon::media_relay
