/**
 * @file publish_metadata_builder.cpp
 * @brief Implementation of publish_metadata_builder
 */

#include <kcenon/media_relay/transfer/publish_metadata_builder.h>

#include <algorithm>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace kcenon::media_relay {

auto publish_template::validate() const -> result<void> {
    if (max_total_tag_length == 0) {
        return unexpected(error{error_code::invalid_configuration,
                                "max_total_tag_length must be positive"});
    }
    if (category_id.empty() || privacy_status.empty()) {
        return unexpected(error{error_code::invalid_configuration,
                                "category_id and privacy_status are required"});
    }
    return {};
}

auto derive_tag(std::string_view entry) -> std::string {
    auto head = entry.substr(0, entry.find(','));
    auto is_space = [](char c) {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
    };

    auto end = head.size();
    while (end > 0 && is_space(head[end - 1])) {
        --end;
    }
    auto begin = end;
    while (begin > 0 && !is_space(head[begin - 1])) {
        --begin;
    }
    return std::string(head.substr(begin, end - begin));
}

auto total_tag_length(const std::vector<std::string>& tags) -> std::size_t {
    std::size_t total = 0;
    for (const auto& tag : tags) {
        total += tag.size();
    }
    return total;
}

void trim_tags(std::vector<std::string>& tags, std::size_t max_total_length,
               std::size_t min_count) {
    auto total = total_tag_length(tags);
    while (total > max_total_length && tags.size() > min_count) {
        total -= tags.back().size();
        tags.pop_back();
    }
}

publish_metadata_builder::publish_metadata_builder(publish_template tmpl)
    : template_(std::move(tmpl)) {}

auto publish_metadata_builder::build(const media_item& item,
                                     std::chrono::system_clock::time_point when) const
    -> publish_metadata {
    publish_metadata metadata;
    metadata.title = build_title(item, when);
    metadata.description = build_description(item);
    metadata.tags = build_tags(item);
    metadata.category_id = template_.category_id;
    metadata.privacy_status = template_.privacy_status;
    metadata.made_for_kids = template_.made_for_kids;
    return metadata;
}

auto publish_metadata_builder::build_title(const media_item& item,
                                           std::chrono::system_clock::time_point when) const
    -> std::string {
    auto time_t_val = std::chrono::system_clock::to_time_t(when);
    std::tm tm_buf{};
    localtime_r(&time_t_val, &tm_buf);

    std::ostringstream oss;
    oss << item.display_name << template_.title_suffix << " - "
        << std::put_time(&tm_buf, "%Y-%m-%d");
    return oss.str();
}

auto publish_metadata_builder::build_description(const media_item& item) const
    -> std::string {
    std::ostringstream oss;
    oss << item.display_name << "\n\n";

    bool wrote_scalar = false;
    for (const auto& [label, field] : template_.scalar_fields) {
        if (auto value = item.field_text(field)) {
            oss << label << ": " << *value << "\n";
            wrote_scalar = true;
        }
    }
    if (wrote_scalar) {
        oss << "\n";
    }

    for (const auto& [label, field] : template_.bullet_sections) {
        auto entries = item.field_list(field);
        if (entries.empty()) continue;
        oss << label << ":\n";
        for (const auto& entry : entries) {
            oss << "- " << entry << "\n";
        }
        oss << "\n";
    }

    for (const auto& [label, field] : template_.numbered_sections) {
        auto entries = item.field_list(field);
        if (entries.empty()) continue;
        oss << label << ":\n";
        for (std::size_t i = 0; i < entries.size(); ++i) {
            oss << (i + 1) << ". " << entries[i] << "\n";
        }
        oss << "\n";
    }

    oss << template_.footer;
    return oss.str();
}

auto publish_metadata_builder::build_tags(const media_item& item) const
    -> std::vector<std::string> {
    std::vector<std::string> tags;
    auto add = [&tags](std::string tag) {
        if (tag.empty()) return;
        if (std::find(tags.begin(), tags.end(), tag) != tags.end()) return;
        tags.push_back(std::move(tag));
    };

    add(item.display_name);
    for (const auto& field : template_.tag_fields) {
        if (auto value = item.field_text(field)) {
            add(*value);
        }
    }
    for (const auto& tag : template_.base_tags) {
        add(tag);
    }
    if (!template_.derived_tag_field.empty()) {
        for (const auto& entry : item.field_list(template_.derived_tag_field)) {
            add(derive_tag(entry));
        }
    }

    trim_tags(tags, template_.max_total_tag_length, template_.min_tag_count);
    return tags;
}

}  // namespace kcenon::media_relay
