/**
 * @file item.cpp
 * @brief Implementation of catalog item helpers
 */

#include <kcenon/media_relay/catalog/item.h>

#include <algorithm>

namespace kcenon::media_relay {

namespace {

auto is_all_digits(std::string_view s) -> bool {
    return !s.empty() &&
           std::all_of(s.begin(), s.end(), [](char c) { return c >= '0' && c <= '9'; });
}

auto strip_leading_zeros(std::string_view s) -> std::string_view {
    auto pos = s.find_first_not_of('0');
    return pos == std::string_view::npos ? std::string_view("0") : s.substr(pos);
}

auto sign(int value) -> int {
    return (value > 0) - (value < 0);
}

}  // namespace

auto media_item::field_text(std::string_view name) const -> std::optional<std::string> {
    const auto* value = metadata.find(name);
    if (!value) {
        return std::nullopt;
    }
    auto text = value->scalar_text();
    if (!text || text->empty()) {
        return std::nullopt;
    }
    return text;
}

auto media_item::field_list(std::string_view name) const -> std::vector<std::string> {
    std::vector<std::string> out;
    const auto* value = metadata.find(name);
    if (!value) {
        return out;
    }
    if (value->is_array()) {
        for (const auto& element : value->as_array()) {
            if (auto text = element.scalar_text()) {
                out.push_back(std::move(*text));
            }
        }
    } else if (auto text = value->scalar_text()) {
        out.push_back(std::move(*text));
    }
    return out;
}

auto compare_item_ids(std::string_view lhs, std::string_view rhs) -> int {
    const bool lhs_numeric = is_all_digits(lhs);
    const bool rhs_numeric = is_all_digits(rhs);

    if (lhs_numeric && rhs_numeric) {
        auto a = strip_leading_zeros(lhs);
        auto b = strip_leading_zeros(rhs);
        if (a.size() != b.size()) {
            return a.size() < b.size() ? -1 : 1;
        }
        if (int c = a.compare(b); c != 0) {
            return sign(c);
        }
        // "07" and "7" are distinct identifiers; keep the order total
        return sign(lhs.compare(rhs));
    }
    if (lhs_numeric != rhs_numeric) {
        return lhs_numeric ? -1 : 1;
    }
    return sign(lhs.compare(rhs));
}

auto extract_source_file_id(std::string_view locator) -> result<std::string> {
    constexpr std::string_view path_marker = "/file/d/";

    if (auto pos = locator.find(path_marker); pos != std::string_view::npos) {
        auto rest = locator.substr(pos + path_marker.size());
        auto end = rest.find_first_of("/?#");
        auto id = rest.substr(0, end);
        if (!id.empty()) {
            return std::string(id);
        }
    } else if (auto query = locator.find('?'); query != std::string_view::npos) {
        auto params = locator.substr(query + 1);
        while (!params.empty()) {
            auto amp = params.find('&');
            auto param = params.substr(0, amp);
            if (param.substr(0, 3) == "id=" && param.size() > 3) {
                auto id = param.substr(3);
                id = id.substr(0, id.find('#'));
                if (!id.empty()) {
                    return std::string(id);
                }
            }
            if (amp == std::string_view::npos) {
                break;
            }
            params.remove_prefix(amp + 1);
        }
    }

    return unexpected(error{error_code::invalid_locator,
                            "cannot extract file id from locator: " + std::string(locator)});
}

}  // namespace kcenon::media_relay
