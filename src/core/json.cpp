/**
 * @file json.cpp
 * @brief Recursive-descent JSON parser and serializer
 */

#include <kcenon/media_relay/core/json.h>

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <sstream>

namespace kcenon::media_relay {

// ============================================================================
// Construction helpers
// ============================================================================

auto json_value::make_bool(bool value) -> json_value {
    json_value v;
    v.kind_ = kind::boolean;
    v.bool_ = value;
    return v;
}

auto json_value::make_number(int64_t value) -> json_value {
    json_value v;
    v.kind_ = kind::number;
    v.text_ = std::to_string(value);
    return v;
}

auto json_value::make_number(double value) -> json_value {
    json_value v;
    v.kind_ = kind::number;
    if (!std::isfinite(value)) {
        v.text_ = "0";
        return v;
    }
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.17g", value);
    v.text_ = buf;
    return v;
}

auto json_value::make_string(std::string value) -> json_value {
    json_value v;
    v.kind_ = kind::string;
    v.text_ = std::move(value);
    return v;
}

auto json_value::make_array() -> json_value {
    json_value v;
    v.kind_ = kind::array;
    return v;
}

auto json_value::make_object() -> json_value {
    json_value v;
    v.kind_ = kind::object;
    return v;
}

// ============================================================================
// Accessors
// ============================================================================

auto json_value::as_double() const -> double {
    if (kind_ != kind::number) {
        return 0.0;
    }
    return std::strtod(text_.c_str(), nullptr);
}

auto json_value::as_int64() const -> std::optional<int64_t> {
    if (kind_ != kind::number) {
        return std::nullopt;
    }
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(text_.data(), text_.data() + text_.size(), value);
    if (ec != std::errc{} || ptr != text_.data() + text_.size()) {
        return std::nullopt;
    }
    return value;
}

auto json_value::scalar_text() const -> std::optional<std::string> {
    switch (kind_) {
        case kind::string:
        case kind::number:
            return text_;
        case kind::boolean:
            return std::string(bool_ ? "true" : "false");
        default:
            return std::nullopt;
    }
}

auto json_value::find(std::string_view key) const -> const json_value* {
    if (kind_ != kind::object) {
        return nullptr;
    }
    for (const auto& [name, value] : object_) {
        if (name == key) {
            return &value;
        }
    }
    return nullptr;
}

void json_value::set(std::string key, json_value value) {
    if (kind_ != kind::object) {
        *this = make_object();
    }
    for (auto& member : object_) {
        if (member.first == key) {
            member.second = std::move(value);
            return;
        }
    }
    object_.emplace_back(std::move(key), std::move(value));
}

auto json_value::erase(std::string_view key) -> bool {
    auto it = std::find_if(object_.begin(), object_.end(),
                           [&](const member_type& m) { return m.first == key; });
    if (it == object_.end()) {
        return false;
    }
    object_.erase(it);
    return true;
}

void json_value::push_back(json_value value) {
    if (kind_ != kind::array) {
        *this = make_array();
    }
    array_.push_back(std::move(value));
}

auto json_value::size() const noexcept -> std::size_t {
    switch (kind_) {
        case kind::array: return array_.size();
        case kind::object: return object_.size();
        default: return 0;
    }
}

// ============================================================================
// Serialization
// ============================================================================

auto escape_json(std::string_view input) -> std::string {
    std::string output;
    output.reserve(input.size() + 8);
    for (char c : input) {
        switch (c) {
            case '"':  output += "\\\""; break;
            case '\\': output += "\\\\"; break;
            case '\b': output += "\\b";  break;
            case '\f': output += "\\f";  break;
            case '\n': output += "\\n";  break;
            case '\r': output += "\\r";  break;
            case '\t': output += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x",
                                  static_cast<unsigned char>(c));
                    output += buf;
                } else {
                    output += c;
                }
        }
    }
    return output;
}

auto json_value::dump(int indent) const -> std::string {
    std::string out;
    dump_to(out, indent, 0);
    return out;
}

void json_value::dump_to(std::string& out, int indent, int depth) const {
    auto newline = [&](int level) {
        if (indent < 0) return;
        out += '\n';
        out.append(static_cast<std::size_t>(indent * level), ' ');
    };

    switch (kind_) {
        case kind::null:
            out += "null";
            break;
        case kind::boolean:
            out += bool_ ? "true" : "false";
            break;
        case kind::number:
            out += text_;
            break;
        case kind::string:
            out += '"';
            out += escape_json(text_);
            out += '"';
            break;
        case kind::array:
            out += '[';
            for (std::size_t i = 0; i < array_.size(); ++i) {
                if (i > 0) out += ',';
                newline(depth + 1);
                array_[i].dump_to(out, indent, depth + 1);
            }
            if (!array_.empty()) newline(depth);
            out += ']';
            break;
        case kind::object:
            out += '{';
            for (std::size_t i = 0; i < object_.size(); ++i) {
                if (i > 0) out += ',';
                newline(depth + 1);
                out += '"';
                out += escape_json(object_[i].first);
                out += indent < 0 ? "\":" : "\": ";
                object_[i].second.dump_to(out, indent, depth + 1);
            }
            if (!object_.empty()) newline(depth);
            out += '}';
            break;
    }
}

// ============================================================================
// Parsing
// ============================================================================

class json_parser {
public:
    explicit json_parser(std::string_view text) : text_(text) {}

    auto parse_document() -> result<json_value> {
        json_value value;
        if (!parse_value(value, 0)) {
            return failure();
        }
        skip_whitespace();
        if (pos_ != text_.size()) {
            fail("unexpected trailing content");
            return failure();
        }
        return value;
    }

private:
    static constexpr int max_depth = 256;

    auto failure() const -> unexpected {
        std::ostringstream oss;
        oss << "JSON parse error at offset " << error_pos_ << ": " << error_;
        return unexpected(error{error_code::malformed_document, oss.str()});
    }

    auto fail(const char* what) -> bool {
        if (error_.empty()) {
            error_ = what;
            error_pos_ = pos_;
        }
        return false;
    }

    void skip_whitespace() {
        while (pos_ < text_.size()) {
            char c = text_[pos_];
            if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
                break;
            }
            ++pos_;
        }
    }

    auto consume_literal(std::string_view literal) -> bool {
        if (text_.substr(pos_, literal.size()) != literal) {
            return fail("invalid literal");
        }
        pos_ += literal.size();
        return true;
    }

    auto parse_value(json_value& out, int depth) -> bool {
        if (depth > max_depth) {
            return fail("nesting too deep");
        }
        skip_whitespace();
        if (pos_ >= text_.size()) {
            return fail("unexpected end of input");
        }

        switch (text_[pos_]) {
            case '{': return parse_object(out, depth);
            case '[': return parse_array(out, depth);
            case '"': {
                out = json_value::make_string({});
                return parse_string(out.text_);
            }
            case 't':
                out = json_value::make_bool(true);
                return consume_literal("true");
            case 'f':
                out = json_value::make_bool(false);
                return consume_literal("false");
            case 'n':
                out = json_value{};
                return consume_literal("null");
            default:
                return parse_number(out);
        }
    }

    auto parse_object(json_value& out, int depth) -> bool {
        out = json_value::make_object();
        ++pos_;  // '{'
        skip_whitespace();
        if (pos_ < text_.size() && text_[pos_] == '}') {
            ++pos_;
            return true;
        }

        while (true) {
            skip_whitespace();
            if (pos_ >= text_.size() || text_[pos_] != '"') {
                return fail("expected member name");
            }
            std::string key;
            if (!parse_string(key)) {
                return false;
            }
            skip_whitespace();
            if (pos_ >= text_.size() || text_[pos_] != ':') {
                return fail("expected ':'");
            }
            ++pos_;

            json_value member;
            if (!parse_value(member, depth + 1)) {
                return false;
            }
            out.set(std::move(key), std::move(member));

            skip_whitespace();
            if (pos_ >= text_.size()) {
                return fail("unterminated object");
            }
            if (text_[pos_] == ',') {
                ++pos_;
                continue;
            }
            if (text_[pos_] == '}') {
                ++pos_;
                return true;
            }
            return fail("expected ',' or '}'");
        }
    }

    auto parse_array(json_value& out, int depth) -> bool {
        out = json_value::make_array();
        ++pos_;  // '['
        skip_whitespace();
        if (pos_ < text_.size() && text_[pos_] == ']') {
            ++pos_;
            return true;
        }

        while (true) {
            json_value element;
            if (!parse_value(element, depth + 1)) {
                return false;
            }
            out.array_.push_back(std::move(element));

            skip_whitespace();
            if (pos_ >= text_.size()) {
                return fail("unterminated array");
            }
            if (text_[pos_] == ',') {
                ++pos_;
                continue;
            }
            if (text_[pos_] == ']') {
                ++pos_;
                return true;
            }
            return fail("expected ',' or ']'");
        }
    }

    auto parse_hex4(uint32_t& code) -> bool {
        if (pos_ + 4 > text_.size()) {
            return fail("truncated unicode escape");
        }
        code = 0;
        for (int i = 0; i < 4; ++i) {
            char c = text_[pos_++];
            code <<= 4;
            if (c >= '0' && c <= '9') code |= static_cast<uint32_t>(c - '0');
            else if (c >= 'a' && c <= 'f') code |= static_cast<uint32_t>(c - 'a' + 10);
            else if (c >= 'A' && c <= 'F') code |= static_cast<uint32_t>(c - 'A' + 10);
            else return fail("invalid unicode escape");
        }
        return true;
    }

    static void append_utf8(std::string& out, uint32_t cp) {
        if (cp < 0x80) {
            out += static_cast<char>(cp);
        } else if (cp < 0x800) {
            out += static_cast<char>(0xC0 | (cp >> 6));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else if (cp < 0x10000) {
            out += static_cast<char>(0xE0 | (cp >> 12));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (cp >> 18));
            out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
    }

    auto parse_string(std::string& out) -> bool {
        ++pos_;  // opening quote
        while (pos_ < text_.size()) {
            char c = text_[pos_++];
            if (c == '"') {
                return true;
            }
            if (static_cast<unsigned char>(c) < 0x20) {
                --pos_;
                return fail("control character in string");
            }
            if (c != '\\') {
                out += c;
                continue;
            }
            if (pos_ >= text_.size()) {
                break;
            }
            char esc = text_[pos_++];
            switch (esc) {
                case '"': out += '"'; break;
                case '\\': out += '\\'; break;
                case '/': out += '/'; break;
                case 'b': out += '\b'; break;
                case 'f': out += '\f'; break;
                case 'n': out += '\n'; break;
                case 'r': out += '\r'; break;
                case 't': out += '\t'; break;
                case 'u': {
                    uint32_t cp = 0;
                    if (!parse_hex4(cp)) {
                        return false;
                    }
                    if (cp >= 0xD800 && cp <= 0xDBFF &&
                        text_.substr(pos_, 2) == "\\u") {
                        pos_ += 2;
                        uint32_t low = 0;
                        if (!parse_hex4(low)) {
                            return false;
                        }
                        if (low >= 0xDC00 && low <= 0xDFFF) {
                            cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                        } else {
                            append_utf8(out, 0xFFFD);
                            cp = low;
                        }
                    } else if (cp >= 0xD800 && cp <= 0xDFFF) {
                        cp = 0xFFFD;
                    }
                    append_utf8(out, cp);
                    break;
                }
                default:
                    --pos_;
                    return fail("invalid escape sequence");
            }
        }
        return fail("unterminated string");
    }

    auto parse_number(json_value& out) -> bool {
        auto start = pos_;
        auto is_digit = [&](std::size_t p) {
            return p < text_.size() && text_[p] >= '0' && text_[p] <= '9';
        };

        if (pos_ < text_.size() && text_[pos_] == '-') ++pos_;
        if (!is_digit(pos_)) {
            return fail("unexpected character");
        }
        if (text_[pos_] == '0') {
            ++pos_;
        } else {
            while (is_digit(pos_)) ++pos_;
        }
        if (pos_ < text_.size() && text_[pos_] == '.') {
            ++pos_;
            if (!is_digit(pos_)) return fail("invalid number");
            while (is_digit(pos_)) ++pos_;
        }
        if (pos_ < text_.size() && (text_[pos_] == 'e' || text_[pos_] == 'E')) {
            ++pos_;
            if (pos_ < text_.size() && (text_[pos_] == '+' || text_[pos_] == '-')) ++pos_;
            if (!is_digit(pos_)) return fail("invalid number");
            while (is_digit(pos_)) ++pos_;
        }

        out = json_value{};
        out.kind_ = json_value::kind::number;
        out.text_ = std::string(text_.substr(start, pos_ - start));
        return true;
    }

    std::string_view text_;
    std::size_t pos_ = 0;
    std::string error_;
    std::size_t error_pos_ = 0;
};

auto json_value::parse(std::string_view text) -> result<json_value> {
    json_parser parser(text);
    return parser.parse_document();
}

}  // namespace kcenon::media_relay
