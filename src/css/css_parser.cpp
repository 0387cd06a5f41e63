#include "wisp/css/css_parser.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <string_view>
#include <utility>

namespace wisp::css {
namespace {

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

bool is_hex_digit(char c) {
    return std::isxdigit(static_cast<unsigned char>(c)) != 0;
}

bool is_identifier_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '-' || c == '_' ||
           static_cast<unsigned char>(c) >= 0x80;
}

bool is_identifier_char(char c) {
    return is_identifier_start(c) || is_digit(c);
}

std::string to_lower_ascii(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::string trim_copy(std::string_view s) {
    std::size_t begin = 0;
    while (begin < s.size() && is_space(s[begin])) {
        ++begin;
    }
    std::size_t end = s.size();
    while (end > begin && is_space(s[end - 1])) {
        --end;
    }
    return std::string(s.substr(begin, end - begin));
}

int hex_value(char c) {
    if (is_digit(c)) {
        return c - '0';
    }
    return 10 + (std::tolower(static_cast<unsigned char>(c)) - 'a');
}

std::uint8_t hex_pair(std::string_view hex, std::size_t at) {
    return static_cast<std::uint8_t>(hex_value(hex[at]) * 16 + hex_value(hex[at + 1]));
}

std::uint8_t hex_single(char c) {
    return static_cast<std::uint8_t>(hex_value(c) * 17);
}

std::optional<Color> color_from_hex(std::string_view hex) {
    if (!std::all_of(hex.begin(), hex.end(), is_hex_digit)) {
        return std::nullopt;
    }

    Color color;
    switch (hex.size()) {
        case 3:
            color.r = hex_single(hex[0]);
            color.g = hex_single(hex[1]);
            color.b = hex_single(hex[2]);
            return color;
        case 6:
        case 8:
            color.r = hex_pair(hex, 0);
            color.g = hex_pair(hex, 2);
            color.b = hex_pair(hex, 4);
            color.a = hex.size() == 8 ? hex_pair(hex, 6) : 255;
            return color;
        default:
            return std::nullopt;
    }
}

class Parser {
public:
    Parser(std::string_view source, std::vector<StyleWarning>* warnings)
        : source_(source), warnings_(warnings) {}

    Stylesheet parse_rules() {
        Stylesheet sheet;
        while (true) {
            skip_whitespace_and_comments();
            if (eof()) {
                break;
            }
            if (peek() == '@') {
                skip_at_rule();
                continue;
            }
            if (peek() == '}') {
                warn("Unmatched '}'", "}");
                ++position_;
                continue;
            }
            if (auto rule = parse_rule()) {
                sheet.rules.push_back(std::move(*rule));
            }
        }
        return sheet;
    }

    // With `inline_block`, end of input closes the list without a warning
    // and a stray '}' is skipped like any other junk.
    std::vector<Declaration> parse_declarations(bool inline_block) {
        std::vector<Declaration> declarations;
        while (true) {
            skip_whitespace_and_comments();
            if (eof()) {
                if (!inline_block) {
                    warn("Unterminated declaration block", "");
                }
                break;
            }
            if (peek() == '}') {
                ++position_;
                if (inline_block) {
                    warn("Unexpected '}' in declaration list", "}");
                    continue;
                }
                break;
            }
            if (peek() == ';') {
                ++position_;
                continue;
            }
            if (auto declaration = parse_declaration()) {
                declarations.push_back(std::move(*declaration));
            }
        }
        return declarations;
    }

    std::optional<Value> parse_single_value() {
        skip_whitespace_and_comments();
        auto value = parse_value();
        skip_whitespace_and_comments();
        if (!eof()) {
            return std::nullopt;
        }
        return value;
    }

private:
    std::string_view source_;
    std::size_t position_ = 0;
    std::vector<StyleWarning>* warnings_ = nullptr;

    bool eof() const { return position_ >= source_.size(); }

    char peek(std::size_t offset = 0) const {
        const std::size_t at = position_ + offset;
        return at < source_.size() ? source_[at] : '\0';
    }

    bool starts_with(std::string_view token) const {
        return source_.substr(position_, token.size()) == token;
    }

    void warn(std::string message, std::string_view text) {
        if (warnings_ == nullptr) {
            return;
        }
        warnings_->push_back({std::move(message), trim_copy(text)});
    }

    std::string_view text_since(std::size_t start) const {
        return source_.substr(start, position_ - start);
    }

    template <typename Predicate>
    std::string_view consume_while(const Predicate& predicate) {
        const std::size_t start = position_;
        while (!eof() && predicate(source_[position_])) {
            ++position_;
        }
        return text_since(start);
    }

    void skip_whitespace_and_comments() {
        while (!eof()) {
            if (is_space(peek())) {
                ++position_;
            } else if (starts_with("/*")) {
                const std::size_t end = source_.find("*/", position_ + 2);
                if (end == std::string_view::npos) {
                    warn("Unterminated comment", "/*");
                    position_ = source_.size();
                } else {
                    position_ = end + 2;
                }
            } else {
                break;
            }
        }
    }

    std::string parse_identifier() {
        if (!is_identifier_start(peek())) {
            return {};
        }
        return std::string(consume_while(is_identifier_char));
    }

    // Skips "@name ...;" or "@name ... { ... }" including nested blocks.
    void skip_at_rule() {
        const std::size_t start = position_;
        ++position_;
        const std::string name = parse_identifier();
        int depth = 0;
        while (!eof()) {
            const char c = source_[position_++];
            if (c == ';' && depth == 0) {
                break;
            }
            if (c == '{') {
                ++depth;
            } else if (c == '}') {
                --depth;
                if (depth <= 0) {
                    break;
                }
            }
        }
        warn("Unsupported at-rule '@" + name + "'", text_since(start));
    }

    std::optional<Rule> parse_rule() {
        Rule rule;
        rule.selectors = parse_selectors();
        if (eof()) {
            warn("Selector list without declaration block", "");
            return std::nullopt;
        }

        ++position_;  // '{'
        rule.declarations = parse_declarations(false);

        if (rule.selectors.empty()) {
            warn("Rule has no supported selector", "");
            return std::nullopt;
        }
        return rule;
    }

    // Stops at '{' or end of input.
    std::vector<Selector> parse_selectors() {
        std::vector<Selector> selectors;
        while (true) {
            skip_whitespace_and_comments();
            if (eof() || peek() == '{') {
                break;
            }

            const std::size_t start = position_;
            std::optional<SimpleSelector> selector = parse_simple_selector();
            skip_whitespace_and_comments();
            if (selector && (eof() || peek() == ',' || peek() == '{')) {
                if (!selector->tag_name && !selector->id && selector->classes.empty()) {
                    warn("Universal selector matches no element", text_since(start));
                }
                selectors.emplace_back(std::move(*selector));
            } else {
                consume_while([](char c) { return c != ',' && c != '{'; });
                warn("Unsupported selector", text_since(start));
            }

            if (peek() == ',') {
                ++position_;
            }
        }

        std::stable_sort(selectors.begin(), selectors.end(),
                         [](const Selector& lhs, const Selector& rhs) {
                             return specificity(lhs) > specificity(rhs);
                         });
        return selectors;
    }

    // (tag | '*')? ('#' id | '.' class)*
    std::optional<SimpleSelector> parse_simple_selector() {
        SimpleSelector selector;
        bool has_part = false;

        if (peek() == '*') {
            ++position_;
            has_part = true;
        } else if (is_identifier_start(peek())) {
            selector.tag_name = to_lower_ascii(parse_identifier());
            has_part = true;
        }

        while (peek() == '#' || peek() == '.') {
            const char kind = peek();
            ++position_;
            std::string name = parse_identifier();
            if (name.empty()) {
                return std::nullopt;
            }
            if (kind == '#') {
                selector.id = std::move(name);
            } else {
                selector.classes.insert(std::move(name));
            }
            has_part = true;
        }

        if (!has_part) {
            return std::nullopt;
        }
        return selector;
    }

    std::optional<Declaration> parse_declaration() {
        const std::size_t start = position_;
        std::string property = to_lower_ascii(parse_identifier());
        skip_whitespace_and_comments();
        if (property.empty() || peek() != ':') {
            skip_rest_of_declaration(start, "Malformed declaration");
            return std::nullopt;
        }
        ++position_;
        skip_whitespace_and_comments();

        std::optional<Value> value = parse_value();
        skip_whitespace_and_comments();
        if (!value || !(eof() || peek() == ';' || peek() == '}')) {
            skip_rest_of_declaration(start, "Unsupported value for '" + property + "'");
            return std::nullopt;
        }
        if (peek() == ';') {
            ++position_;
        }
        return Declaration{std::move(property), std::move(*value)};
    }

    void skip_rest_of_declaration(std::size_t start, std::string message) {
        consume_while([](char c) { return c != ';' && c != '}'; });
        warn(std::move(message), text_since(start));
        if (peek() == ';') {
            ++position_;
        }
    }

    bool at_number() const {
        const char c = peek();
        if (is_digit(c)) {
            return true;
        }
        if (c == '-' || c == '+') {
            return is_digit(peek(1)) || (peek(1) == '.' && is_digit(peek(2)));
        }
        return c == '.' && is_digit(peek(1));
    }

    std::optional<Value> parse_value() {
        if (at_number()) {
            return parse_length();
        }
        if (peek() == '#') {
            return parse_color();
        }
        if (is_identifier_start(peek())) {
            return Keyword{parse_identifier()};
        }
        return std::nullopt;
    }

    // number unit?; only px is recognized, a bare number counts as px.
    // Whitespace may separate the number from "px".
    std::optional<Value> parse_length() {
        if (peek() == '+') {
            ++position_;
        }
        const std::size_t start = position_;
        if (peek() == '-') {
            ++position_;
        }
        consume_while(is_digit);
        if (peek() == '.' && is_digit(peek(1))) {
            ++position_;
            consume_while(is_digit);
        }

        const std::string_view number = text_since(start);
        float amount = 0.0f;
        const std::from_chars_result result =
            std::from_chars(number.data(), number.data() + number.size(), amount);
        if (result.ec != std::errc() || result.ptr != number.data() + number.size()) {
            return std::nullopt;
        }

        if (peek() == '%') {
            ++position_;
            return std::nullopt;
        }
        std::string unit = to_lower_ascii(std::string(consume_while(is_identifier_char)));
        if (unit.empty()) {
            const std::size_t after_number = position_;
            consume_while(is_space);
            unit = to_lower_ascii(std::string(consume_while(is_identifier_char)));
            if (unit != "px") {
                position_ = after_number;
                unit.clear();
            }
        }
        if (unit.empty() || unit == "px") {
            return Length{amount, Unit::Px};
        }
        return std::nullopt;
    }

    // #rgb, #rrggbb or #rrggbbaa
    std::optional<Value> parse_color() {
        ++position_;
        const std::string_view hex = consume_while(is_identifier_char);
        if (auto color = color_from_hex(hex)) {
            return *color;
        }
        return std::nullopt;
    }
};

}  // namespace

Stylesheet parse_css(const std::string& source) {
    return Parser(source, nullptr).parse_rules();
}

ParseCssResult parse_css_with_diagnostics(const std::string& source) {
    ParseCssResult result;
    result.stylesheet = Parser(source, &result.warnings).parse_rules();
    return result;
}

std::vector<Declaration> parse_declaration_list(const std::string& source) {
    return Parser(source, nullptr).parse_declarations(true);
}

std::optional<Value> parse_value(const std::string& text) {
    return Parser(text, nullptr).parse_single_value();
}

}  // namespace wisp::css
