#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace wisp::css {

enum class Unit {
    Px,
};

struct Keyword {
    std::string name;
};

struct Length {
    float value = 0.0f;
    Unit unit = Unit::Px;
};

struct Color {
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;
    std::uint8_t a = 255;
};

bool operator==(const Keyword& lhs, const Keyword& rhs);
bool operator!=(const Keyword& lhs, const Keyword& rhs);
bool operator==(const Length& lhs, const Length& rhs);
bool operator!=(const Length& lhs, const Length& rhs);
bool operator==(const Color& lhs, const Color& rhs);
bool operator!=(const Color& lhs, const Color& rhs);

using Value = std::variant<Keyword, Length, Color>;

// Length in px, or nothing for keywords and colors.
std::optional<float> to_px(const Value& value);
bool is_keyword(const Value& value, std::string_view name);

// "auto", "12.5px", "#ff0000" (alpha appended when not opaque)
std::string to_string(const Value& value);

// tag, #id and .class parts; all optional. Having none of them never matches.
struct SimpleSelector {
    std::optional<std::string> tag_name;
    std::optional<std::string> id;
    std::set<std::string> classes;
};

using Selector = std::variant<SimpleSelector>;

struct Specificity {
    int a = 0;  // ID selectors
    int b = 0;  // class selectors
    int c = 0;  // tag-name selectors

    bool operator<(const Specificity& other) const;
    bool operator==(const Specificity& other) const;
    bool operator!=(const Specificity& other) const { return !(*this == other); }
    bool operator>(const Specificity& other) const { return other < *this; }
};

Specificity specificity(const Selector& selector);
std::string to_string(const Selector& selector);

struct Declaration {
    std::string property;
    Value value;
};

// Several selectors share one declaration block; equivalent to one rule per
// selector. Selectors are kept most specific first.
struct Rule {
    std::vector<Selector> selectors;
    std::vector<Declaration> declarations;
};

struct Stylesheet {
    std::vector<Rule> rules;
};

// One rule per line: "div, .a { color: red; width: 10px; }"
std::string serialize_stylesheet(const Stylesheet& sheet);

}  // namespace wisp::css
