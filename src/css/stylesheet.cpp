#include "wisp/css/stylesheet.h"

#include <cstdio>
#include <locale>
#include <sstream>
#include <tuple>

namespace wisp::css {
namespace {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

std::string hex_byte(std::uint8_t byte) {
    char buffer[3];
    std::snprintf(buffer, sizeof(buffer), "%02x", static_cast<unsigned>(byte));
    return buffer;
}

const char* unit_name(Unit unit) {
    switch (unit) {
        case Unit::Px: return "px";
    }
    return "";
}

std::string format_number(float value) {
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << value;
    return oss.str();
}

}  // namespace

bool operator==(const Keyword& lhs, const Keyword& rhs) {
    return lhs.name == rhs.name;
}

bool operator!=(const Keyword& lhs, const Keyword& rhs) {
    return !(lhs == rhs);
}

bool operator==(const Length& lhs, const Length& rhs) {
    return lhs.value == rhs.value && lhs.unit == rhs.unit;
}

bool operator!=(const Length& lhs, const Length& rhs) {
    return !(lhs == rhs);
}

bool operator==(const Color& lhs, const Color& rhs) {
    return lhs.r == rhs.r && lhs.g == rhs.g && lhs.b == rhs.b && lhs.a == rhs.a;
}

bool operator!=(const Color& lhs, const Color& rhs) {
    return !(lhs == rhs);
}

std::optional<float> to_px(const Value& value) {
    if (const auto* length = std::get_if<Length>(&value)) {
        switch (length->unit) {
            case Unit::Px: return length->value;
        }
    }
    return std::nullopt;
}

bool is_keyword(const Value& value, std::string_view name) {
    const auto* keyword = std::get_if<Keyword>(&value);
    return keyword != nullptr && keyword->name == name;
}

std::string to_string(const Value& value) {
    return std::visit(overloaded{
        [](const Keyword& keyword) { return keyword.name; },
        [](const Length& length) {
            return format_number(length.value) + unit_name(length.unit);
        },
        [](const Color& color) {
            std::string out = "#" + hex_byte(color.r) + hex_byte(color.g) + hex_byte(color.b);
            if (color.a != 255) {
                out += hex_byte(color.a);
            }
            return out;
        },
    }, value);
}

bool Specificity::operator<(const Specificity& other) const {
    return std::tie(a, b, c) < std::tie(other.a, other.b, other.c);
}

bool Specificity::operator==(const Specificity& other) const {
    return a == other.a && b == other.b && c == other.c;
}

Specificity specificity(const Selector& selector) {
    return std::visit([](const SimpleSelector& simple) {
        Specificity result;
        result.a = simple.id ? 1 : 0;
        result.b = static_cast<int>(simple.classes.size());
        result.c = simple.tag_name ? 1 : 0;
        return result;
    }, selector);
}

std::string to_string(const Selector& selector) {
    return std::visit([](const SimpleSelector& simple) {
        std::string out;
        if (simple.tag_name) {
            out += *simple.tag_name;
        }
        if (simple.id) {
            out += "#" + *simple.id;
        }
        for (const auto& class_name : simple.classes) {
            out += "." + class_name;
        }
        return out.empty() ? std::string("*") : out;
    }, selector);
}

std::string serialize_stylesheet(const Stylesheet& sheet) {
    std::string out;
    for (const auto& rule : sheet.rules) {
        for (std::size_t i = 0; i < rule.selectors.size(); ++i) {
            if (i > 0) {
                out += ", ";
            }
            out += to_string(rule.selectors[i]);
        }
        out += " {";
        for (const auto& declaration : rule.declarations) {
            out += " " + declaration.property + ": " + to_string(declaration.value) + ";";
        }
        out += " }\n";
    }
    return out;
}

}  // namespace wisp::css
