#include "wisp/style/styled_node.h"

#include "wisp/core/config.h"

#include <array>
#include <utility>

namespace wisp::style {
namespace {

constexpr std::array<std::string_view, 9> kInheritedProperties = {
    "color",       "font-family", "font-size",  "font-style", "font-weight",
    "line-height", "text-align",  "visibility", "white-space",
};

struct NamedColor {
    std::string_view name;
    css::Color color;
};

constexpr std::array<NamedColor, 18> kNamedColors = {{
    {"black", {0, 0, 0, 255}},
    {"silver", {192, 192, 192, 255}},
    {"gray", {128, 128, 128, 255}},
    {"grey", {128, 128, 128, 255}},
    {"white", {255, 255, 255, 255}},
    {"maroon", {128, 0, 0, 255}},
    {"red", {255, 0, 0, 255}},
    {"purple", {128, 0, 128, 255}},
    {"fuchsia", {255, 0, 255, 255}},
    {"green", {0, 128, 0, 255}},
    {"lime", {0, 255, 0, 255}},
    {"olive", {128, 128, 0, 255}},
    {"yellow", {255, 255, 0, 255}},
    {"navy", {0, 0, 128, 255}},
    {"blue", {0, 0, 255, 255}},
    {"teal", {0, 128, 128, 255}},
    {"aqua", {0, 255, 255, 255}},
    {"transparent", {0, 0, 0, 0}},
}};

bool has_prefix(std::string_view text, std::string_view prefix) {
    return text.substr(0, prefix.size()) == prefix;
}

bool has_suffix(std::string_view text, std::string_view suffix) {
    return text.size() >= suffix.size() &&
           text.substr(text.size() - suffix.size()) == suffix;
}

void serialize_into(const StyledNode& node, std::string& out) {
    if (node.node == nullptr) {
        out += "(detached)";
    } else if (node.node->is_text()) {
        out += "TEXT(\"" + node.node->text_content + "\")";
    } else {
        out += "<" + node.node->tag_name + ">";
    }

    out += "{";
    for (const auto& [property, value] : node.specified_values) {
        out += property + ": " + css::to_string(value) + ";";
    }
    out += "}";

    for (const auto& child : node.children) {
        out += "[";
        serialize_into(*child, out);
        out += "]";
    }
}

}  // namespace

std::optional<css::Value> StyledNode::value(const std::string& name) const {
    const auto it = specified_values.find(name);
    if (it == specified_values.end()) {
        return std::nullopt;
    }
    return it->second;
}

css::Value StyledNode::lookup(const std::string& name) const {
    const auto it = specified_values.find(name);
    if (it != specified_values.end()) {
        return it->second;
    }
    if (parent != nullptr && is_inherited_property(name)) {
        return parent->lookup(name);
    }
    return initial_value(name);
}

Display StyledNode::display() const {
    const auto it = specified_values.find("display");
    if (it != specified_values.end()) {
        if (css::is_keyword(it->second, "block")) {
            return Display::Block;
        }
        if (css::is_keyword(it->second, "inline")) {
            return Display::Inline;
        }
        if (css::is_keyword(it->second, "none")) {
            return Display::None;
        }
    }
    return is_root() ? Display::Block : Display::Inline;
}

bool is_inherited_property(std::string_view name) {
    for (std::string_view inherited : kInheritedProperties) {
        if (inherited == name) {
            return true;
        }
    }
    return false;
}

css::Value initial_value(std::string_view name) {
    if (name == "display") {
        return css::Keyword{"inline"};
    }
    if (name == "width" || name == "height") {
        return css::Keyword{"auto"};
    }
    if (has_prefix(name, "margin") || has_prefix(name, "padding") ||
        (has_prefix(name, "border") && has_suffix(name, "width"))) {
        return css::Length{0.0f, css::Unit::Px};
    }
    if (name == "color") {
        return css::Color{0, 0, 0, 255};
    }
    if (name == "background-color") {
        return css::Color{0, 0, 0, 0};
    }
    if (name == "font-size") {
        return css::Length{core::config::kDefaultFontSizePx, css::Unit::Px};
    }
    return css::Keyword{"initial"};
}

std::optional<css::Color> to_color(const css::Value& value) {
    if (const auto* color = std::get_if<css::Color>(&value)) {
        return *color;
    }
    if (const auto* keyword = std::get_if<css::Keyword>(&value)) {
        for (const NamedColor& named : kNamedColors) {
            if (named.name == keyword->name) {
                return named.color;
            }
        }
    }
    return std::nullopt;
}

std::string serialize_styled_tree(const StyledNode& root) {
    std::string out;
    serialize_into(root, out);
    return out;
}

}  // namespace wisp::style
