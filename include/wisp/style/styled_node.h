#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "wisp/css/stylesheet.h"
#include "wisp/html/dom.h"

namespace wisp::style {

using PropertyMap = std::map<std::string, css::Value>;

enum class Display {
    Block,
    Inline,
    None,
};

// A DOM node paired with its cascaded values. The DOM node is borrowed: the
// DOM tree must outlive every styled tree built from it. Children are owned
// and point back to their parent, so a StyledNode never moves or copies.
struct StyledNode {
    const html::Node* node = nullptr;
    PropertyMap specified_values;
    std::vector<std::unique_ptr<StyledNode>> children;
    const StyledNode* parent = nullptr;

    StyledNode() = default;
    explicit StyledNode(const html::Node& dom_node) : node(&dom_node) {}

    StyledNode(const StyledNode&) = delete;
    StyledNode& operator=(const StyledNode&) = delete;

    bool is_root() const { return parent == nullptr; }

    // Cascade winner for `name` on this node only.
    std::optional<css::Value> value(const std::string& name) const;

    // Never empty: the cascade winner, else the nearest ancestor's value for
    // inherited properties, else initial_value(name).
    css::Value lookup(const std::string& name) const;

    // Unknown and absent values are Inline, except on the root where they
    // are Block.
    Display display() const;
};

bool is_inherited_property(std::string_view name);

// Documented default for every property; "initial" for unknown ones.
css::Value initial_value(std::string_view name);

// Color values, plus the basic named colour keywords.
std::optional<css::Color> to_color(const css::Value& value);

// "<div>{color: red;}[TEXT("x"){}]" with children in brackets.
std::string serialize_styled_tree(const StyledNode& root);

}  // namespace wisp::style
