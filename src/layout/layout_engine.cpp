#include "wisp/layout/layout_engine.h"

#include <algorithm>
#include <locale>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace wisp::layout {
namespace {

using style::Display;
using style::StyledNode;

// Longhand first ("margin-left"), then the single-value shorthand ("margin").
std::optional<css::Value> edge_value(const StyledNode& style,
                                     const std::string& longhand,
                                     const std::string& shorthand) {
    if (auto value = style.value(longhand)) {
        return value;
    }
    return style.value(shorthand);
}

// Absent and non-length values (including "auto") count as zero.
float edge_px(const StyledNode& style,
              const std::string& longhand,
              const std::string& shorthand) {
    const auto value = edge_value(style, longhand, shorthand);
    if (!value) {
        return 0.0f;
    }
    return css::to_px(*value).value_or(0.0f);
}

bool edge_is_auto(const StyledNode& style,
                  const std::string& longhand,
                  const std::string& shorthand) {
    const auto value = edge_value(style, longhand, shorthand);
    return value && css::is_keyword(*value, "auto");
}

// margin / padding: "<prefix>-left" then "<prefix>";
// border: "border-left-width" then "border-width".
EdgeSizes resolve_edges(const StyledNode& style,
                        const std::string& prefix,
                        const std::string& suffix = {}) {
    EdgeSizes edges;
    edges.left = edge_px(style, prefix + "-left" + suffix, prefix + suffix);
    edges.right = edge_px(style, prefix + "-right" + suffix, prefix + suffix);
    edges.top = edge_px(style, prefix + "-top" + suffix, prefix + suffix);
    edges.bottom = edge_px(style, prefix + "-bottom" + suffix, prefix + suffix);
    return edges;
}

std::optional<float> explicit_px(const StyledNode& style, const std::string& property) {
    const auto value = style.value(property);
    if (!value) {
        return std::nullopt;
    }
    return css::to_px(*value);
}

// ---------------------------------------------------------------------------
// Box tree construction
// ---------------------------------------------------------------------------

// Children that mix inline and block-level boxes get each inline run moved
// into one anonymous box, whatever the parent's own type.
std::vector<LayoutBox> wrap_inline_runs(std::vector<LayoutBox> children) {
    const auto is_inline = [](const LayoutBox& box) {
        return box.box_type == BoxType::Inline;
    };
    const bool has_inline = std::any_of(children.begin(), children.end(), is_inline);
    const bool has_block_level = !std::all_of(children.begin(), children.end(), is_inline);
    if (!has_inline || !has_block_level) {
        return children;
    }

    std::vector<LayoutBox> wrapped;
    for (LayoutBox& child : children) {
        if (!is_inline(child)) {
            wrapped.push_back(std::move(child));
            continue;
        }
        if (wrapped.empty() || wrapped.back().box_type != BoxType::Anonymous) {
            wrapped.emplace_back(BoxType::Anonymous, nullptr);
        }
        wrapped.back().children.push_back(std::move(child));
    }
    return wrapped;
}

LayoutBox build_box(const StyledNode& node, BoxType type) {
    LayoutBox box(type, &node);

    std::vector<LayoutBox> children;
    for (const auto& child : node.children) {
        switch (child->display()) {
            case Display::Block:
                children.push_back(build_box(*child, BoxType::Block));
                break;
            case Display::Inline:
                children.push_back(build_box(*child, BoxType::Inline));
                break;
            case Display::None:
                break;
        }
    }

    box.children = wrap_inline_runs(std::move(children));
    return box;
}

// ---------------------------------------------------------------------------
// Layout
// ---------------------------------------------------------------------------

void layout_block(LayoutBox& box, Dimensions& containing_block);
void layout_anonymous(LayoutBox& box, Dimensions& containing_block);
void layout_inline(LayoutBox& box, float x, float y, float available_width);

// Block-level children stack on the content height cursor; each run of
// inline children forms one unwrapped line at the cursor.
void layout_children(LayoutBox& box) {
    Dimensions& d = box.dimensions;
    auto& children = box.children;

    std::size_t i = 0;
    while (i < children.size()) {
        LayoutBox& child = children[i];
        if (child.box_type != BoxType::Inline) {
            if (child.box_type == BoxType::Block) {
                layout_block(child, d);
            } else {
                layout_anonymous(child, d);
            }
            d.content.height += child.dimensions.margin_box().height;
            ++i;
            continue;
        }

        const float line_y = d.content.y + d.content.height;
        float cursor_x = d.content.x;
        float line_height = 0.0f;
        for (; i < children.size() && children[i].box_type == BoxType::Inline; ++i) {
            layout_inline(children[i], cursor_x, line_y, d.content.width);
            const Rect margin_box = children[i].dimensions.margin_box();
            cursor_x += margin_box.width;
            line_height = std::max(line_height, margin_box.height);
        }
        d.content.height += line_height;
    }
}

void calculate_block_width(LayoutBox& box, const Dimensions& containing_block) {
    const StyledNode& style = *box.styled_node;
    Dimensions& d = box.dimensions;

    const std::optional<float> explicit_width = explicit_px(style, "width");
    bool margin_left_auto = edge_is_auto(style, "margin-left", "margin");
    bool margin_right_auto = edge_is_auto(style, "margin-right", "margin");

    float margin_left = edge_px(style, "margin-left", "margin");
    float margin_right = edge_px(style, "margin-right", "margin");
    const float border_left = edge_px(style, "border-left-width", "border-width");
    const float border_right = edge_px(style, "border-right-width", "border-width");
    const float padding_left = edge_px(style, "padding-left", "padding");
    const float padding_right = edge_px(style, "padding-right", "padding");

    float width = explicit_width.value_or(0.0f);
    const float total = margin_left + margin_right + border_left + border_right +
                      padding_left + padding_right + width;

    // Too wide for the containing block: auto margins collapse to zero.
    if (explicit_width && total > containing_block.content.width) {
        margin_left_auto = false;
        margin_right_auto = false;
    }

    const float underflow = containing_block.content.width - total;

    if (!explicit_width) {
        if (underflow >= 0.0f) {
            width = underflow;
        } else {
            width = 0.0f;
            margin_right += underflow;
        }
    } else if (margin_left_auto && margin_right_auto) {
        margin_left = underflow / 2.0f;
        margin_right = underflow / 2.0f;
    } else if (margin_left_auto) {
        margin_left = underflow;
    } else if (margin_right_auto) {
        margin_right = underflow;
    } else {
        // Over-constrained: margin-right absorbs the difference.
        margin_right += underflow;
    }

    d.content.width = width;
    d.padding.left = padding_left;
    d.padding.right = padding_right;
    d.border.left = border_left;
    d.border.right = border_right;
    d.margin.left = margin_left;
    d.margin.right = margin_right;
}

void calculate_block_position(LayoutBox& box, const Dimensions& containing_block) {
    const StyledNode& style = *box.styled_node;
    Dimensions& d = box.dimensions;

    d.margin.top = edge_px(style, "margin-top", "margin");
    d.margin.bottom = edge_px(style, "margin-bottom", "margin");
    d.border.top = edge_px(style, "border-top-width", "border-width");
    d.border.bottom = edge_px(style, "border-bottom-width", "border-width");
    d.padding.top = edge_px(style, "padding-top", "padding");
    d.padding.bottom = edge_px(style, "padding-bottom", "padding");

    d.content.x = containing_block.content.x + d.margin.left + d.border.left + d.padding.left;
    d.content.y = containing_block.content.y + containing_block.content.height +
                  d.margin.top + d.border.top + d.padding.top;
}

void layout_block(LayoutBox& box, Dimensions& containing_block) {
    box.dimensions = Dimensions{};
    calculate_block_width(box, containing_block);
    calculate_block_position(box, containing_block);
    layout_children(box);

    if (const auto height = explicit_px(*box.styled_node, "height")) {
        box.dimensions.content.height = *height;
    }
}

void layout_anonymous(LayoutBox& box, Dimensions& containing_block) {
    Dimensions& d = box.dimensions;
    d = Dimensions{};
    d.content.x = containing_block.content.x;
    d.content.y = containing_block.content.y + containing_block.content.height;
    d.content.width = containing_block.content.width;
    layout_children(box);
}

// Inline children sit side by side on one line at the content top. After
// wrapping, an inline box holds either only inline children or only
// block-level ones; the block-level ones stack below the (empty) line.
// Text carries no metrics here, so a text box is empty.
void layout_inline(LayoutBox& box, float x, float y, float available_width) {
    Dimensions& d = box.dimensions;
    d = Dimensions{};

    const StyledNode* style = box.styled_node;
    if (style != nullptr) {
        d.margin = resolve_edges(*style, "margin");
        d.border = resolve_edges(*style, "border", "-width");
        d.padding = resolve_edges(*style, "padding");
    }
    d.content.x = x + d.margin.left + d.border.left + d.padding.left;
    d.content.y = y + d.margin.top + d.border.top + d.padding.top;

    float line_width = 0.0f;
    float line_height = 0.0f;
    Dimensions block_area;
    block_area.content.x = d.content.x;
    block_area.content.width = std::max(
        0.0f, available_width - (d.margin.left + d.border.left + d.padding.left +
                                 d.padding.right + d.border.right + d.margin.right));

    for (LayoutBox& child : box.children) {
        if (child.box_type == BoxType::Inline) {
            layout_inline(child, d.content.x + line_width, d.content.y, available_width);
            const Rect margin_box = child.dimensions.margin_box();
            line_width += margin_box.width;
            line_height = std::max(line_height, margin_box.height);
        }
    }

    block_area.content.y = d.content.y + line_height;
    float block_width = 0.0f;
    for (LayoutBox& child : box.children) {
        if (child.box_type == BoxType::Inline) {
            continue;
        }
        if (child.box_type == BoxType::Block) {
            layout_block(child, block_area);
        } else {
            layout_anonymous(child, block_area);
        }
        const Rect margin_box = child.dimensions.margin_box();
        block_area.content.height += margin_box.height;
        block_width = std::max(block_width, margin_box.width);
    }

    d.content.width = std::max(line_width, block_width);
    d.content.height = line_height + block_area.content.height;
    if (style != nullptr) {
        if (const auto width = explicit_px(*style, "width")) {
            d.content.width = *width;
        }
        if (const auto height = explicit_px(*style, "height")) {
            d.content.height = *height;
        }
    }
}

std::string format_px(float value) {
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << value;
    return oss.str();
}

const LayoutBox* find_box_impl(const LayoutBox& box, const html::Node& node) {
    if (box.styled_node != nullptr && box.styled_node->node == &node) {
        return &box;
    }
    for (const auto& child : box.children) {
        if (const LayoutBox* match = find_box_impl(child, node)) {
            return match;
        }
    }
    return nullptr;
}

}  // namespace

LayoutBox build_layout_tree(const style::StyledNode& root) {
    if (root.display() == Display::None) {
        return LayoutBox(BoxType::Anonymous, nullptr);
    }
    return build_box(root, BoxType::Block);
}

LayoutBox layout(const style::StyledNode& root, Dimensions containing_block) {
    LayoutBox root_box = build_layout_tree(root);
    if (root_box.box_type == BoxType::Block) {
        layout_block(root_box, containing_block);
    } else {
        root_box.dimensions.content.x = containing_block.content.x;
        root_box.dimensions.content.y =
            containing_block.content.y + containing_block.content.height;
    }
    return root_box;
}

LayoutBox layout_viewport(const style::StyledNode& root, float viewport_width) {
    Dimensions viewport;
    viewport.content.width = std::max(0.0f, viewport_width);
    return layout(root, viewport);
}

std::string serialize_layout(const LayoutBox& box) {
    std::string out = "{";
    out += box_type_name(box.box_type);
    if (box.styled_node != nullptr && box.styled_node->node != nullptr) {
        const html::Node& node = *box.styled_node->node;
        out += node.is_text() ? " #text" : " <" + node.tag_name + ">";
    }
    const Rect& content = box.dimensions.content;
    out += " x:" + format_px(content.x);
    out += " y:" + format_px(content.y);
    out += " w:" + format_px(content.width);
    out += " h:" + format_px(content.height);
    for (const auto& child : box.children) {
        out += serialize_layout(child);
    }
    out += "}";
    return out;
}

const LayoutBox* find_box(const LayoutBox& root, const html::Node& node) {
    return find_box_impl(root, node);
}

}  // namespace wisp::layout
