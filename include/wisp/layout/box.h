#pragma once

#include <vector>

#include "wisp/style/styled_node.h"

namespace wisp::layout {

struct EdgeSizes {
    float left = 0;
    float right = 0;
    float top = 0;
    float bottom = 0;
};

struct Rect {
    float x = 0;
    float y = 0;
    float width = 0;
    float height = 0;

    Rect expanded_by(const EdgeSizes& edge) const;
};

// Only the content rect and the three edge sizes are stored; the outer
// rectangles are recomputed on every call.
struct Dimensions {
    Rect content;
    EdgeSizes padding;
    EdgeSizes border;
    EdgeSizes margin;

    Rect padding_box() const;
    Rect border_box() const;
    Rect margin_box() const;
};

bool operator==(const EdgeSizes& lhs, const EdgeSizes& rhs);
bool operator==(const Rect& lhs, const Rect& rhs);
bool operator==(const Dimensions& lhs, const Dimensions& rhs);

enum class BoxType {
    Block,
    Inline,
    Anonymous,
};

const char* box_type_name(BoxType type);

// `styled_node` is borrowed from the styled tree and is null exactly for
// anonymous boxes.
struct LayoutBox {
    BoxType box_type = BoxType::Block;
    const style::StyledNode* styled_node = nullptr;
    Dimensions dimensions;
    std::vector<LayoutBox> children;

    LayoutBox() = default;
    LayoutBox(BoxType type, const style::StyledNode* node) : box_type(type), styled_node(node) {}
};

}  // namespace wisp::layout
