#include "wisp/layout/box.h"

namespace wisp::layout {

Rect Rect::expanded_by(const EdgeSizes& edge) const {
    Rect out;
    out.x = x - edge.left;
    out.y = y - edge.top;
    out.width = width + edge.left + edge.right;
    out.height = height + edge.top + edge.bottom;
    return out;
}

Rect Dimensions::padding_box() const {
    return content.expanded_by(padding);
}

Rect Dimensions::border_box() const {
    return padding_box().expanded_by(border);
}

Rect Dimensions::margin_box() const {
    return border_box().expanded_by(margin);
}

bool operator==(const EdgeSizes& lhs, const EdgeSizes& rhs) {
    return lhs.left == rhs.left && lhs.right == rhs.right &&
           lhs.top == rhs.top && lhs.bottom == rhs.bottom;
}

bool operator==(const Rect& lhs, const Rect& rhs) {
    return lhs.x == rhs.x && lhs.y == rhs.y &&
           lhs.width == rhs.width && lhs.height == rhs.height;
}

bool operator==(const Dimensions& lhs, const Dimensions& rhs) {
    return lhs.content == rhs.content && lhs.padding == rhs.padding &&
           lhs.border == rhs.border && lhs.margin == rhs.margin;
}

const char* box_type_name(BoxType type) {
    switch (type) {
        case BoxType::Block:     return "block";
        case BoxType::Inline:    return "inline";
        case BoxType::Anonymous: return "anonymous";
    }
    return "unknown";
}

}  // namespace wisp::layout
