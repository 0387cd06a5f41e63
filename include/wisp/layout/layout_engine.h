#pragma once

#include <string>

#include "wisp/html/dom.h"
#include "wisp/layout/box.h"
#include "wisp/style/styled_node.h"

namespace wisp::layout {

// Maps styled nodes to boxes by display: block and inline nodes get boxes of
// that type, display:none drops the subtree. In any box holding both
// block-level and inline children, each run of inline children moves into
// one anonymous block. The root is always a block box unless it is
// display:none, which yields an empty anonymous box.
LayoutBox build_layout_tree(const style::StyledNode& root);

// Builds and lays out the box tree against `containing_block`. Only the
// containing block's content x, y and width constrain layout; its height is
// the cursor the root stacks from (normally 0).
LayoutBox layout(const style::StyledNode& root, Dimensions containing_block);

// Containing block {0, 0, viewport_width, 0}.
LayoutBox layout_viewport(const style::StyledNode& root, float viewport_width);

// "{block <div> x:0 y:0 w:800 h:80{...}}" for deterministic comparison.
std::string serialize_layout(const LayoutBox& box);

// First box generated by `node`, or null if the node produced no box.
const LayoutBox* find_box(const LayoutBox& root, const html::Node& node);

}  // namespace wisp::layout
