#include <gtest/gtest.h>
#include "wisp/css/css_parser.h"
#include "wisp/html/html_parser.h"
#include "wisp/layout/layout_engine.h"
#include "wisp/style/style_resolver.h"

#include <memory>
#include <string>
#include <vector>

using namespace wisp;
using namespace wisp::layout;

namespace {

class LayoutTest : public ::testing::Test {
protected:
    LayoutBox run(const std::string& html, const std::string& css, float width = 800.0f) {
        document_ = html::parse_html(html);
        sheets_ = {css::parse_css(css)};
        styled_ = style::resolve(*document_, sheets_);
        return layout_viewport(*styled_, width);
    }

    const html::Node& by_id(const std::string& id) const {
        const html::Node* node = html::query_first_by_id(*document_, id);
        EXPECT_NE(node, nullptr) << "no element with id " << id;
        return *node;
    }

    std::unique_ptr<html::Node> document_;
    std::vector<css::Stylesheet> sheets_;
    std::unique_ptr<style::StyledNode> styled_;
};

bool same_geometry(const LayoutBox& lhs, const LayoutBox& rhs) {
    if (lhs.box_type != rhs.box_type || lhs.styled_node != rhs.styled_node ||
        !(lhs.dimensions == rhs.dimensions) || lhs.children.size() != rhs.children.size()) {
        return false;
    }
    for (std::size_t i = 0; i < lhs.children.size(); ++i) {
        if (!same_geometry(lhs.children[i], rhs.children[i])) {
            return false;
        }
    }
    return true;
}

constexpr const char* kBlocks = "div, p { display: block; }";

}  // namespace

// =============================================================================
// Geometry helpers
// =============================================================================

TEST(BoxGeometryTest, OuterBoxesExpandContent) {
    Dimensions d;
    d.content = {10, 20, 100, 50};
    d.padding = {1, 2, 3, 4};
    d.border = {5, 5, 5, 5};
    d.margin = {10, 10, 0, 0};

    const Rect padding = d.padding_box();
    EXPECT_FLOAT_EQ(padding.x, 9);
    EXPECT_FLOAT_EQ(padding.y, 17);
    EXPECT_FLOAT_EQ(padding.width, 103);
    EXPECT_FLOAT_EQ(padding.height, 57);

    const Rect margin = d.margin_box();
    EXPECT_FLOAT_EQ(margin.x, -6);
    EXPECT_FLOAT_EQ(margin.width, 133);
    EXPECT_FLOAT_EQ(margin.height, 67);
}

// =============================================================================
// Box tree construction
// =============================================================================

TEST_F(LayoutTest, DisplayNoneProducesNoBoxAndDoesNotShiftSiblings) {
    LayoutBox root = run(
        "<div><p id=\"a\" style=\"height: 10px\"></p>"
        "<p id=\"hidden\" style=\"height: 100px\"><p id=\"inner\"></p></p>"
        "<p id=\"b\" style=\"height: 20px\"></p></div>",
        std::string(kBlocks) + " #hidden { display: none; }");

    EXPECT_EQ(find_box(root, by_id("hidden")), nullptr);
    EXPECT_EQ(find_box(root, by_id("inner")), nullptr);
    ASSERT_EQ(root.children.size(), 2u);

    const LayoutBox* b = find_box(root, by_id("b"));
    ASSERT_NE(b, nullptr);
    EXPECT_FLOAT_EQ(b->dimensions.content.y, 10);
    EXPECT_FLOAT_EQ(root.dimensions.content.height, 30);
}

TEST_F(LayoutTest, RootDisplayNoneYieldsEmptyAnonymousBox) {
    LayoutBox root = run("<div><p></p></div>", "div { display: none; }");
    EXPECT_EQ(root.box_type, BoxType::Anonymous);
    EXPECT_EQ(root.styled_node, nullptr);
    EXPECT_TRUE(root.children.empty());
    EXPECT_FLOAT_EQ(root.dimensions.content.width, 0);
    EXPECT_FLOAT_EQ(root.dimensions.content.height, 0);
}

TEST_F(LayoutTest, MixedChildrenWrapInlineRunsInAnonymousBoxes) {
    LayoutBox root = run("<div><span>a</span><b>b</b><p></p><i>c</i></div>", kBlocks);
    ASSERT_EQ(root.children.size(), 3u);
    EXPECT_EQ(root.children[0].box_type, BoxType::Anonymous);
    EXPECT_EQ(root.children[0].children.size(), 2u);
    EXPECT_EQ(root.children[1].box_type, BoxType::Block);
    EXPECT_EQ(root.children[2].box_type, BoxType::Anonymous);
    EXPECT_EQ(root.children[2].children.size(), 1u);
}

TEST_F(LayoutTest, InlineBoxWithBlockChildWrapsItsInlineRun) {
    LayoutBox root = run(
        "<div><span id=\"s\">t<p id=\"p\" style=\"height: 10px\"></p></span></div>", kBlocks);

    const LayoutBox* span = find_box(root, by_id("s"));
    ASSERT_NE(span, nullptr);
    EXPECT_EQ(span->box_type, BoxType::Inline);
    ASSERT_EQ(span->children.size(), 2u);
    EXPECT_EQ(span->children[0].box_type, BoxType::Anonymous);
    ASSERT_EQ(span->children[0].children.size(), 1u);
    EXPECT_EQ(span->children[0].children[0].box_type, BoxType::Inline);
    EXPECT_EQ(span->children[1].box_type, BoxType::Block);

    const LayoutBox* p = find_box(root, by_id("p"));
    ASSERT_NE(p, nullptr);
    EXPECT_FLOAT_EQ(p->dimensions.content.y, 0);
    EXPECT_FLOAT_EQ(span->dimensions.content.height, 10);
    EXPECT_FLOAT_EQ(root.dimensions.content.height, 10);
}

TEST_F(LayoutTest, AllInlineChildrenStayDirect) {
    LayoutBox root = run("<div><span>a</span><b>b</b></div>", kBlocks);
    ASSERT_EQ(root.children.size(), 2u);
    EXPECT_EQ(root.children[0].box_type, BoxType::Inline);
    EXPECT_EQ(root.children[1].box_type, BoxType::Inline);
}

// =============================================================================
// Block layout
// =============================================================================

TEST_F(LayoutTest, BlocksStackVertically) {
    LayoutBox root = run(
        "<div><p id=\"a\" style=\"height: 50px\"></p><p id=\"b\" style=\"height: 30px\"></p></div>",
        kBlocks);

    const LayoutBox* a = find_box(root, by_id("a"));
    const LayoutBox* b = find_box(root, by_id("b"));
    ASSERT_NE(a, nullptr);
    ASSERT_NE(b, nullptr);
    EXPECT_FLOAT_EQ(a->dimensions.content.y, 0);
    EXPECT_FLOAT_EQ(b->dimensions.content.y, 50);
    EXPECT_FLOAT_EQ(root.dimensions.content.height, 80);
    EXPECT_EQ(serialize_layout(root),
              "{block <div> x:0 y:0 w:800 h:80"
              "{block <p> x:0 y:0 w:800 h:50}{block <p> x:0 y:50 w:800 h:30}}");
}

TEST_F(LayoutTest, AutoWidthFillsContainingBlock) {
    LayoutBox root = run("<div></div>", kBlocks);
    EXPECT_FLOAT_EQ(root.dimensions.content.x, 0);
    EXPECT_FLOAT_EQ(root.dimensions.content.width, 800);
    EXPECT_FLOAT_EQ(root.dimensions.content.height, 0);
}

TEST_F(LayoutTest, EdgesReduceAutoWidthAndOffsetContent) {
    LayoutBox root = run("<div><p id=\"p\"></p></div>",
                         std::string(kBlocks) +
                             " p { margin: 10px; padding-left: 5px; border-width: 2px; }");
    const LayoutBox* p = find_box(root, by_id("p"));
    ASSERT_NE(p, nullptr);
    EXPECT_FLOAT_EQ(p->dimensions.content.x, 17);
    EXPECT_FLOAT_EQ(p->dimensions.content.y, 12);
    EXPECT_FLOAT_EQ(p->dimensions.content.width, 800 - 20 - 4 - 5);
    EXPECT_FLOAT_EQ(p->dimensions.margin_box().height, 24);
    EXPECT_FLOAT_EQ(root.dimensions.content.height, 24);
}

TEST_F(LayoutTest, AutoMarginsCenterFixedWidth) {
    LayoutBox root = run("<div><p id=\"p\"></p></div>",
                         std::string(kBlocks) +
                             " p { width: 200px; margin-left: auto; margin-right: auto; }");
    const LayoutBox* p = find_box(root, by_id("p"));
    ASSERT_NE(p, nullptr);
    EXPECT_FLOAT_EQ(p->dimensions.margin.left, 300);
    EXPECT_FLOAT_EQ(p->dimensions.margin.right, 300);
    EXPECT_FLOAT_EQ(p->dimensions.content.x, 300);
    EXPECT_FLOAT_EQ(p->dimensions.content.width, 200);
}

TEST_F(LayoutTest, SingleAutoMarginTakesRemainder) {
    LayoutBox root = run("<div><p id=\"p\"></p></div>",
                         std::string(kBlocks) + " p { width: 200px; margin-left: auto; }");
    const LayoutBox* p = find_box(root, by_id("p"));
    ASSERT_NE(p, nullptr);
    EXPECT_FLOAT_EQ(p->dimensions.margin.left, 600);
    EXPECT_FLOAT_EQ(p->dimensions.margin.right, 0);
}

TEST_F(LayoutTest, OverConstrainedWidthAdjustsMarginRight) {
    LayoutBox root = run("<div><p id=\"p\"></p></div>",
                         std::string(kBlocks) + " p { width: 900px; margin-left: auto; }");
    const LayoutBox* p = find_box(root, by_id("p"));
    ASSERT_NE(p, nullptr);
    EXPECT_FLOAT_EQ(p->dimensions.margin.left, 0);
    EXPECT_FLOAT_EQ(p->dimensions.margin.right, -100);
    EXPECT_FLOAT_EQ(p->dimensions.content.width, 900);
}

TEST_F(LayoutTest, ExplicitHeightOverridesChildren) {
    LayoutBox root = run("<div style=\"height: 10px\"><p style=\"height: 50px\"></p></div>", kBlocks);
    EXPECT_FLOAT_EQ(root.dimensions.content.height, 10);
}

TEST_F(LayoutTest, NarrowViewport) {
    LayoutBox root = run("<div><p></p></div>", kBlocks, 320.0f);
    EXPECT_FLOAT_EQ(root.dimensions.content.width, 320);
    EXPECT_FLOAT_EQ(root.children[0].dimensions.content.width, 320);
}

TEST_F(LayoutTest, LayoutIsIdempotent) {
    const std::string html =
        "<div><p style=\"height: 50px; margin: 4px\"></p><span>x</span>"
        "<p style=\"width: 100px; margin-left: auto\"></p></div>";
    document_ = html::parse_html(html);
    sheets_ = {css::parse_css(kBlocks)};
    styled_ = style::resolve(*document_, sheets_);

    const LayoutBox first = layout_viewport(*styled_, 800.0f);
    const LayoutBox second = layout_viewport(*styled_, 800.0f);
    EXPECT_TRUE(same_geometry(first, second));
    EXPECT_EQ(serialize_layout(first), serialize_layout(second));
}

TEST_F(LayoutTest, ContainingBlockOffsetsRoot) {
    document_ = html::parse_html("<div style=\"height: 5px\"></div>");
    sheets_.clear();
    styled_ = style::resolve(*document_, sheets_);

    Dimensions containing_block;
    containing_block.content = {20, 30, 400, 10};
    LayoutBox root = wisp::layout::layout(*styled_, containing_block);
    EXPECT_FLOAT_EQ(root.dimensions.content.x, 20);
    EXPECT_FLOAT_EQ(root.dimensions.content.y, 40);
    EXPECT_FLOAT_EQ(root.dimensions.content.width, 400);
}

// =============================================================================
// Anonymous and inline layout
// =============================================================================

TEST_F(LayoutTest, InlineBoxesShareOneLine) {
    LayoutBox root = run(
        "<div><span id=\"a\" style=\"width: 40px; height: 10px\"></span>"
        "<span id=\"b\" style=\"width: 60px; height: 20px; margin-left: 5px\"></span></div>",
        kBlocks);

    const LayoutBox* a = find_box(root, by_id("a"));
    const LayoutBox* b = find_box(root, by_id("b"));
    ASSERT_NE(a, nullptr);
    ASSERT_NE(b, nullptr);
    EXPECT_FLOAT_EQ(a->dimensions.content.x, 0);
    EXPECT_FLOAT_EQ(b->dimensions.content.x, 45);
    EXPECT_FLOAT_EQ(b->dimensions.content.y, 0);
    EXPECT_FLOAT_EQ(root.dimensions.content.height, 20);
}

TEST_F(LayoutTest, AnonymousBoxSpansContainerAndStacks) {
    LayoutBox root = run(
        "<div><p style=\"height: 30px\"></p>"
        "<span style=\"width: 10px; height: 12px\"></span>"
        "<p id=\"last\" style=\"height: 5px\"></p></div>",
        kBlocks);

    ASSERT_EQ(root.children.size(), 3u);
    const LayoutBox& anonymous = root.children[1];
    EXPECT_EQ(anonymous.box_type, BoxType::Anonymous);
    EXPECT_FLOAT_EQ(anonymous.dimensions.content.y, 30);
    EXPECT_FLOAT_EQ(anonymous.dimensions.content.width, 800);
    EXPECT_FLOAT_EQ(anonymous.dimensions.content.height, 12);

    const LayoutBox* last = find_box(root, by_id("last"));
    ASSERT_NE(last, nullptr);
    EXPECT_FLOAT_EQ(last->dimensions.content.y, 42);
    EXPECT_FLOAT_EQ(root.dimensions.content.height, 47);
}

TEST_F(LayoutTest, TextBoxesHaveNoSize) {
    LayoutBox root = run("<div>hello</div>", kBlocks);
    ASSERT_EQ(root.children.size(), 1u);
    EXPECT_EQ(root.children[0].box_type, BoxType::Inline);
    EXPECT_FLOAT_EQ(root.children[0].dimensions.content.width, 0);
    EXPECT_FLOAT_EQ(root.dimensions.content.height, 0);
    EXPECT_EQ(serialize_layout(root),
              "{block <div> x:0 y:0 w:800 h:0{inline #text x:0 y:0 w:0 h:0}}");
}

TEST_F(LayoutTest, InlineWidthSumsChildren) {
    LayoutBox root = run(
        "<div><span id=\"outer\"><b style=\"width: 30px; height: 8px\"></b>"
        "<i style=\"width: 20px; height: 4px\"></i></span></div>",
        kBlocks);
    const LayoutBox* outer = find_box(root, by_id("outer"));
    ASSERT_NE(outer, nullptr);
    EXPECT_FLOAT_EQ(outer->dimensions.content.width, 50);
    EXPECT_FLOAT_EQ(outer->dimensions.content.height, 8);
}
