#include <gtest/gtest.h>
#include "wisp/engine/render_pipeline.h"
#include "wisp/layout/layout_engine.h"

#include <string>
#include <vector>

using namespace wisp;
using namespace wisp::engine;

namespace {

const char* kPage =
    "<html><head><title>t</title><style>#box { height: 40px; }</style></head>"
    "<body><div id=\"box\"></div><p id=\"after\" style=\"height: 10px\"></p></body></html>";

}  // namespace

TEST(RenderPipelineTest, RunsAllStagesInOrder) {
    RenderPipeline pipeline(kPage, {});
    const std::vector<core::LifecycleStage> expected = {
        core::LifecycleStage::Idle,    core::LifecycleStage::ParsingHtml,
        core::LifecycleStage::ParsingCss, core::LifecycleStage::Styling,
        core::LifecycleStage::Layout,  core::LifecycleStage::Complete,
    };
    EXPECT_EQ(pipeline.trace().stages(), expected);
}

TEST(RenderPipelineTest, StyleElementsAreAppliedAfterCallerSheets) {
    RenderPipeline pipeline(kPage, {"#box { height: 99px; } div { width: 100px; }"});

    // user-agent, caller, <style>
    ASSERT_EQ(pipeline.stylesheets().size(), 3u);

    const html::Node* box = html::query_first_by_id(pipeline.document(), "box");
    ASSERT_NE(box, nullptr);
    const layout::LayoutBox* box_layout = layout::find_box(pipeline.layout(), *box);
    ASSERT_NE(box_layout, nullptr);
    EXPECT_FLOAT_EQ(box_layout->dimensions.content.height, 40);
    EXPECT_FLOAT_EQ(box_layout->dimensions.content.width, 100);
}

TEST(RenderPipelineTest, HeadIsNotRenderedAndBodyStacks) {
    RenderPipeline pipeline(kPage, {});
    const layout::LayoutBox& root = pipeline.layout();
    ASSERT_EQ(root.children.size(), 1u);

    const html::Node* after = html::query_first_by_id(pipeline.document(), "after");
    ASSERT_NE(after, nullptr);
    const layout::LayoutBox* after_layout = layout::find_box(root, *after);
    ASSERT_NE(after_layout, nullptr);
    EXPECT_FLOAT_EQ(after_layout->dimensions.content.y, 40);
    EXPECT_FLOAT_EQ(root.dimensions.content.height, 50);
    EXPECT_FLOAT_EQ(root.dimensions.content.width, 800);
}

TEST(RenderPipelineTest, OptionsDisableDefaultSheets) {
    PipelineOptions options;
    options.use_user_agent_stylesheet = false;
    options.use_document_styles = false;
    RenderPipeline pipeline(kPage, {"div { height: 1px; }"}, options);

    ASSERT_EQ(pipeline.stylesheets().size(), 1u);
    // Without user-agent defaults only the root is block-level.
    const layout::LayoutBox& root = pipeline.layout();
    for (const auto& child : root.children) {
        EXPECT_EQ(child.box_type, layout::BoxType::Inline);
    }
}

TEST(RenderPipelineTest, ResizeRelaysOutWithoutRestyling) {
    RenderPipeline pipeline(kPage, {});
    const style::StyledNode* styled_before = &pipeline.styled_root();

    pipeline.resize(300.0f, 200.0f);
    EXPECT_EQ(&pipeline.styled_root(), styled_before);
    EXPECT_FLOAT_EQ(pipeline.layout().dimensions.content.width, 300);
    EXPECT_FLOAT_EQ(pipeline.options().viewport_height, 200);
    EXPECT_EQ(pipeline.trace().stages().back(), core::LifecycleStage::Complete);
}

TEST(RenderPipelineTest, RepeatedResizeKeepsOneLayoutPassInTrace) {
    RenderPipeline pipeline(kPage, {});
    const std::vector<core::LifecycleStage> initial = pipeline.trace().stages();

    for (int i = 0; i < 5; ++i) {
        pipeline.resize(400.0f + static_cast<float>(i), 300.0f);
    }
    EXPECT_EQ(pipeline.trace().stages(), initial);
    EXPECT_FLOAT_EQ(pipeline.layout().dimensions.content.width, 404);
}

TEST(RenderPipelineTest, ForwardsParseWarningsToDiagnostics) {
    core::DiagnosticEmitter diagnostics;
    RenderPipeline pipeline("<div><span>x</div>", {"div p { color: red; }"}, {}, &diagnostics);

    EXPECT_FALSE(diagnostics.events_by_module("html").empty());
    EXPECT_FALSE(diagnostics.events_by_module("css").empty());
    for (const auto& event : diagnostics.events_by_module("css")) {
        EXPECT_EQ(event.severity, core::Severity::Warning);
    }
    EXPECT_EQ(diagnostics.events_by_module("engine").size(), 1u);
}

TEST(RenderPipelineTest, CleanInputEmitsNoWarnings) {
    core::DiagnosticEmitter diagnostics;
    RenderPipeline pipeline(kPage, {"p { color: red; }"}, {}, &diagnostics);
    EXPECT_EQ(diagnostics.count_at_least(core::Severity::Warning), 0u);
}
