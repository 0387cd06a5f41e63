#include "wisp/engine/render_pipeline.h"

#include "wisp/css/css_parser.h"
#include "wisp/html/html_parser.h"
#include "wisp/layout/layout_engine.h"
#include "wisp/style/style_resolver.h"
#include "wisp/style/user_agent.h"

#include <utility>

namespace wisp::engine {

RenderPipeline::RenderPipeline(std::string html,
                               std::vector<std::string> css_sources,
                               PipelineOptions options,
                               core::DiagnosticEmitter* diagnostics)
    : options_(options), diagnostics_(diagnostics) {
    trace_.record(core::LifecycleStage::Idle);

    trace_.record(core::LifecycleStage::ParsingHtml);
    html::ParseResult parsed = html::parse_html_with_diagnostics(html);
    document_ = std::move(parsed.root);
    if (diagnostics_ != nullptr) {
        for (const auto& warning : parsed.warnings) {
            diagnostics_->emit(core::Severity::Warning, "html", "parse",
                               warning.message + " (" + warning.recovery_action + ")");
        }
    }

    trace_.record(core::LifecycleStage::ParsingCss);
    if (options_.use_user_agent_stylesheet) {
        stylesheets_.push_back(style::user_agent_stylesheet());
    }
    for (const auto& source : css_sources) {
        add_stylesheet(source, "author");
    }
    if (options_.use_document_styles) {
        for (const html::Node* style_element : html::query_all_by_tag(*document_, "style")) {
            add_stylesheet(html::inner_text(*style_element), "document");
        }
    }

    trace_.record(core::LifecycleStage::Styling);
    styled_root_ = style::resolve(*document_, stylesheets_);

    run_layout();
    trace_.record(core::LifecycleStage::Complete);

    if (diagnostics_ != nullptr) {
        diagnostics_->emit(core::Severity::Info, "engine", "complete",
                           "Rendered " + std::to_string(stylesheets_.size()) + " stylesheet(s)");
    }
}

const html::Node& RenderPipeline::document() const {
    return *document_;
}

const std::vector<css::Stylesheet>& RenderPipeline::stylesheets() const {
    return stylesheets_;
}

const style::StyledNode& RenderPipeline::styled_root() const {
    return *styled_root_;
}

const layout::LayoutBox& RenderPipeline::layout() const {
    return layout_;
}

const core::LifecycleTrace& RenderPipeline::trace() const {
    return trace_;
}

const PipelineOptions& RenderPipeline::options() const {
    return options_;
}

void RenderPipeline::resize(float viewport_width, float viewport_height) {
    options_.viewport_width = viewport_width;
    options_.viewport_height = viewport_height;
    trace_.rewind_to(core::LifecycleStage::Layout);
    run_layout();
    trace_.record(core::LifecycleStage::Complete);
}

void RenderPipeline::add_stylesheet(const std::string& source, const std::string& origin) {
    css::ParseCssResult parsed = css::parse_css_with_diagnostics(source);
    if (diagnostics_ != nullptr) {
        for (const auto& warning : parsed.warnings) {
            diagnostics_->emit(core::Severity::Warning, "css", origin,
                               warning.message + ": " + warning.source_text);
        }
    }
    stylesheets_.push_back(std::move(parsed.stylesheet));
}

void RenderPipeline::run_layout() {
    trace_.record(core::LifecycleStage::Layout);
    layout_ = layout::layout_viewport(*styled_root_, options_.viewport_width);
}

}  // namespace wisp::engine
