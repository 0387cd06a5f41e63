#pragma once

#include "wisp/core/config.h"
#include "wisp/core/diagnostics.h"
#include "wisp/core/lifecycle.h"
#include "wisp/css/stylesheet.h"
#include "wisp/html/dom.h"
#include "wisp/layout/box.h"
#include "wisp/style/styled_node.h"

#include <memory>
#include <string>
#include <vector>

namespace wisp::engine {

struct PipelineOptions {
    float viewport_width = static_cast<float>(core::config::kDefaultViewportWidth);
    float viewport_height = static_cast<float>(core::config::kDefaultViewportHeight);
    bool use_user_agent_stylesheet = true;
    bool use_document_styles = true;
};

// Runs parse, style and layout for one document. Members are declared in
// borrow order: the styled tree points into the DOM, the layout tree into
// the styled tree.
class RenderPipeline {
public:
    RenderPipeline(std::string html,
                   std::vector<std::string> css_sources,
                   PipelineOptions options = {},
                   core::DiagnosticEmitter* diagnostics = nullptr);

    RenderPipeline(const RenderPipeline&) = delete;
    RenderPipeline& operator=(const RenderPipeline&) = delete;

    const html::Node& document() const;
    // User-agent sheet first (when enabled), then caller sources, then
    // <style> elements in document order.
    const std::vector<css::Stylesheet>& stylesheets() const;
    const style::StyledNode& styled_root() const;
    const layout::LayoutBox& layout() const;
    const core::LifecycleTrace& trace() const;
    const PipelineOptions& options() const;

    // Lays out the existing styled tree again at the new viewport size.
    void resize(float viewport_width, float viewport_height);

private:
    void add_stylesheet(const std::string& source, const std::string& origin);
    void run_layout();

    PipelineOptions options_;
    core::DiagnosticEmitter* diagnostics_ = nullptr;
    core::LifecycleTrace trace_;
    std::unique_ptr<html::Node> document_;
    std::vector<css::Stylesheet> stylesheets_;
    std::unique_ptr<style::StyledNode> styled_root_;
    layout::LayoutBox layout_;
};

}  // namespace wisp::engine
