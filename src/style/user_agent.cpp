#include "wisp/style/user_agent.h"

#include "wisp/css/css_parser.h"

namespace wisp::style {
namespace {

constexpr char kUserAgentCss[] = R"css(
html, body, div, p, main, section, article, header, footer, nav, aside,
h1, h2, h3, h4, h5, h6, ul, ol, li, dl, dt, dd, blockquote, pre, hr,
form, fieldset, figure, figcaption, address, table {
    display: block;
}

head, script, style, meta, title, link, template, noscript {
    display: none;
}
)css";

}  // namespace

const css::Stylesheet& user_agent_stylesheet() {
    static const css::Stylesheet sheet = css::parse_css(kUserAgentCss);
    return sheet;
}

}  // namespace wisp::style
