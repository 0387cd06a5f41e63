#pragma once

#include <cstddef>
#include <memory>
#include <vector>

#include "wisp/css/stylesheet.h"
#include "wisp/html/dom.h"
#include "wisp/style/styled_node.h"

namespace wisp::style {

struct MatchedRule {
    const css::Rule* rule = nullptr;
    css::Specificity specificity;
    std::size_t stylesheet_index = 0;
    std::size_t rule_index = 0;
};

// Every rule with a selector matching `element`, ordered by (specificity,
// stylesheet index, rule index) ascending. A rule's specificity is that of
// its most specific matching selector.
std::vector<MatchedRule> collect_matching_rules(const html::Node& element,
                                                const std::vector<css::Stylesheet>& stylesheets);

// Declarations of the matched rules applied in order, last write wins; the
// element's style attribute applies after all rules. Empty for text nodes.
PropertyMap compute_specified_values(const html::Node& node,
                                     const std::vector<css::Stylesheet>& stylesheets);

// Builds a styled tree isomorphic to the DOM (text nodes included). The
// result borrows `root`. Inherited properties are not copied down; see
// StyledNode::lookup.
std::unique_ptr<StyledNode> resolve(const html::Node& root,
                                    const std::vector<css::Stylesheet>& stylesheets);

}  // namespace wisp::style
