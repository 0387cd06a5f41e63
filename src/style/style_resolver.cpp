#include "wisp/style/style_resolver.h"

#include "wisp/css/css_parser.h"
#include "wisp/style/selector_matcher.h"

#include <algorithm>
#include <tuple>

namespace wisp::style {
namespace {

std::unique_ptr<StyledNode> build_styled_node(const html::Node& node,
                                              const StyledNode* parent,
                                              const std::vector<css::Stylesheet>& stylesheets) {
    auto styled = std::make_unique<StyledNode>(node);
    styled->parent = parent;
    styled->specified_values = compute_specified_values(node, stylesheets);

    styled->children.reserve(node.children.size());
    for (const auto& child : node.children) {
        styled->children.push_back(build_styled_node(*child, styled.get(), stylesheets));
    }
    return styled;
}

}  // namespace

std::vector<MatchedRule> collect_matching_rules(const html::Node& element,
                                                const std::vector<css::Stylesheet>& stylesheets) {
    std::vector<MatchedRule> matched;
    if (!element.is_element()) {
        return matched;
    }

    for (std::size_t sheet_index = 0; sheet_index < stylesheets.size(); ++sheet_index) {
        const auto& rules = stylesheets[sheet_index].rules;
        for (std::size_t rule_index = 0; rule_index < rules.size(); ++rule_index) {
            const css::Rule& rule = rules[rule_index];
            // Hand-built rules may hold their selectors in any order.
            bool found = false;
            css::Specificity best;
            for (const auto& selector : rule.selectors) {
                if (!matches(selector, element)) {
                    continue;
                }
                const css::Specificity current = css::specificity(selector);
                if (!found || best < current) {
                    best = current;
                    found = true;
                }
            }
            if (found) {
                matched.push_back({&rule, best, sheet_index, rule_index});
            }
        }
    }

    std::stable_sort(matched.begin(), matched.end(),
                     [](const MatchedRule& lhs, const MatchedRule& rhs) {
                         if (lhs.specificity != rhs.specificity) {
                             return lhs.specificity < rhs.specificity;
                         }
                         return std::tie(lhs.stylesheet_index, lhs.rule_index) <
                                std::tie(rhs.stylesheet_index, rhs.rule_index);
                     });
    return matched;
}

PropertyMap compute_specified_values(const html::Node& node,
                                     const std::vector<css::Stylesheet>& stylesheets) {
    PropertyMap values;
    if (!node.is_element()) {
        return values;
    }

    for (const MatchedRule& match : collect_matching_rules(node, stylesheets)) {
        for (const auto& declaration : match.rule->declarations) {
            values.insert_or_assign(declaration.property, declaration.value);
        }
    }

    if (const auto inline_style = node.attribute("style")) {
        for (const auto& declaration : css::parse_declaration_list(*inline_style)) {
            values.insert_or_assign(declaration.property, declaration.value);
        }
    }
    return values;
}

std::unique_ptr<StyledNode> resolve(const html::Node& root,
                                    const std::vector<css::Stylesheet>& stylesheets) {
    return build_styled_node(root, nullptr, stylesheets);
}

}  // namespace wisp::style
