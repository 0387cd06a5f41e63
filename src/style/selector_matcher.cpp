#include "wisp/style/selector_matcher.h"

namespace wisp::style {

bool matches(const css::Selector& selector, const html::Node& node) {
    return std::visit(
        [&node](const css::SimpleSelector& simple) { return matches(simple, node); },
        selector);
}

bool matches(const css::SimpleSelector& selector, const html::Node& node) {
    if (!node.is_element()) {
        return false;
    }
    if (!selector.tag_name && !selector.id && selector.classes.empty()) {
        return false;
    }

    if (selector.tag_name && *selector.tag_name != node.tag_name) {
        return false;
    }
    if (selector.id && node.id() != selector.id) {
        return false;
    }
    if (!selector.classes.empty()) {
        const std::set<std::string> element_classes = node.classes();
        for (const auto& class_name : selector.classes) {
            if (element_classes.count(class_name) == 0) {
                return false;
            }
        }
    }
    return true;
}

}  // namespace wisp::style
