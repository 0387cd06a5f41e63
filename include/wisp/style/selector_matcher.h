#pragma once

#include "wisp/css/stylesheet.h"
#include "wisp/html/dom.h"

namespace wisp::style {

// Tag (if set) equals the element tag, id (if set) equals the id attribute,
// and every class is in the element's class set. Text nodes and selectors
// with no part set never match.
bool matches(const css::Selector& selector, const html::Node& node);

bool matches(const css::SimpleSelector& selector, const html::Node& node);

}  // namespace wisp::style
