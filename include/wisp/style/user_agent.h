#pragma once

#include "wisp/css/stylesheet.h"

namespace wisp::style {

// Default display values for HTML elements: structural and text-block
// elements are block, document metadata and script elements are none.
// Parsed once on first use.
const css::Stylesheet& user_agent_stylesheet();

}  // namespace wisp::style
