#pragma once

#include <optional>
#include <string>
#include <vector>

#include "wisp/css/stylesheet.h"

namespace wisp::css {

struct StyleWarning {
    std::string message;
    std::string source_text;
};

struct ParseCssResult {
    Stylesheet stylesheet;
    std::vector<StyleWarning> warnings;
};

// Never fails. Unsupported selectors are dropped from their selector list,
// unrecognized declarations are skipped up to the next ';' or '}', and
// at-rules are skipped whole.
Stylesheet parse_css(const std::string& source);
ParseCssResult parse_css_with_diagnostics(const std::string& source);

// Body of a style="..." attribute.
std::vector<Declaration> parse_declaration_list(const std::string& source);

// A single value; nothing if the text is not exactly one recognized value.
std::optional<Value> parse_value(const std::string& text);

}  // namespace wisp::css
