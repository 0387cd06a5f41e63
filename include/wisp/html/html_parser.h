#pragma once

#include <memory>
#include <string>
#include <vector>

#include "wisp/html/dom.h"

namespace wisp::html {

struct ParseWarning {
    std::string message;
    std::string recovery_action;
};

struct ParseResult {
    std::unique_ptr<Node> root;
    std::vector<ParseWarning> warnings;
};

// Parses a document into a tree with a single root element. Never fails:
// malformed markup is recovered locally (unclosed elements close at end of
// input, a mismatched end tag closes the innermost open element, stray end
// tags are skipped). Documents without a single root element are wrapped in
// an implicit <html>.
std::unique_ptr<Node> parse_html(const std::string& source);

// Same tree as parse_html, plus one warning per recovery taken.
ParseResult parse_html_with_diagnostics(const std::string& source);

}  // namespace wisp::html
