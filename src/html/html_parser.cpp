#include "wisp/html/html_parser.h"

#include "wisp/core/config.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <string_view>
#include <utility>

namespace wisp::html {
namespace {

constexpr std::array<std::string_view, 14> kVoidElements = {
    "area", "base", "br",    "col",    "embed", "hr",    "img",
    "input", "link", "meta", "param", "source", "track", "wbr",
};

struct NamedEntity {
    std::string_view name;
    std::uint32_t code_point;
};

constexpr std::array<NamedEntity, 8> kNamedEntities = {{
    {"amp", '&'},
    {"lt", '<'},
    {"gt", '>'},
    {"quot", '"'},
    {"apos", '\''},
    {"nbsp", 0xA0u},
    {"copy", 0xA9u},
    {"mdash", 0x2014u},
}};

unsigned char uchar(char c) {
    return static_cast<unsigned char>(c);
}

bool is_space(char c) {
    return std::isspace(uchar(c)) != 0;
}

bool is_name_start(char c) {
    return std::isalpha(uchar(c)) != 0;
}

std::string to_lower_ascii(std::string text) {
    for (char& c : text) {
        c = static_cast<char>(std::tolower(uchar(c)));
    }
    return text;
}

bool is_void_element(std::string_view tag_name) {
    for (std::string_view void_tag : kVoidElements) {
        if (void_tag == tag_name) {
            return true;
        }
    }
    return false;
}

bool append_utf8(std::uint32_t code_point, std::string& out) {
    if (code_point == 0 || code_point > 0x10FFFFu ||
        (code_point >= 0xD800u && code_point <= 0xDFFFu)) {
        return false;
    }

    if (code_point <= 0x7Fu) {
        out.push_back(static_cast<char>(code_point));
    } else if (code_point <= 0x7FFu) {
        out.push_back(static_cast<char>(0xC0u | (code_point >> 6)));
        out.push_back(static_cast<char>(0x80u | (code_point & 0x3Fu)));
    } else if (code_point <= 0xFFFFu) {
        out.push_back(static_cast<char>(0xE0u | (code_point >> 12)));
        out.push_back(static_cast<char>(0x80u | ((code_point >> 6) & 0x3Fu)));
        out.push_back(static_cast<char>(0x80u | (code_point & 0x3Fu)));
    } else {
        out.push_back(static_cast<char>(0xF0u | (code_point >> 18)));
        out.push_back(static_cast<char>(0x80u | ((code_point >> 12) & 0x3Fu)));
        out.push_back(static_cast<char>(0x80u | ((code_point >> 6) & 0x3Fu)));
        out.push_back(static_cast<char>(0x80u | (code_point & 0x3Fu)));
    }
    return true;
}

// `body` is the text between '&' and ';'.
bool decode_entity(std::string_view body, std::string& out) {
    if (body.size() >= 2 && body[0] == '#') {
        std::uint32_t base = 10;
        std::size_t pos = 1;
        if (body[1] == 'x' || body[1] == 'X') {
            base = 16;
            pos = 2;
        }
        if (pos >= body.size()) {
            return false;
        }

        std::uint32_t value = 0;
        for (; pos < body.size(); ++pos) {
            const char c = body[pos];
            std::uint32_t digit = 0;
            if (c >= '0' && c <= '9') {
                digit = static_cast<std::uint32_t>(c - '0');
            } else if (base == 16 && std::isxdigit(uchar(c)) != 0) {
                digit = static_cast<std::uint32_t>(10 + std::tolower(uchar(c)) - 'a');
            } else {
                return false;
            }
            value = value * base + digit;
            if (value > 0x10FFFFu) {
                return false;
            }
        }
        return append_utf8(value, out);
    }

    for (const NamedEntity& entity : kNamedEntities) {
        if (entity.name == body) {
            return append_utf8(entity.code_point, out);
        }
    }
    return false;
}

// Unknown or malformed references are kept verbatim.
std::string decode_html_entities(std::string_view text) {
    if (text.find('&') == std::string_view::npos) {
        return std::string(text);
    }

    std::string decoded;
    decoded.reserve(text.size());

    std::size_t pos = 0;
    while (pos < text.size()) {
        if (text[pos] != '&') {
            decoded.push_back(text[pos++]);
            continue;
        }

        const std::size_t semicolon = text.find(';', pos + 1);
        if (semicolon == std::string_view::npos ||
            !decode_entity(text.substr(pos + 1, semicolon - pos - 1), decoded)) {
            decoded.push_back(text[pos++]);
            continue;
        }
        pos = semicolon + 1;
    }
    return decoded;
}

// Position into the immutable source. Copyable, so a parse step can look
// ahead on a copy without committing.
struct Cursor {
    std::string_view source;
    std::size_t position = 0;

    bool eof() const { return position >= source.size(); }

    char peek(std::size_t offset = 0) const {
        const std::size_t at = position + offset;
        return at < source.size() ? source[at] : '\0';
    }

    bool starts_with(std::string_view token) const {
        return source.substr(position, token.size()) == token;
    }

    void advance(std::size_t count = 1) {
        position = std::min(source.size(), position + count);
    }

    template <typename Predicate>
    std::string_view consume_while(const Predicate& predicate) {
        const std::size_t start = position;
        while (!eof() && predicate(source[position])) {
            ++position;
        }
        return source.substr(start, position - start);
    }

    void consume_whitespace() {
        consume_while(is_space);
    }
};

class Parser {
public:
    Parser(std::string_view source, std::vector<ParseWarning>* warnings)
        : cursor_{source, 0}, warnings_(warnings) {}

    std::unique_ptr<Node> parse() {
        std::vector<std::unique_ptr<Node>> top_level;
        while (true) {
            for (auto& node : parse_nodes()) {
                top_level.push_back(std::move(node));
            }
            if (cursor_.eof()) {
                break;
            }
            // parse_nodes only stops early at an end tag; nothing is open here.
            const std::string tag = consume_end_tag();
            warn("Orphan end tag </" + tag + "> with no matching open tag",
                 "Ignored orphan end tag");
        }

        if (top_level.size() == 1 && top_level.front()->is_element()) {
            return std::move(top_level.front());
        }

        if (!top_level.empty()) {
            warn("Document has no single root element",
                 std::string("Wrapped top-level nodes in implicit <") +
                     core::config::kImplicitRootTag + ">");
        }
        auto root = make_element(core::config::kImplicitRootTag);
        for (auto& node : top_level) {
            root->append_child(std::move(node));
        }
        return root;
    }

private:
    Cursor cursor_;
    std::vector<ParseWarning>* warnings_ = nullptr;

    void warn(std::string message, std::string recovery) {
        if (warnings_ == nullptr) {
            return;
        }
        warnings_->push_back({std::move(message), std::move(recovery)});
    }

    std::string consume_name() {
        return to_lower_ascii(std::string(cursor_.consume_while([](char c) {
            return !is_space(c) && c != '/' && c != '>' && c != '<';
        })));
    }

    std::string consume_attribute_name() {
        return to_lower_ascii(std::string(cursor_.consume_while([](char c) {
            return !is_space(c) && c != '/' && c != '>' && c != '=' && c != '<';
        })));
    }

    // Name of the end tag at the cursor, without consuming it.
    std::string peek_end_tag_name() const {
        Parser lookahead = *this;
        lookahead.warnings_ = nullptr;
        lookahead.cursor_.advance(2);
        lookahead.cursor_.consume_whitespace();
        return lookahead.consume_name();
    }

    // Consumes "</name ...>" and returns the lowercased name.
    std::string consume_end_tag() {
        cursor_.advance(2);
        cursor_.consume_whitespace();
        std::string tag = consume_name();
        cursor_.consume_while([](char c) { return c != '>'; });
        if (cursor_.eof()) {
            warn("Unterminated end tag </" + tag + ">", "Consumed remaining input");
        }
        cursor_.advance();
        return tag;
    }

    // Children up to the next end tag or end of input.
    std::vector<std::unique_ptr<Node>> parse_nodes() {
        std::vector<std::unique_ptr<Node>> nodes;
        while (true) {
            cursor_.consume_whitespace();
            if (cursor_.eof()) {
                break;
            }
            if (cursor_.starts_with("</")) {
                const std::string tag = peek_end_tag_name();
                if (!is_void_element(tag)) {
                    break;
                }
                consume_end_tag();
                warn("End tag </" + tag + "> for void element", "Ignored end tag");
                continue;
            }

            std::unique_ptr<Node> node = parse_node();
            if (!node) {
                continue;
            }
            if (node->is_text() && !nodes.empty() && nodes.back()->is_text()) {
                nodes.back()->text_content += node->text_content;
                continue;
            }
            nodes.push_back(std::move(node));
        }
        return nodes;
    }

    // Returns null for markup that produces no node (comments, DOCTYPE).
    std::unique_ptr<Node> parse_node() {
        if (cursor_.starts_with("<!--")) {
            skip_comment();
            return nullptr;
        }
        if (cursor_.starts_with("<!") || cursor_.starts_with("<?")) {
            skip_declaration();
            return nullptr;
        }
        if (cursor_.peek() == '<' && is_name_start(cursor_.peek(1))) {
            return parse_element();
        }
        return parse_text();
    }

    std::unique_ptr<Node> parse_text() {
        std::string raw;
        if (cursor_.peek() == '<') {
            warn("Bare '<' treated as text", "Inserted literal '<' into text content");
            raw.push_back('<');
            cursor_.advance();
        }
        raw += cursor_.consume_while([](char c) { return c != '<'; });
        return make_text(decode_html_entities(raw));
    }

    std::unique_ptr<Node> parse_element() {
        cursor_.advance();
        const std::string tag = consume_name();
        auto element = make_element(tag);

        const bool self_closing = parse_attributes(*element);
        if (self_closing || is_void_element(tag)) {
            return element;
        }

        for (auto& child : parse_nodes()) {
            element->append_child(std::move(child));
        }

        if (cursor_.eof()) {
            warn("Unclosed element <" + tag + ">", "Implicitly closed at end of document");
            return element;
        }

        // Lenient: whatever end tag comes next closes this element.
        const std::string end_tag = consume_end_tag();
        if (end_tag != tag) {
            warn("Mismatched end tag </" + end_tag + "> for <" + tag + ">",
                 "Closed <" + tag + "> at the mismatched end tag");
        }
        return element;
    }

    // Returns true for "/>".
    bool parse_attributes(Node& element) {
        while (true) {
            cursor_.consume_whitespace();
            if (cursor_.eof()) {
                warn("Unterminated start tag <" + element.tag_name + ">",
                     "Closed start tag at end of document");
                return false;
            }
            if (cursor_.peek() == '>') {
                cursor_.advance();
                return false;
            }
            if (cursor_.starts_with("/>")) {
                cursor_.advance(2);
                return true;
            }

            std::string name = consume_attribute_name();
            if (name.empty()) {
                warn("Unexpected '" + std::string(1, cursor_.peek()) + "' in <" +
                         element.tag_name + ">",
                     "Skipped character");
                cursor_.advance();
                continue;
            }

            cursor_.consume_whitespace();
            std::string value;
            if (cursor_.peek() == '=') {
                cursor_.advance();
                cursor_.consume_whitespace();
                value = parse_attribute_value(name);
            }

            if (!element.attributes.emplace(name, decode_html_entities(value)).second) {
                warn("Duplicate attribute '" + name + "' on <" + element.tag_name + ">",
                     "Kept first value");
            }
        }
    }

    std::string parse_attribute_value(const std::string& name) {
        const char quote = cursor_.peek();
        if (quote == '"' || quote == '\'') {
            if (quote == '\'') {
                warn("Single-quoted value for attribute '" + name + "'",
                     "Accepted single-quoted value");
            }
            cursor_.advance();
            std::string value(cursor_.consume_while([quote](char c) { return c != quote; }));
            if (cursor_.eof()) {
                warn("Unterminated value for attribute '" + name + "'",
                     "Consumed remaining input as value");
            }
            cursor_.advance();
            return value;
        }

        warn("Unquoted value for attribute '" + name + "'", "Accepted unquoted value");
        std::string value;
        while (!cursor_.eof() && !is_space(cursor_.peek()) && cursor_.peek() != '>' &&
               !cursor_.starts_with("/>")) {
            value.push_back(cursor_.peek());
            cursor_.advance();
        }
        return value;
    }

    void skip_comment() {
        const std::size_t end = cursor_.source.find("-->", cursor_.position + 4);
        if (end == std::string_view::npos) {
            warn("Unclosed HTML comment", "Consumed remaining input as comment");
            cursor_.position = cursor_.source.size();
            return;
        }
        cursor_.position = end + 3;
    }

    void skip_declaration() {
        const std::size_t end = cursor_.source.find('>', cursor_.position + 2);
        if (end == std::string_view::npos) {
            warn("Unclosed declaration/DOCTYPE", "Consumed remaining input as declaration");
            cursor_.position = cursor_.source.size();
            return;
        }
        cursor_.position = end + 1;
    }
};

}  // namespace

std::unique_ptr<Node> parse_html(const std::string& source) {
    return Parser(source, nullptr).parse();
}

ParseResult parse_html_with_diagnostics(const std::string& source) {
    ParseResult result;
    result.root = Parser(source, &result.warnings).parse();
    return result;
}

}  // namespace wisp::html
