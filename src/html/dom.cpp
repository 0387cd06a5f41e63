#include "wisp/html/dom.h"

#include <cctype>

namespace wisp::html {
namespace {

bool is_ascii_whitespace(char c) {
    return c == ' ' || c == '\t' || c == '\n' ||
           c == '\r' || c == '\f';
}

std::string to_lower_ascii(const std::string& text) {
    std::string lowered;
    lowered.reserve(text.size());
    for (char c : text) {
        lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return lowered;
}

void collect_by_tag(const Node& node, const std::string& tag, std::vector<const Node*>& result) {
    if (node.is_element() && node.tag_name == tag) {
        result.push_back(&node);
    }
    for (const auto& child : node.children) {
        collect_by_tag(*child, tag, result);
    }
}

void collect_text(const Node& node, std::string& output) {
    if (node.is_text()) {
        output += node.text_content;
    }
    for (const auto& child : node.children) {
        collect_text(*child, output);
    }
}

}  // namespace

std::optional<std::string> Node::attribute(const std::string& name) const {
    if (!is_element()) {
        return std::nullopt;
    }
    const auto it = attributes.find(name);
    if (it == attributes.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string> Node::id() const {
    return attribute("id");
}

std::set<std::string> Node::classes() const {
    std::set<std::string> result;
    const auto class_attr = attribute("class");
    if (!class_attr) {
        return result;
    }

    const std::string& value = *class_attr;
    std::size_t pos = 0;
    while (pos < value.size()) {
        while (pos < value.size() && is_ascii_whitespace(value[pos])) {
            ++pos;
        }
        const std::size_t token_start = pos;
        while (pos < value.size() && !is_ascii_whitespace(value[pos])) {
            ++pos;
        }
        if (pos > token_start) {
            result.insert(value.substr(token_start, pos - token_start));
        }
    }
    return result;
}

Node* Node::append_child(std::unique_ptr<Node> child) {
    child->parent = this;
    Node* raw = child.get();
    children.push_back(std::move(child));
    return raw;
}

std::unique_ptr<Node> make_element(std::string tag_name,
                                   std::map<std::string, std::string> attributes) {
    auto element = std::make_unique<Node>(NodeType::Element, std::move(tag_name));
    element->attributes = std::move(attributes);
    return element;
}

std::unique_ptr<Node> make_text(std::string text) {
    auto node = std::make_unique<Node>(NodeType::Text);
    node->text_content = std::move(text);
    return node;
}

std::string serialize_dom(const Node& node) {
    if (node.is_text()) {
        return "TEXT(\"" + node.text_content + "\")";
    }

    std::string output = "<" + node.tag_name;
    for (const auto& [key, value] : node.attributes) {
        output += " " + key + "=\"" + value + "\"";
    }
    output += ">";

    for (const auto& child : node.children) {
        if (child) {
            output += "[" + serialize_dom(*child) + "]";
        }
    }

    output += "</" + node.tag_name + ">";
    return output;
}

std::string inner_text(const Node& root) {
    std::string text;
    collect_text(root, text);
    return text;
}

std::vector<const Node*> query_all_by_tag(const Node& root, const std::string& tag) {
    std::vector<const Node*> result;
    if (tag.empty()) {
        return result;
    }
    collect_by_tag(root, to_lower_ascii(tag), result);
    return result;
}

const Node* query_first_by_id(const Node& root, const std::string& id) {
    if (id.empty()) {
        return nullptr;
    }
    if (root.is_element() && root.id() == id) {
        return &root;
    }
    for (const auto& child : root.children) {
        if (const Node* match = query_first_by_id(*child, id)) {
            return match;
        }
    }
    return nullptr;
}

}  // namespace wisp::html
