#pragma once

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace wisp::html {

enum class NodeType {
    Element,
    Text,
};

// A DOM node is either an element or a run of text. Children are owned
// exclusively; `parent` is a back pointer filled in by the parser.
struct Node {
    NodeType type = NodeType::Element;
    std::string tag_name;
    std::map<std::string, std::string> attributes;
    std::string text_content;
    std::vector<std::unique_ptr<Node>> children;
    Node* parent = nullptr;

    Node() = default;
    explicit Node(NodeType node_type) : type(node_type) {}
    Node(NodeType node_type, std::string tag) : type(node_type), tag_name(std::move(tag)) {}

    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    bool is_element() const { return type == NodeType::Element; }
    bool is_text() const { return type == NodeType::Text; }

    std::optional<std::string> attribute(const std::string& name) const;

    // Derived from the attribute map on each call.
    std::optional<std::string> id() const;
    std::set<std::string> classes() const;

    Node* append_child(std::unique_ptr<Node> child);
};

std::unique_ptr<Node> make_element(std::string tag_name,
                                   std::map<std::string, std::string> attributes = {});
std::unique_ptr<Node> make_text(std::string text);

// Serialize DOM tree to a canonical string for deterministic comparison
std::string serialize_dom(const Node& node);

std::string inner_text(const Node& root);

std::vector<const Node*> query_all_by_tag(const Node& root, const std::string& tag);
const Node* query_first_by_id(const Node& root, const std::string& id);

}  // namespace wisp::html
