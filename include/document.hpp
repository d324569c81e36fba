#pragma once

#include "loc.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace astrogen {

enum class AttributeType {
    Quoted,           // key="value"
    Empty,            // key
    Expression,       // key={value}
    Spread,           // {...key}
    Shorthand,        // {key}
    TemplateLiteral   // key=`value`
};

struct Attribute {
    AttributeType type = AttributeType::Quoted;
    std::string ns;   // namespace prefix, e.g. "xlink"
    std::string key;  // for Spread and Shorthand this holds the raw expression text
    std::string val;
    Loc key_loc;
    Loc val_loc;
};

enum class NodeType {
    Document,
    Element,
    Text,
    Comment,
    Doctype,
    Expression,
    Frontmatter
};

struct Node {
    NodeType type = NodeType::Element;
    std::string data;  // tag name for elements, text for text-like nodes
    std::vector<Attribute> attrs;
    std::vector<std::unique_ptr<Node>> children;
    Node* parent = nullptr;
    Loc loc;
    bool component = false;
    bool custom_element = false;
    bool fragment = false;

    Node() = default;
    Node(NodeType t, std::string d) : type(t), data(std::move(d)) {}

    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    [[nodiscard]] Node* first_child() const noexcept {
        return children.empty() ? nullptr : children.front().get();
    }

    // Takes ownership of child and returns a pointer to it
    Node* append_child(std::unique_ptr<Node> child);

    [[nodiscard]] bool is_element(std::string_view tag) const noexcept {
        return type == NodeType::Element && data == tag;
    }
};

// A parsed component plus the node lists an earlier pass computed over it.
// The lists do not own their nodes; they point into root.
struct Document {
    Node root{NodeType::Document, ""};
    std::vector<Node*> hydrated_components;
    std::vector<Node*> client_only_components;
    std::vector<Node*> scripts;
    std::vector<Node*> styles;
};

[[nodiscard]] const Attribute* get_attribute(const Node& node, std::string_view key);
[[nodiscard]] bool has_attribute(const Node& node, std::string_view key);

[[nodiscard]] bool is_component_tag(std::string_view name) noexcept;
[[nodiscard]] bool is_custom_element_tag(std::string_view name) noexcept;
[[nodiscard]] bool is_void_element(std::string_view name) noexcept;

// True for a <script hoist> or a <style> that is lifted out of the template
[[nodiscard]] bool is_hoisted_script(const Node& node);
[[nodiscard]] bool is_hoisted_style(const Node& node);

// Fill hydrated_components, client_only_components, scripts and styles
// from the tree, in document order.
void collect_components(Document& doc);

}  // namespace astrogen
