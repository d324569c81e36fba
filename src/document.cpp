#include "document.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace astrogen {

namespace {

constexpr std::array<std::string_view, 14> kVoidElements = {
    "area", "base", "br", "col", "embed", "hr", "img",
    "input", "link", "meta", "param", "source", "track", "wbr"
};

bool has_client_directive(const Node& node) {
    return std::any_of(node.attrs.begin(), node.attrs.end(), [](const Attribute& attr) {
        return attr.key.rfind("client:", 0) == 0;
    });
}

void collect(Document& doc, Node& node) {
    if (node.type == NodeType::Element) {
        if (node.component || node.custom_element) {
            if (has_attribute(node, "client:only")) {
                doc.client_only_components.push_back(&node);
            } else if (has_client_directive(node)) {
                doc.hydrated_components.push_back(&node);
            }
        }
        if (is_hoisted_script(node)) {
            doc.scripts.push_back(&node);
        } else if (is_hoisted_style(node)) {
            doc.styles.push_back(&node);
        }
    }

    for (auto& child : node.children) {
        collect(doc, *child);
    }
}

}  // namespace

Node* Node::append_child(std::unique_ptr<Node> child) {
    child->parent = this;
    children.push_back(std::move(child));
    return children.back().get();
}

const Attribute* get_attribute(const Node& node, std::string_view key) {
    for (const auto& attr : node.attrs) {
        if (attr.key == key) {
            return &attr;
        }
    }
    return nullptr;
}

bool has_attribute(const Node& node, std::string_view key) {
    return get_attribute(node, key) != nullptr;
}

bool is_component_tag(std::string_view name) noexcept {
    if (name.empty()) {
        return false;
    }
    return std::isupper(static_cast<unsigned char>(name.front())) ||
           name.find('.') != std::string_view::npos;
}

bool is_custom_element_tag(std::string_view name) noexcept {
    return name.find('-') != std::string_view::npos;
}

bool is_void_element(std::string_view name) noexcept {
    return std::find(kVoidElements.begin(), kVoidElements.end(), name) != kVoidElements.end();
}

bool is_hoisted_script(const Node& node) {
    return node.is_element("script") && has_attribute(node, "hoist");
}

bool is_hoisted_style(const Node& node) {
    // define:vars styles depend on render-time values and stay in the template
    return node.is_element("style") && !has_attribute(node, "define:vars");
}

void collect_components(Document& doc) {
    doc.hydrated_components.clear();
    doc.client_only_components.clear();
    doc.scripts.clear();
    doc.styles.clear();
    collect(doc, doc.root);
}

}  // namespace astrogen
