#include "document_loader.hpp"

#include <fstream>
#include <istream>
#include <stdexcept>

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

namespace pt = boost::property_tree;

namespace astrogen {

namespace {

NodeType parse_node_type(const std::string& name) {
    if (name == "element") return NodeType::Element;
    if (name == "text") return NodeType::Text;
    if (name == "comment") return NodeType::Comment;
    if (name == "doctype") return NodeType::Doctype;
    if (name == "expression") return NodeType::Expression;
    if (name == "frontmatter") return NodeType::Frontmatter;
    throw std::runtime_error("Unknown node type: " + name);
}

AttributeType parse_attribute_type(const std::string& name) {
    if (name == "quoted") return AttributeType::Quoted;
    if (name == "empty") return AttributeType::Empty;
    if (name == "expression") return AttributeType::Expression;
    if (name == "spread") return AttributeType::Spread;
    if (name == "shorthand") return AttributeType::Shorthand;
    if (name == "template-literal") return AttributeType::TemplateLiteral;
    throw std::runtime_error("Unknown attribute type: " + name);
}

Loc read_loc(const pt::ptree& tree, const char* key) {
    auto child = tree.get_child_optional(key);
    if (!child) {
        return std::nullopt;
    }
    // Throws ptree_bad_data for a non-numeric offset
    return child->get_value<size_t>();
}

Attribute read_attribute(const pt::ptree& tree) {
    Attribute attr;
    attr.type = parse_attribute_type(tree.get<std::string>("type", "quoted"));
    attr.ns = tree.get<std::string>("namespace", "");
    attr.key = tree.get<std::string>("key", "");
    attr.val = tree.get<std::string>("value", "");
    attr.key_loc = read_loc(tree, "keyLoc");
    attr.val_loc = read_loc(tree, "valueLoc");
    return attr;
}

std::unique_ptr<Node> read_node(const pt::ptree& tree) {
    auto node = std::make_unique<Node>();
    node->type = parse_node_type(tree.get<std::string>("type", "element"));
    node->data = tree.get<std::string>("data", "");
    node->loc = read_loc(tree, "loc");

    if (node->type == NodeType::Element) {
        // <> and <Fragment> both render as a fragment
        node->fragment = tree.get<bool>("fragment", node->data.empty() || node->data == "Fragment");
        node->component = tree.get<bool>("component", is_component_tag(node->data));
        node->custom_element = tree.get<bool>("customElement", is_custom_element_tag(node->data));
    }

    if (auto attrs = tree.get_child_optional("attributes")) {
        for (const auto& entry : *attrs) {
            node->attrs.push_back(read_attribute(entry.second));
        }
    }
    if (auto children = tree.get_child_optional("children")) {
        for (const auto& entry : *children) {
            node->append_child(read_node(entry.second));
        }
    }
    return node;
}

}  // namespace

LoadedDocument load_document(std::istream& in) {
    pt::ptree tree;
    try {
        pt::read_json(in, tree);
    } catch (const pt::json_parser_error& e) {
        throw std::runtime_error(std::string("Invalid document tree: ") + e.what());
    }

    LoadedDocument loaded;
    loaded.document = std::make_unique<Document>();
    if (auto source = tree.get_optional<std::string>("source")) {
        loaded.source = *source;
    }

    try {
        if (auto children = tree.get_child_optional("children")) {
            for (const auto& entry : *children) {
                loaded.document->root.append_child(read_node(entry.second));
            }
        }
    } catch (const pt::ptree_bad_data& e) {
        throw std::runtime_error(std::string("Invalid document tree: ") + e.what());
    }

    collect_components(*loaded.document);
    return loaded;
}

LoadedDocument load_document_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Failed to open document tree: " + path.string());
    }
    return load_document(file);
}

}  // namespace astrogen
