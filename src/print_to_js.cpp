#include "print_to_js.hpp"
#include "escape.hpp"
#include "js_scanner.hpp"

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

namespace astrogen {

namespace {

constexpr std::string_view kComponentName = "$$Component";

Loc offset_loc(Loc base, size_t delta) {
    if (!base) {
        return std::nullopt;
    }
    return *base + delta;
}

bool contains(const std::vector<Node*>& nodes, const Node& node) {
    return std::find(nodes.begin(), nodes.end(), &node) != nodes.end();
}

bool is_blank(const Node& node) {
    return node.type == NodeType::Text && trim(node.data).empty();
}

class Renderer {
public:
    Renderer(Printer& printer, Document& doc) : p_(printer), doc_(doc) {}

    void render_document() {
        const Node* frontmatter = nullptr;
        for (const auto& child : doc_.root.children) {
            if (child->type == NodeType::Frontmatter) {
                frontmatter = child.get();
                break;
            }
        }
        const Node* code = frontmatter ? frontmatter->first_child() : nullptr;
        std::string_view script = code ? std::string_view(code->data) : std::string_view();

        p_.print_internal_imports();
        // Must precede the body: it annotates client-only components
        p_.print_component_metadata(doc_, script);
        render_frontmatter(code, script);
        render_hoisted();

        p_.print_return_open();
        for (const auto& child : doc_.root.children) {
            if (child->type != NodeType::Frontmatter) {
                render_node(*child);
            }
        }
        p_.print_return_close();
        p_.print_func_suffix(kComponentName);
    }

private:
    void render_frontmatter(const Node* code, std::string_view script) {
        size_t body = js_scanner::find_render_body(script);
        if (body > 0) {
            p_.add_source_mapping(code->loc);
            p_.println(script.substr(0, body));
        }

        p_.print_top_level_astro();
        p_.print_func_prelude(kComponentName);

        std::string_view render_body = script.substr(body);
        if (!trim(render_body).empty()) {
            p_.add_source_mapping(offset_loc(code->loc, body));
            p_.println(render_body);
        }
    }

    void render_hoisted() {
        const RuntimeNames& names = p_.names();
        if (!doc_.styles.empty()) {
            p_.add_nil_source_mapping();
            p_.println("const STYLES = [");
            for (const Node* style : doc_.styles) {
                p_.print_style_or_script(*style);
            }
            p_.println("];");
            p_.add_nil_source_mapping();
            p_.println("for (const STYLE of STYLES) " + names.result + ".styles.add(STYLE);");
        }
        if (!doc_.scripts.empty()) {
            p_.add_nil_source_mapping();
            p_.println("const SCRIPTS = [");
            for (const Node* script : doc_.scripts) {
                p_.print_style_or_script(*script);
            }
            p_.println("];");
            p_.add_nil_source_mapping();
            p_.println("for (const SCRIPT of SCRIPTS) " + names.result + ".scripts.add(SCRIPT);");
        }
    }

    void render_node(const Node& n) {
        switch (n.type) {
            case NodeType::Document:
            case NodeType::Frontmatter:
                break;
            case NodeType::Text:
                p_.add_source_mapping(n.loc);
                p_.print(escape_text(n.data));
                break;
            case NodeType::Comment:
                p_.add_source_mapping(n.loc);
                p_.print("<!--" + escape_text(n.data) + "-->");
                break;
            case NodeType::Doctype:
                p_.add_source_mapping(n.loc);
                p_.print("<!DOCTYPE " + escape_text(n.data) + ">");
                break;
            case NodeType::Expression:
                render_expression(n);
                break;
            case NodeType::Element:
                if (contains(doc_.styles, n) || contains(doc_.scripts, n)) {
                    break;
                }
                if (n.component || n.custom_element || n.fragment) {
                    render_component(n);
                } else if (n.is_element("slot")) {
                    render_slot(n);
                } else {
                    render_element(n);
                }
                break;
        }
    }

    void render_children(const Node& n) {
        for (const auto& child : n.children) {
            render_node(*child);
        }
    }

    void render_element(const Node& n) {
        p_.add_source_mapping(n.loc);
        p_.print("<" + n.data);
        for (const auto& attr : n.attrs) {
            p_.print_attribute(attr);
        }
        p_.print(">");
        if (is_void_element(n.data)) {
            return;
        }

        p_.print_define_vars(n);
        render_children(n);
        p_.add_nil_source_mapping();
        p_.print("</" + n.data + ">");
    }

    void render_expression(const Node& n) {
        p_.add_nil_source_mapping();
        p_.print("${");
        for (const auto& child : n.children) {
            if (child->type == NodeType::Text) {
                p_.add_source_mapping(child->loc);
                p_.print(child->data);
            } else {
                p_.print_template_literal_open();
                render_node(*child);
                p_.print_template_literal_close();
            }
        }
        p_.add_nil_source_mapping();
        p_.print("}");
    }

    void render_component(const Node& n) {
        const RuntimeNames& names = p_.names();
        std::string display_name = n.data.empty() ? names.fragment : n.data;

        p_.add_nil_source_mapping();
        p_.print("${" + names.render_component + "(" + names.result + ",'" +
                 escape_single_quote(display_name) + "',");
        if (n.fragment) {
            p_.print(names.fragment);
        } else if (has_attribute(n, "client:only")) {
            // Rendered on the client only; resolved through client:component-path
            p_.print("null");
        } else if (n.custom_element) {
            p_.print("'" + n.data + "'");
        } else {
            p_.add_source_mapping(n.loc);
            p_.print(n.data);
        }
        p_.print(",");
        p_.print_attributes_to_object(n);
        p_.add_nil_source_mapping();
        p_.print(",");
        render_slots(n);
        p_.print(")}");
    }

    void render_slots(const Node& n) {
        std::vector<const Node*> default_slot;
        std::vector<std::pair<std::string, std::vector<const Node*>>> named_slots;

        for (const auto& child : n.children) {
            const Attribute* slot = get_attribute(*child, "slot");
            if (!slot || slot->type != AttributeType::Quoted) {
                default_slot.push_back(child.get());
                continue;
            }
            auto it = std::find_if(named_slots.begin(), named_slots.end(),
                                   [&](const auto& entry) { return entry.first == slot->val; });
            if (it == named_slots.end()) {
                named_slots.push_back({slot->val, {child.get()}});
            } else {
                it->second.push_back(child.get());
            }
        }

        if (std::all_of(default_slot.begin(), default_slot.end(),
                        [](const Node* c) { return is_blank(*c); })) {
            default_slot.clear();
        }

        p_.print("{");
        bool first = true;
        auto print_slot = [&](const std::string& name, const std::vector<const Node*>& nodes) {
            if (!first) {
                p_.print(",");
            }
            first = false;
            p_.print(quote_js(name) + ": () => ");
            p_.print_template_literal_open();
            for (const Node* c : nodes) {
                render_node(*c);
            }
            p_.print_template_literal_close();
        };

        if (!default_slot.empty()) {
            print_slot("default", default_slot);
        }
        for (const auto& [name, nodes] : named_slots) {
            print_slot(name, nodes);
        }
        p_.print("}");
    }

    void render_slot(const Node& n) {
        const RuntimeNames& names = p_.names();
        const Attribute* name_attr = get_attribute(n, "name");
        std::string name = name_attr && name_attr->type == AttributeType::Quoted
            ? name_attr->val
            : "default";

        p_.add_nil_source_mapping();
        p_.print("${" + names.render_slot + "(" + names.result + "," + names.slots + "[" +
                 quote_js(name) + "]");
        if (!n.children.empty()) {
            p_.print(",");
            p_.print_template_literal_open();
            render_children(n);
            p_.print_template_literal_close();
        }
        p_.add_nil_source_mapping();
        p_.print(")}");
    }

    Printer& p_;
    Document& doc_;
};

}  // namespace

PrintResult print_to_js(Document& doc, std::string_view source, const TransformOptions& opts,
                        const RuntimeNames& names) {
    Printer printer(source, opts, names);
    Renderer renderer(printer, doc);
    renderer.render_document();
    return printer.finish();
}

}  // namespace astrogen
