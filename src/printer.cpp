#include "printer.hpp"
#include "escape.hpp"
#include "js_scanner.hpp"

#include <stdexcept>
#include <utility>
#include <vector>

namespace astrogen {

namespace {

// Spread attributes are located at the expression; the "..." before it is
// not part of the key span
constexpr size_t kSpreadPrefixLength = 3;

std::string qualified_key(const Attribute& attr) {
    if (attr.ns.empty()) {
        return attr.key;
    }
    return attr.ns + ":" + attr.key;
}

Loc spread_loc(const Attribute& attr) {
    if (!attr.key_loc || *attr.key_loc < kSpreadPrefixLength) {
        throw std::logic_error("spread attribute {..." + std::string(trim(attr.key)) +
                               "} has no valid source location");
    }
    return *attr.key_loc - kSpreadPrefixLength;
}

void add_client_only_attributes(Node& node, const RuntimeNames& names,
                                const std::string& specifier, std::string export_name) {
    Attribute path_attr;
    path_attr.type = AttributeType::Expression;
    path_attr.key = "client:component-path";
    path_attr.val = names.metadata + ".resolvePath(\"" + specifier + "\")";
    node.attrs.push_back(std::move(path_attr));

    Attribute export_attr;
    export_attr.type = AttributeType::Quoted;
    export_attr.key = "client:component-export";
    export_attr.val = std::move(export_name);
    node.attrs.push_back(std::move(export_attr));
}

// Injects client-only attributes into the first client-only component the
// statement provides a binding for. Returns true if one matched.
bool match_client_only(const js_scanner::ImportStatement& statement,
                       const std::vector<Node*>& client_only, const RuntimeNames& names) {
    for (Node* node : client_only) {
        for (const auto& imported : statement.imports) {
            if (imported.export_name == "*") {
                std::string prefix = imported.local_name + ".";
                if (node->data.rfind(prefix, 0) != 0) {
                    continue;
                }
                std::string rest = node->data.substr(prefix.size());
                std::string export_name = rest.substr(0, rest.find('.'));
                add_client_only_attributes(*node, names, statement.specifier,
                                           std::move(export_name));
                return true;
            }
            if (imported.local_name == node->data) {
                add_client_only_attributes(*node, names, statement.specifier,
                                           imported.export_name);
                return true;
            }
        }
    }
    return false;
}

}  // namespace

Printer::Printer(std::string_view source, TransformOptions opts, RuntimeNames names)
    : source_(source)
    , opts_(std::move(opts))
    , names_(std::move(names))
    , builder_(source)
{
}

void Printer::print(std::string_view text) {
    output_.append(text);
}

void Printer::println(std::string_view text) {
    output_.append(text);
    output_ += '\n';
}

void Printer::add_source_mapping(Loc loc) {
    builder_.add_source_mapping(loc, output_);
}

void Printer::add_nil_source_mapping() {
    builder_.add_nil_source_mapping(output_);
}

void Printer::print_internal_imports() {
    if (internal_imports_ == Emission::Emitted) {
        return;
    }

    const std::pair<std::string_view, std::string_view> entries[] = {
        {"render", names_.template_tag},
        {"createAstro", names_.create_astro},
        {"createComponent", names_.create_component},
        {"renderComponent", names_.render_component},
        {"renderSlot", names_.render_slot},
        {"addAttribute", names_.add_attribute},
        {"spreadAttributes", names_.spread_attributes},
        {"defineStyleVars", names_.define_style_vars},
        {"defineScriptVars", names_.define_script_vars},
        {"createMetadata", names_.create_metadata},
    };

    add_nil_source_mapping();
    print("import {\n  ");
    print(names_.fragment);
    for (const auto& [exported, local] : entries) {
        print(",\n  ");
        print(exported);
        print(" as ");
        print(local);
    }
    print("\n} from \"");
    print(opts_.internal_url);
    print("\";\n");
    internal_imports_ = Emission::Emitted;
}

void Printer::print_top_level_astro() {
    add_nil_source_mapping();
    println("const $$Astro = " + names_.create_astro + "(import.meta.url, '" +
            escape_single_quote(opts_.site) + "');\nconst Astro = $$Astro;");
}

void Printer::print_func_prelude(std::string_view component_name) {
    if (func_prelude_ == Emission::Emitted) {
        return;
    }
    std::string name(component_name);
    add_nil_source_mapping();
    println("\n//@ts-ignore");
    println("const " + name + " = " + names_.create_component + "(async (" + names_.result +
            ", $$props, " + names_.slots + ") => {");
    println("const Astro = " + names_.result + ".createAstro($$Astro, $$props, " +
            names_.slots + ");");
    func_prelude_ = Emission::Emitted;
}

void Printer::print_func_suffix(std::string_view component_name) {
    if (func_suffix_ == Emission::Emitted) {
        return;
    }
    std::string name(component_name);
    add_nil_source_mapping();
    println("});");
    println("export default " + name + ";");
    func_suffix_ = Emission::Emitted;
}

void Printer::print_return_open() {
    add_nil_source_mapping();
    print("return ");
    print_template_literal_open();
}

void Printer::print_return_close() {
    add_nil_source_mapping();
    print_template_literal_close();
    println(";");
}

void Printer::print_template_literal_open() {
    add_nil_source_mapping();
    print(names_.template_tag + "`");
}

void Printer::print_template_literal_close() {
    add_nil_source_mapping();
    print("`");
}

void Printer::print_define_vars(const Node& node) {
    bool is_script = node.is_element("script");
    if (!is_script && !node.is_element("style")) {
        return;
    }

    for (const auto& attr : node.attrs) {
        if (attr.key != "define:vars") {
            continue;
        }

        std::string value;
        switch (attr.type) {
            case AttributeType::Quoted:
                value = "\"" + attr.val + "\"";
                break;
            case AttributeType::Empty:
                value = attr.key;
                break;
            case AttributeType::Expression:
                value = std::string(trim(attr.val));
                break;
            case AttributeType::Spread:
            case AttributeType::Shorthand:
            case AttributeType::TemplateLiteral:
                break;
        }

        const std::string& define_call = is_script ? names_.define_script_vars
                                                   : names_.define_style_vars;
        add_nil_source_mapping();
        print("${" + define_call + "(");
        add_source_mapping(attr.val_loc);
        print(value);
        add_nil_source_mapping();
        print(")}");
        return;
    }
}

void Printer::print_attribute(const Attribute& attr) {
    if (attr.key == "define:vars") {
        return;
    }

    if (!attr.ns.empty() || attr.type == AttributeType::Quoted ||
        attr.type == AttributeType::Empty || attr.type == AttributeType::TemplateLiteral) {
        print(" ");
    }

    if (!attr.ns.empty()) {
        print(attr.ns);
        print(":");
    }

    std::string_view key = trim(attr.key);
    switch (attr.type) {
        case AttributeType::Quoted:
            add_source_mapping(attr.key_loc);
            print(attr.key);
            print("=");
            add_source_mapping(attr.val_loc);
            print("\"" + encode_double_quote(attr.val) + "\"");
            break;
        case AttributeType::Empty:
            add_source_mapping(attr.key_loc);
            print(attr.key);
            break;
        case AttributeType::Expression:
            add_nil_source_mapping();
            print("${" + names_.add_attribute + "(");
            add_source_mapping(attr.val_loc);
            print(trim(attr.val));
            add_source_mapping(attr.key_loc);
            print(", \"" + std::string(key) + "\")}");
            break;
        case AttributeType::Spread: {
            Loc loc = spread_loc(attr);
            add_nil_source_mapping();
            print("${" + names_.spread_attributes + "(");
            add_source_mapping(loc);
            print(key);
            print(", \"" + std::string(key) + "\")}");
            break;
        }
        case AttributeType::Shorthand:
            add_nil_source_mapping();
            print("${" + names_.add_attribute + "(");
            add_source_mapping(attr.key_loc);
            print(key);
            print(", \"" + std::string(key) + "\")}");
            break;
        case AttributeType::TemplateLiteral:
            add_nil_source_mapping();
            print("${" + names_.add_attribute + "(`");
            add_source_mapping(attr.val_loc);
            print(trim(attr.val));
            add_source_mapping(attr.key_loc);
            print("`, \"" + std::string(key) + "\")}");
            break;
    }
}

void Printer::print_attributes_to_object(const Node& node) {
    print("{");
    for (size_t i = 0; i < node.attrs.size(); i++) {
        const Attribute& a = node.attrs[i];
        if (i != 0) {
            print(",");
        }

        std::string key = qualified_key(a);
        switch (a.type) {
            case AttributeType::Quoted:
                add_source_mapping(a.key_loc);
                print(quote_js(key));
                print(":");
                add_source_mapping(a.val_loc);
                print(quote_js(a.val));
                break;
            case AttributeType::Empty:
                add_source_mapping(a.key_loc);
                print(quote_js(key));
                print(":");
                print("true");
                break;
            case AttributeType::Expression:
                add_source_mapping(a.key_loc);
                print(quote_js(key));
                print(":");
                add_source_mapping(a.val_loc);
                print("(" + a.val + ")");
                break;
            case AttributeType::Spread:
                add_source_mapping(spread_loc(a));
                print("...(" + std::string(trim(a.key)) + ")");
                break;
            case AttributeType::Shorthand:
                add_source_mapping(a.key_loc);
                print(quote_js(trim(key)));
                print(":");
                print("(" + std::string(trim(a.key)) + ")");
                break;
            case AttributeType::TemplateLiteral:
                add_source_mapping(a.key_loc);
                print(quote_js(trim(key)));
                print(":");
                add_source_mapping(a.val_loc);
                print("`" + std::string(trim(a.val)) + "`");
                break;
        }
    }
    print("}");
}

void Printer::print_style_or_script(const Node& node) {
    add_nil_source_mapping();
    print("{props:");
    print_attributes_to_object(node);

    const Node* child = node.first_child();
    if (child && !trim(child->data).empty()) {
        print(",children:`");
        add_source_mapping(node.loc);
        print(escape_text(trim(child->data)));
        add_nil_source_mapping();
        print("`");
    }
    print("},\n");
}

void Printer::print_component_metadata(Document& doc, std::string_view script) {
    if (metadata_ == Emission::Emitted) {
        return;
    }
    add_nil_source_mapping();

    std::vector<std::string> specs;
    auto statement = js_scanner::next_import_statement(script, 0);
    while (statement) {
        // Type-only imports are erased at runtime
        if (!statement->type_only &&
            !match_client_only(*statement, doc.client_only_components, names_)) {
            specs.push_back(statement->specifier);
            print("\nimport * as $$module" + std::to_string(specs.size()) + " from '" +
                  escape_single_quote(statement->specifier) + "';");
        }
        statement = js_scanner::next_import_statement(script, statement->end);
    }
    // If we added imports, add a line break.
    if (!specs.empty()) {
        print("\n");
    }

    print("\nexport const " + names_.metadata + " = " + names_.create_metadata +
          "(import.meta.url, { ");

    print("modules: [");
    for (size_t i = 0; i < specs.size(); i++) {
        if (i > 0) {
            print(", ");
        }
        print("{ module: $$module" + std::to_string(i + 1) + ", specifier: '" +
              escape_single_quote(specs[i]) + "' }");
    }
    print("]");

    print(", hydratedComponents: [");
    for (size_t i = 0; i < doc.hydrated_components.size(); i++) {
        const Node& node = *doc.hydrated_components[i];
        if (i > 0) {
            print(", ");
        }
        if (node.custom_element) {
            print("'" + node.data + "'");
        } else {
            print(node.data);
        }
    }

    print("], hoisted: [");
    size_t hoisted = 0;
    for (const Node* node : doc.scripts) {
        // Only a literal src names a remote script at module scope
        const Attribute* src = get_attribute(*node, "src");
        if (src && src->type != AttributeType::Quoted) {
            src = nullptr;
        }
        const Node* child = node->first_child();
        if (!src && !child) {
            continue;
        }
        if (hoisted++ > 0) {
            print(", ");
        }
        if (src) {
            print("{ type: 'remote', src: '" + escape_single_quote(src->val) + "' }");
        } else {
            print("{ type: 'inline', value: `" + escape_text(child->data) + "` }");
        }
    }
    print("] });\n\n");
    metadata_ = Emission::Emitted;
}

PrintResult Printer::finish() {
    PrintResult result;
    result.source_map_chunk = builder_.generate_chunk(output_);
    result.output = std::move(output_);
    output_.clear();
    return result;
}

}  // namespace astrogen
