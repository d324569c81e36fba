#pragma once

#include "config.hpp"
#include "document.hpp"
#include "loc.hpp"
#include "source_map.hpp"

#include <string>
#include <string_view>

namespace astrogen {

// Identifiers the generated module binds runtime entry points to
struct RuntimeNames {
    std::string template_tag = "$$render";
    std::string create_astro = "$$createAstro";
    std::string create_component = "$$createComponent";
    std::string render_component = "$$renderComponent";
    std::string render_slot = "$$renderSlot";
    std::string add_attribute = "$$addAttribute";
    std::string spread_attributes = "$$spreadAttributes";
    std::string define_style_vars = "$$defineStyleVars";
    std::string define_script_vars = "$$defineScriptVars";
    std::string create_metadata = "$$createMetadata";
    std::string metadata = "$$metadata";
    std::string result = "$$result";
    std::string slots = "$$slots";
    std::string fragment = "Fragment";
};

struct PrintResult {
    std::string output;
    sourcemap::Chunk source_map_chunk;
};

// Emits JavaScript for one component module. A Printer carries the state of
// a single print session and must not be shared between sessions.
class Printer {
public:
    Printer(std::string_view source, TransformOptions opts, RuntimeNames names = {});

    Printer(const Printer&) = delete;
    Printer& operator=(const Printer&) = delete;

    void print(std::string_view text);
    void println(std::string_view text);

    void add_source_mapping(Loc loc);
    void add_nil_source_mapping();

    // Module prologue. Emitted at most once per session.
    void print_internal_imports();
    void print_top_level_astro();

    // Component factory wrapper. Each half is emitted at most once per session.
    void print_func_prelude(std::string_view component_name);
    void print_func_suffix(std::string_view component_name);

    void print_return_open();
    void print_return_close();
    void print_template_literal_open();
    void print_template_literal_close();

    // ${$$defineScriptVars(...)} / ${$$defineStyleVars(...)} for the first
    // define:vars attribute of a <script> or <style>
    void print_define_vars(const Node& node);

    // Attribute inside template markup
    void print_attribute(const Attribute& attr);

    // Attributes as a JavaScript object literal
    void print_attributes_to_object(const Node& node);

    // {props:{...},children:`...`},
    void print_style_or_script(const Node& node);

    // Re-imports every module imported by script as $$moduleN and exports
    // $$metadata. Attaches client:component-path and client:component-export
    // to the client-only components it resolves, so it must run before those
    // nodes are printed.
    void print_component_metadata(Document& doc, std::string_view script);

    [[nodiscard]] const std::string& output() const noexcept { return output_; }
    [[nodiscard]] const RuntimeNames& names() const noexcept { return names_; }
    [[nodiscard]] const TransformOptions& options() const noexcept { return opts_; }
    [[nodiscard]] std::string_view source() const noexcept { return source_; }

    // Ends the session
    [[nodiscard]] PrintResult finish();

private:
    enum class Emission {
        NotEmitted,
        Emitted
    };

    std::string_view source_;
    const TransformOptions opts_;
    const RuntimeNames names_;
    std::string output_;
    sourcemap::ChunkBuilder builder_;

    Emission internal_imports_ = Emission::NotEmitted;
    Emission func_prelude_ = Emission::NotEmitted;
    Emission func_suffix_ = Emission::NotEmitted;
    Emission metadata_ = Emission::NotEmitted;
};

}  // namespace astrogen
