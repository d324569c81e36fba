#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace astrogen::js_scanner {

// One binding introduced by an import statement.
// export_name is "*" for a namespace import and "default" for a default import.
struct ImportedName {
    std::string local_name;
    std::string export_name;
};

// Represents a parsed top-level import statement
struct ImportStatement {
    std::string specifier;             // e.g. "./Foo.jsx"
    std::vector<ImportedName> imports; // empty for side-effect imports
    size_t start = 0;                  // offset of the `import` keyword
    size_t end = 0;                    // offset just past the statement
    bool type_only = false;            // `import type ...`; has no runtime module

    [[nodiscard]] bool is_side_effect() const noexcept { return !type_only && imports.empty(); }
};

// Find the next top-level import statement at or after `from`.
// Call again with the returned statement's `end` to continue; nullopt
// means there are no more. Type-only imports are reported with type_only
// set and no bindings. Never throws: anything this scanner does not
// understand is skipped.
[[nodiscard]] std::optional<ImportStatement> next_import_statement(std::string_view source,
                                                                   size_t from);

// Offset just past the last top-level import statement, type-only ones
// included, 0 if there is none
[[nodiscard]] size_t find_render_body(std::string_view source);

}  // namespace astrogen::js_scanner
