// Import statement scanner tests

#include "js_scanner.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace astrogen::js_scanner;

namespace {

std::vector<ImportStatement> scan_all(std::string_view source) {
    std::vector<ImportStatement> found;
    auto statement = next_import_statement(source, 0);
    while (statement) {
        found.push_back(*statement);
        statement = next_import_statement(source, statement->end);
    }
    return found;
}

void expect_import(const ImportedName& name, const std::string& local,
                   const std::string& exported) {
    EXPECT_EQ(name.local_name, local);
    EXPECT_EQ(name.export_name, exported);
}

}  // namespace

TEST(JsScannerTest, DefaultImport) {
    auto found = scan_all("import Foo from './Foo.astro';");
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].specifier, "./Foo.astro");
    ASSERT_EQ(found[0].imports.size(), 1u);
    expect_import(found[0].imports[0], "Foo", "default");
}

TEST(JsScannerTest, NamespaceImport) {
    auto found = scan_all("import * as Comps from \"./components\";");
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].specifier, "./components");
    ASSERT_EQ(found[0].imports.size(), 1u);
    expect_import(found[0].imports[0], "Comps", "*");
}

TEST(JsScannerTest, NamedImports) {
    auto found = scan_all("import { a, b as c, \"a-b\" as ab } from 'mod';");
    ASSERT_EQ(found.size(), 1u);
    ASSERT_EQ(found[0].imports.size(), 3u);
    expect_import(found[0].imports[0], "a", "a");
    expect_import(found[0].imports[1], "c", "b");
    expect_import(found[0].imports[2], "ab", "a-b");
}

TEST(JsScannerTest, DefaultWithNamedAndNamespace) {
    auto found = scan_all(
        "import a, { b, c as d } from 'm';\n"
        "import React, * as All from \"react\";\n");
    ASSERT_EQ(found.size(), 2u);

    ASSERT_EQ(found[0].imports.size(), 3u);
    expect_import(found[0].imports[0], "a", "default");
    expect_import(found[0].imports[1], "b", "b");
    expect_import(found[0].imports[2], "d", "c");

    ASSERT_EQ(found[1].imports.size(), 2u);
    expect_import(found[1].imports[0], "React", "default");
    expect_import(found[1].imports[1], "All", "*");
}

TEST(JsScannerTest, SideEffectImport) {
    auto found = scan_all("import './styles.css';");
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].specifier, "./styles.css");
    EXPECT_TRUE(found[0].is_side_effect());
}

TEST(JsScannerTest, ReportsStatementBounds) {
    std::string source = "import a from \"./a\";\nconst x = 1;";
    auto statement = next_import_statement(source, 0);
    ASSERT_TRUE(statement.has_value());
    EXPECT_EQ(statement->start, 0u);
    EXPECT_EQ(statement->end, 20u);
}

TEST(JsScannerTest, YieldsStatementsInSourceOrder) {
    auto found = scan_all(
        "import One from './one';\n"
        "const between = 1;\n"
        "import './two';\n"
        "import { Three } from './three';\n");
    ASSERT_EQ(found.size(), 3u);
    EXPECT_EQ(found[0].specifier, "./one");
    EXPECT_EQ(found[1].specifier, "./two");
    EXPECT_EQ(found[2].specifier, "./three");
    EXPECT_LT(found[0].end, found[1].start);
    EXPECT_LT(found[1].end, found[2].start);
}

TEST(JsScannerTest, IgnoresImportTextInsideStringsAndComments) {
    auto found = scan_all(
        "const s = \"import a from 'x'\";\n"
        "const q = 'import b from \"y\"';\n"
        "// import c from 'z'\n"
        "/* import d from 'w' */\n"
        "import Real from './real';\n");
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].specifier, "./real");
}

TEST(JsScannerTest, IgnoresImportTextInsideTemplateLiterals) {
    auto found = scan_all(
        "const t = `${ `b ${ \"}\" }` } import c from \"z\"`;\n"
        "import Real from './real';\n");
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].specifier, "./real");
}

TEST(JsScannerTest, DistinguishesRegexFromDivision) {
    auto found = scan_all(
        "const re = /import x from \"y\"/g;\n"
        "const half = total / 2; import Real from './real';\n");
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].specifier, "./real");
}

TEST(JsScannerTest, IgnoresImportExpressionsAndProperties) {
    auto found = scan_all(
        "const lazy = import('./lazy');\n"
        "const url = import.meta.url;\n"
        "const m = obj.import;\n"
        "import Real from './real';\n");
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].specifier, "./real");
}

TEST(JsScannerTest, IgnoresNestedImportText) {
    auto found = scan_all("function f() { import x from \"y\"; }\n");
    EXPECT_TRUE(found.empty());
}

TEST(JsScannerTest, RecoversFromMalformedStatements) {
    auto found = scan_all(
        "import from;\n"
        "import * from \"x\";\n"
        "import a from \"unterminated\n"
        "import b from \"./b\";\n");
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].specifier, "./b");
    expect_import(found[0].imports[0], "b", "default");
}

TEST(JsScannerTest, FlagsTypeOnlyImports) {
    auto found = scan_all(
        "import type { Props } from './types';\n"
        "import type Foo from './Foo';\n"
        "import { type C } from './c';\n"
        "import { type A, B } from './ab';\n");
    ASSERT_EQ(found.size(), 4u);

    const char* type_specifiers[] = {"./types", "./Foo", "./c"};
    for (size_t i = 0; i < 3; i++) {
        EXPECT_TRUE(found[i].type_only) << i;
        EXPECT_TRUE(found[i].imports.empty()) << i;
        EXPECT_FALSE(found[i].is_side_effect()) << i;
        EXPECT_EQ(found[i].specifier, type_specifiers[i]);
    }

    EXPECT_FALSE(found[3].type_only);
    EXPECT_EQ(found[3].specifier, "./ab");
    ASSERT_EQ(found[3].imports.size(), 1u);
    expect_import(found[3].imports[0], "B", "B");
}

TEST(JsScannerTest, TypeImportWithoutSpecifierIsNotAStatement) {
    auto found = scan_all("import type Alias = Other.Thing;\nimport Real from './real';\n");
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].specifier, "./real");
}

TEST(JsScannerTest, DefaultBindingNamedType) {
    auto found = scan_all("import type from './t';");
    ASSERT_EQ(found.size(), 1u);
    ASSERT_EQ(found[0].imports.size(), 1u);
    expect_import(found[0].imports[0], "type", "default");
}

TEST(JsScannerTest, ConsumesImportAttributes) {
    std::string source = "import data from './data.json' assert { type: 'json' };\nconst x = 1;";
    auto statement = next_import_statement(source, 0);
    ASSERT_TRUE(statement.has_value());
    EXPECT_EQ(statement->specifier, "./data.json");
    EXPECT_EQ(statement->end, source.find("\nconst"));
}

TEST(JsScannerTest, RenderBodyStartsAfterLastImport) {
    std::string source =
        "\nimport a from './a';\n"
        "import b from './b';\n"
        "const x = 1;";
    EXPECT_EQ(find_render_body(source), source.find("\nconst"));
}

TEST(JsScannerTest, RenderBodyStartsAfterTrailingTypeImport) {
    std::string source =
        "\nimport Foo from './Foo';\n"
        "import type { Props } from './types';\n"
        "const x = 1;";
    EXPECT_EQ(find_render_body(source), source.find("\nconst"));
}

TEST(JsScannerTest, RenderBodyIsWholeScriptWithoutImports) {
    EXPECT_EQ(find_render_body("const x = 1;"), 0u);
    EXPECT_EQ(find_render_body(""), 0u);
}
