// JSON document tree loader tests

#include "document_loader.hpp"

#include <gtest/gtest.h>
#include <sstream>
#include <stdexcept>
#include <string>

using namespace astrogen;

namespace {

LoadedDocument load(const std::string& json) {
    std::istringstream in(json);
    return load_document(in);
}

}  // namespace

TEST(DocumentLoaderTest, ReadsNodesAndAttributes) {
    LoadedDocument loaded = load(R"json({
        "source": "<a href={url}>x</a>",
        "children": [
            {"type": "element", "data": "a", "loc": 0,
             "attributes": [
                {"type": "expression", "key": "href", "value": "url",
                 "keyLoc": 3, "valueLoc": 9},
                {"type": "quoted", "namespace": "xlink", "key": "title", "value": "t"}
             ],
             "children": [{"type": "text", "data": "x", "loc": 14}]}
        ]
    })json");

    ASSERT_TRUE(loaded.source.has_value());
    EXPECT_EQ(*loaded.source, "<a href={url}>x</a>");

    const Node& root = loaded.document->root;
    EXPECT_EQ(root.type, NodeType::Document);
    ASSERT_EQ(root.children.size(), 1u);

    const Node& a = *root.children[0];
    EXPECT_TRUE(a.is_element("a"));
    EXPECT_EQ(a.parent, &root);
    EXPECT_EQ(a.loc, Loc(0));
    EXPECT_FALSE(a.component);
    EXPECT_FALSE(a.custom_element);
    EXPECT_FALSE(a.fragment);

    ASSERT_EQ(a.attrs.size(), 2u);
    EXPECT_EQ(a.attrs[0].type, AttributeType::Expression);
    EXPECT_EQ(a.attrs[0].key, "href");
    EXPECT_EQ(a.attrs[0].val, "url");
    EXPECT_EQ(a.attrs[0].key_loc, Loc(3));
    EXPECT_EQ(a.attrs[0].val_loc, Loc(9));
    EXPECT_EQ(a.attrs[1].ns, "xlink");
    EXPECT_FALSE(a.attrs[1].key_loc.has_value());

    const Node& text = *a.children[0];
    EXPECT_EQ(text.type, NodeType::Text);
    EXPECT_EQ(text.data, "x");
    EXPECT_EQ(text.parent, &a);
}

TEST(DocumentLoaderTest, ReadsEveryAttributeType) {
    LoadedDocument loaded = load(R"json({
        "children": [{"type": "element", "data": "div", "attributes": [
            {"type": "quoted", "key": "a"},
            {"type": "empty", "key": "b"},
            {"type": "expression", "key": "c"},
            {"type": "spread", "key": "d"},
            {"type": "shorthand", "key": "e"},
            {"type": "template-literal", "key": "f"}
        ]}]
    })json");

    const auto& attrs = loaded.document->root.children[0]->attrs;
    ASSERT_EQ(attrs.size(), 6u);
    EXPECT_EQ(attrs[0].type, AttributeType::Quoted);
    EXPECT_EQ(attrs[1].type, AttributeType::Empty);
    EXPECT_EQ(attrs[2].type, AttributeType::Expression);
    EXPECT_EQ(attrs[3].type, AttributeType::Spread);
    EXPECT_EQ(attrs[4].type, AttributeType::Shorthand);
    EXPECT_EQ(attrs[5].type, AttributeType::TemplateLiteral);
}

TEST(DocumentLoaderTest, DerivesElementFlagsFromTagName) {
    LoadedDocument loaded = load(R"json({
        "children": [
            {"type": "element", "data": "Card"},
            {"type": "element", "data": "ui.button"},
            {"type": "element", "data": "my-el"},
            {"type": "element", "data": ""},
            {"type": "element", "data": "Fragment"},
            {"type": "element", "data": "Odd", "component": false}
        ]
    })json");

    const auto& children = loaded.document->root.children;
    EXPECT_TRUE(children[0]->component);
    EXPECT_TRUE(children[1]->component);
    EXPECT_TRUE(children[2]->custom_element);
    EXPECT_FALSE(children[2]->component);
    EXPECT_TRUE(children[3]->fragment);
    EXPECT_TRUE(children[4]->fragment);
    EXPECT_FALSE(children[5]->component);
}

TEST(DocumentLoaderTest, CollectsComponentsScriptsAndStyles) {
    LoadedDocument loaded = load(R"json({
        "children": [
            {"type": "element", "data": "Counter", "attributes": [
                {"type": "empty", "key": "client:load"}
            ]},
            {"type": "element", "data": "div", "children": [
                {"type": "element", "data": "Chart", "attributes": [
                    {"type": "quoted", "key": "client:only", "value": "react"}
                ]},
                {"type": "element", "data": "Static"}
            ]},
            {"type": "element", "data": "script", "attributes": [{"type": "empty", "key": "hoist"}]},
            {"type": "element", "data": "script"},
            {"type": "element", "data": "style"},
            {"type": "element", "data": "style", "attributes": [
                {"type": "expression", "key": "define:vars", "value": "{a}"}
            ]}
        ]
    })json");

    const Document& doc = *loaded.document;
    ASSERT_EQ(doc.hydrated_components.size(), 1u);
    EXPECT_EQ(doc.hydrated_components[0]->data, "Counter");
    ASSERT_EQ(doc.client_only_components.size(), 1u);
    EXPECT_EQ(doc.client_only_components[0]->data, "Chart");
    EXPECT_EQ(doc.scripts.size(), 1u);
    ASSERT_EQ(doc.styles.size(), 1u);
    EXPECT_FALSE(has_attribute(*doc.styles[0], "define:vars"));
}

TEST(DocumentLoaderTest, SourceIsOptional) {
    LoadedDocument loaded = load(R"json({"children": []})json");
    EXPECT_FALSE(loaded.source.has_value());
    EXPECT_TRUE(loaded.document->root.children.empty());
}

TEST(DocumentLoaderTest, RejectsMalformedInput) {
    EXPECT_THROW(load("{ not json"), std::runtime_error);
    EXPECT_THROW(load(R"json({"children": [{"type": "widget"}]})json"), std::runtime_error);
    EXPECT_THROW(load(R"json({"children": [{"type": "element", "attributes": [
        {"type": "bogus", "key": "x"}]}]})json"), std::runtime_error);
    EXPECT_THROW(load(R"json({"children": [{"type": "text", "loc": "abc"}]})json"),
                 std::runtime_error);
}

TEST(DocumentLoaderTest, MissingFileThrows) {
    EXPECT_THROW(load_document_file("/nonexistent/tree.json"), std::runtime_error);
}
