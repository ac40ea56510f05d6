// test_mathml_node_gtest.cpp - MathML tree and serializer tests

#include <gtest/gtest.h>
#include <string>

#include "asciimath/mathml_node.hpp"

using namespace asciimath;

class MathNodeTest : public ::testing::Test {
protected:
    MathDocument doc;
};

TEST_F(MathNodeTest, TokenElement) {
    EXPECT_EQ(mathml_to_string(doc.token("mi", "x")), "<mi>x</mi>");
}

TEST_F(MathNodeTest, EmptyElementIsNotSelfClosing) {
    EXPECT_EQ(mathml_to_string(doc.element("mrow")), "<mrow></mrow>");
    EXPECT_EQ(mathml_to_string(doc.element("mtable")), "<mtable></mtable>");
}

TEST_F(MathNodeTest, MspaceSelfCloses) {
    MathNode* space = doc.element("mspace");
    math_node_set_attr(space, "width", "1ex");
    EXPECT_EQ(mathml_to_string(space), "<mspace width=\"1ex\"/>");
}

TEST_F(MathNodeTest, WrapSkipsNull) {
    MathNode* node = doc.wrap("msub", doc.token("mi", "x"), nullptr, doc.token("mn", "2"));
    ASSERT_EQ(node->children.size(), 2u);
    EXPECT_EQ(mathml_to_string(node), "<msub><mi>x</mi><mn>2</mn></msub>");
}

TEST_F(MathNodeTest, FragmentsAreSpliced) {
    MathNode* seq = doc.fragment();
    math_node_append(seq, doc.token("mi", "a"));
    math_node_append(seq, doc.token("mo", "+"));

    MathNode* row = doc.wrap("mrow", seq, doc.token("mi", "b"));
    ASSERT_EQ(row->children.size(), 3u);
    for (const MathNode* child : row->children) {
        EXPECT_EQ(child->type, MathNodeType::Element);
    }
    EXPECT_EQ(mathml_to_string(row), "<mrow><mi>a</mi><mo>+</mo><mi>b</mi></mrow>");
}

TEST_F(MathNodeTest, FragmentSerializesChildren) {
    MathNode* seq = doc.fragment();
    math_node_append(seq, doc.token("mi", "a"));
    math_node_append(seq, doc.token("mi", "b"));
    EXPECT_EQ(mathml_to_string(seq), "<mi>a</mi><mi>b</mi>");
    EXPECT_EQ(mathml_to_string(doc.fragment()), "");
}

TEST_F(MathNodeTest, Emptiness) {
    EXPECT_TRUE(math_node_is_empty(nullptr));
    EXPECT_TRUE(math_node_is_empty(doc.fragment()));
    EXPECT_FALSE(math_node_is_empty(doc.element("mrow")));
    MathNode* seq = doc.fragment();
    math_node_append(seq, doc.token("mi", "a"));
    EXPECT_FALSE(math_node_is_empty(seq));
}

TEST_F(MathNodeTest, Attributes) {
    MathNode* style = doc.element("mstyle");
    math_node_set_attr(style, "mathcolor", "red");
    math_node_set_attr(style, "displaystyle", "true");
    math_node_set_attr(style, "mathcolor", "blue");
    ASSERT_EQ(style->attrs.size(), 2u);
    EXPECT_STREQ(math_node_get_attr(style, "mathcolor"), "blue");
    EXPECT_EQ(math_node_get_attr(style, "id"), nullptr);
    EXPECT_EQ(mathml_to_string(style), "<mstyle mathcolor=\"blue\" displaystyle=\"true\"></mstyle>");
}

TEST_F(MathNodeTest, EscapesTextAndAttributes) {
    MathNode* text = doc.token("mtext", "a<b & \"c\" > d");
    math_node_set_attr(text, "class", "x\"y&z");
    EXPECT_EQ(mathml_to_string(text),
              "<mtext class=\"x&quot;y&amp;z\">a&lt;b &amp; &quot;c&quot; &gt; d</mtext>");
}

TEST_F(MathNodeTest, MultibyteTextPassesThrough) {
    EXPECT_EQ(mathml_to_string(doc.token("mo", "\xE2\x88\x91")), "<mo>\xE2\x88\x91</mo>");
}

TEST_F(MathNodeTest, ErrorNode) {
    EXPECT_EQ(mathml_to_string(doc.error("Missing closing paren")),
              "<merror><mtext>Missing closing paren</mtext></merror>");
}

TEST_F(MathNodeTest, TextContent) {
    MathNode* frac = doc.wrap("mfrac", doc.token("mi", "a"), doc.wrap("mrow", doc.token("mn", "1"), doc.token("mo", "+")));
    EXPECT_EQ(math_node_text_content(frac), "a1+");
    EXPECT_EQ(math_node_text_content(nullptr), "");
}

TEST_F(MathNodeTest, PrettyPrinting) {
    MathNode* frac = doc.wrap("mfrac", doc.token("mn", "1"), doc.wrap("mrow", doc.token("mi", "x"), doc.element("mspace")));
    EXPECT_EQ(mathml_to_string(frac, 2),
              "<mfrac>\n"
              "  <mn>1</mn>\n"
              "  <mrow>\n"
              "    <mi>x</mi>\n"
              "    <mspace/>\n"
              "  </mrow>\n"
              "</mfrac>\n");
}

TEST_F(MathNodeTest, SerializeAppendsToBuffer) {
    StrBuf* sb = strbuf_create("prefix ");
    serialize_mathml(sb, doc.token("mi", "x"));
    EXPECT_STREQ(sb->str, "prefix <mi>x</mi>");
    serialize_mathml(sb, nullptr);
    serialize_mathml(nullptr, doc.token("mi", "y"));
    EXPECT_STREQ(sb->str, "prefix <mi>x</mi>");
    strbuf_free(sb);
}

TEST_F(MathNodeTest, DocumentOwnsNodes) {
    EXPECT_EQ(doc.nodeCount(), 0u);
    EXPECT_EQ(doc.root(), nullptr);
    MathNode* math = doc.wrap("math", doc.token("mi", "x"));
    doc.setRoot(math);
    EXPECT_EQ(doc.root(), math);
    EXPECT_EQ(doc.nodeCount(), 2u);
    EXPECT_STREQ(math_node_type_name(MathNodeType::Fragment), "fragment");
}
