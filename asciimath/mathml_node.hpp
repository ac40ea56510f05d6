// mathml_node.hpp - MathML output tree and serializer
//
// Translation builds a tree of MathNode elements owned by a MathDocument.
// A Fragment node is a transparent sequence: appending it to a parent splices
// its children, so fragments never appear inside an element's child list.

#ifndef ASCIIMATH_MATHML_NODE_HPP
#define ASCIIMATH_MATHML_NODE_HPP

#include "../lib/strbuf.h"
#include <cstddef>
#include <deque>
#include <string>
#include <vector>

namespace asciimath {

enum class MathNodeType {
    Element,    // <tag attrs>children or text</tag>
    Fragment,   // sequence without markup of its own
};

inline const char* math_node_type_name(MathNodeType t) {
    static const char* names[] = { "element", "fragment" };
    return names[(int)t];
}

struct MathAttr {
    std::string name;
    std::string value;
};

struct MathNode {
    MathNodeType type;
    std::string tag;                  // empty for fragments
    std::string text;                 // token content (mi, mo, mn, mtext)
    std::vector<MathAttr> attrs;
    std::vector<MathNode*> children;  // never contains fragments
};

// ============================================================================
// MathDocument - owns every node created during one translation
// ============================================================================

class MathDocument {
public:
    MathDocument() : root_(nullptr) {}

    MathDocument(const MathDocument&) = delete;
    MathDocument& operator=(const MathDocument&) = delete;

    // Empty element: <tag></tag>
    MathNode* element(const char* tag);

    // Token element carrying text: <mi>x</mi>
    MathNode* token(const char* tag, const std::string& text);

    // Empty fragment
    MathNode* fragment();

    // <tag>a b c</tag>, skipping null arguments
    MathNode* wrap(const char* tag, MathNode* a, MathNode* b = nullptr, MathNode* c = nullptr);

    // <merror><mtext>message</mtext></merror>
    MathNode* error(const std::string& message);

    MathNode* root() const { return root_; }
    void setRoot(MathNode* root) { root_ = root; }

    size_t nodeCount() const { return nodes_.size(); }

private:
    MathNode* alloc(MathNodeType type, const char* tag);

    std::deque<MathNode> nodes_;    // stable addresses
    MathNode* root_;
};

// Append child to parent; fragments are spliced, null children ignored
void math_node_append(MathNode* parent, MathNode* child);

void math_node_set_attr(MathNode* node, const char* name, const std::string& value);
const char* math_node_get_attr(const MathNode* node, const char* name);

// True for null or a fragment with no children
bool math_node_is_empty(const MathNode* node);

// Concatenated token text of the subtree
std::string math_node_text_content(const MathNode* node);

// ============================================================================
// Serialization
// ============================================================================

// Append markup for node to sb. indent 0 = compact single line, otherwise
// one element per line indented by `indent` spaces per level
void serialize_mathml(StrBuf* sb, const MathNode* node, int indent = 0);

std::string mathml_to_string(const MathNode* node, int indent = 0);

// Escape & < > " for text and attribute content
void append_escaped(StrBuf* sb, const char* text, size_t len);

} // namespace asciimath

#endif // ASCIIMATH_MATHML_NODE_HPP
