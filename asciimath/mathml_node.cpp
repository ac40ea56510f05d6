// mathml_node.cpp - MathML output tree and serializer

#include "mathml_node.hpp"
#include <string.h>

namespace asciimath {

// ============================================================================
// MathDocument
// ============================================================================

MathNode* MathDocument::alloc(MathNodeType type, const char* tag) {
    nodes_.emplace_back();
    MathNode* node = &nodes_.back();
    node->type = type;
    if (tag) node->tag = tag;
    return node;
}

MathNode* MathDocument::element(const char* tag) {
    return alloc(MathNodeType::Element, tag);
}

MathNode* MathDocument::token(const char* tag, const std::string& text) {
    MathNode* node = alloc(MathNodeType::Element, tag);
    node->text = text;
    return node;
}

MathNode* MathDocument::fragment() {
    return alloc(MathNodeType::Fragment, nullptr);
}

MathNode* MathDocument::wrap(const char* tag, MathNode* a, MathNode* b, MathNode* c) {
    MathNode* node = element(tag);
    math_node_append(node, a);
    math_node_append(node, b);
    math_node_append(node, c);
    return node;
}

MathNode* MathDocument::error(const std::string& message) {
    return wrap("merror", token("mtext", message));
}

// ============================================================================
// Tree helpers
// ============================================================================

void math_node_append(MathNode* parent, MathNode* child) {
    if (!parent || !child) return;
    if (child->type == MathNodeType::Fragment) {
        for (MathNode* grandchild : child->children) {
            parent->children.push_back(grandchild);
        }
        return;
    }
    parent->children.push_back(child);
}

void math_node_set_attr(MathNode* node, const char* name, const std::string& value) {
    if (!node || !name) return;
    for (MathAttr& attr : node->attrs) {
        if (attr.name == name) {
            attr.value = value;
            return;
        }
    }
    node->attrs.push_back(MathAttr{name, value});
}

const char* math_node_get_attr(const MathNode* node, const char* name) {
    if (!node || !name) return nullptr;
    for (const MathAttr& attr : node->attrs) {
        if (attr.name == name) return attr.value.c_str();
    }
    return nullptr;
}

bool math_node_is_empty(const MathNode* node) {
    return !node || (node->type == MathNodeType::Fragment && node->children.empty());
}

static void collect_text(const MathNode* node, std::string* out) {
    out->append(node->text);
    for (const MathNode* child : node->children) {
        collect_text(child, out);
    }
}

std::string math_node_text_content(const MathNode* node) {
    std::string text;
    if (node) collect_text(node, &text);
    return text;
}

// ============================================================================
// Serialization
// ============================================================================

void append_escaped(StrBuf* sb, const char* text, size_t len) {
    size_t run = 0;     // start of the pending unescaped run
    for (size_t i = 0; i < len; i++) {
        const char* entity = nullptr;
        switch (text[i]) {
            case '&': entity = "&amp;"; break;
            case '<': entity = "&lt;"; break;
            case '>': entity = "&gt;"; break;
            case '"': entity = "&quot;"; break;
            default: break;
        }
        if (entity) {
            strbuf_append_str_n(sb, text + run, i - run);
            strbuf_append_str(sb, entity);
            run = i + 1;
        }
    }
    strbuf_append_str_n(sb, text + run, len - run);
}

static void serialize_open_tag(StrBuf* sb, const MathNode* node) {
    strbuf_append_char(sb, '<');
    strbuf_append_str(sb, node->tag.c_str());
    for (const MathAttr& attr : node->attrs) {
        strbuf_append_char(sb, ' ');
        strbuf_append_str(sb, attr.name.c_str());
        strbuf_append_str(sb, "=\"");
        append_escaped(sb, attr.value.c_str(), attr.value.length());
        strbuf_append_char(sb, '"');
    }
}

static void serialize_node(StrBuf* sb, const MathNode* node, int indent, int depth) {
    if (node->type == MathNodeType::Fragment) {
        for (const MathNode* child : node->children) {
            serialize_node(sb, child, indent, depth);
        }
        return;
    }

    bool pretty = indent > 0;
    if (pretty) strbuf_append_char_n(sb, ' ', (size_t)(indent * depth));

    serialize_open_tag(sb, node);

    // mspace is the only element written self-closing
    if (node->children.empty() && node->text.empty() && node->tag == "mspace") {
        strbuf_append_str(sb, "/>");
        if (pretty) strbuf_append_char(sb, '\n');
        return;
    }
    strbuf_append_char(sb, '>');

    append_escaped(sb, node->text.c_str(), node->text.length());
    if (!node->children.empty()) {
        if (pretty) strbuf_append_char(sb, '\n');
        for (const MathNode* child : node->children) {
            serialize_node(sb, child, indent, depth + 1);
        }
        if (pretty) strbuf_append_char_n(sb, ' ', (size_t)(indent * depth));
    }

    strbuf_append_str(sb, "</");
    strbuf_append_str(sb, node->tag.c_str());
    strbuf_append_char(sb, '>');
    if (pretty) strbuf_append_char(sb, '\n');
}

void serialize_mathml(StrBuf* sb, const MathNode* node, int indent) {
    if (!sb || !node) return;
    serialize_node(sb, node, indent < 0 ? 0 : indent, 0);
}

std::string mathml_to_string(const MathNode* node, int indent) {
    StrBuf* sb = strbuf_new_cap(256);
    if (!sb) return std::string();
    serialize_mathml(sb, node, indent);
    std::string result(sb->str, sb->length);
    strbuf_free(sb);
    return result;
}

} // namespace asciimath
