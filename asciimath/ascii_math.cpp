// ascii_math.cpp - AsciiMath grammar and MathML translation
//
// Three mutually recursive levels build the output tree:
//   simple expression        one symbol, a bracket group or a matrix; argument
//                            taking symbols call back for their arguments
//   intermediate expression  simple expression with optional `_` and `^`
//   expression               run of intermediate expressions up to a
//                            terminator, binding one `/` between neighbours
// References: https://asciimath.org/

#include "ascii_math.hpp"
#include "ascii_scanner.hpp"
#include "math_fonts.hpp"
#include "../lib/log.h"
#include <string.h>

namespace asciimath {

struct ParseContext {
    MathDocument* doc;
    AsciiScanner scanner;

    ParseContext(MathDocument* d, const char* text, size_t len, ParseErrorList* errors)
        : doc(d), scanner(text, len, errors) {}
};

static MathNode* parse_simple(ParseContext& ctx, ScannedSymbol* first);
static MathNode* parse_intermediate(ParseContext& ctx);
static MathNode* parse_expression(ParseContext& ctx);
static MathNode* parse_matrix(ParseContext& ctx, const ScannedSymbol& open);

// ============================================================================
// Helpers
// ============================================================================

static bool is_terminator(ParseContext& ctx, const ScannedSymbol& sym) {
    switch (sym.kind()) {
        case SymbolKind::EndOfInput:
        case SymbolKind::RightBracket:
            return true;
        case SymbolKind::MatrixCellSeparator:
        case SymbolKind::MatrixRowSeparator:
        case SymbolKind::MatrixRightBracket:
            return ctx.scanner.matrixDepth() > 0;
        default:
            return false;
    }
}

// Script and fraction slots need exactly one node
static MathNode* as_single(ParseContext& ctx, MathNode* node) {
    if (node && node->type == MathNodeType::Fragment) {
        MathNode* row = ctx.doc->element("mrow");
        math_node_append(row, node);
        return row;
    }
    return node;
}

// <mo> for a bracket, nullptr for an invisible one
static MathNode* render_bracket(ParseContext& ctx, const ScannedSymbol& sym) {
    if (!sym.symbol->output) return nullptr;
    return ctx.doc->token("mo", sym.symbol->output);
}

static std::string substitute(ParseContext& ctx, const char* text, size_t len) {
    std::string out;
    font_substitute_text(ctx.scanner.currentFont(), text, len, &out);
    return out;
}

static MathNode* report_error(ParseContext& ctx, size_t offset, ParseErrorCode code, const char* message) {
    ctx.scanner.reportError(offset, code, message);
    return ctx.doc->error(message);
}

// Argument read as plain text: raw bracket content when a bracket follows,
// otherwise the text of the next simple expression
static std::string parse_text_argument(ParseContext& ctx) {
    std::string raw;
    if (ctx.scanner.scanBracketedText(&raw)) return raw;
    return math_node_text_content(parse_simple(ctx, nullptr));
}

// ============================================================================
// Symbol rendering
// ============================================================================

// `first` receives the symbol a font scope applies to, so scripts on the
// scoped symbol keep its under/over placement
static MathNode* render_symbol(ParseContext& ctx, const ScannedSymbol& sym, ScannedSymbol* first) {
    MathDocument* doc = ctx.doc;
    const MathSymbol* def = sym.symbol;

    switch (def->action) {
    case SymbolAction::Identifier:
        return doc->token("mi", substitute(ctx, def->output, strlen(def->output)));

    case SymbolAction::Operator:
        return doc->token("mo", def->output);

    case SymbolAction::TextOperator: {
        MathNode* space_before = doc->element("mspace");
        math_node_set_attr(space_before, "width", "1ex");
        MathNode* space_after = doc->element("mspace");
        math_node_set_attr(space_after, "width", "1ex");
        return doc->wrap("mrow", space_before, doc->token("mtext", def->output), space_after);
    }

    case SymbolAction::UnaryOperator: {
        MathNode* op = doc->token("mo", def->output);
        return doc->wrap("mrow", op, parse_simple(ctx, nullptr));
    }

    case SymbolAction::UnaryWrap:
        return doc->wrap(def->tag, parse_simple(ctx, nullptr));

    case SymbolAction::UnaryText: {
        std::string text = parse_text_argument(ctx);
        return doc->token(def->tag, substitute(ctx, text.c_str(), text.length()));
    }

    case SymbolAction::UnaryAccent: {
        MathNode* arg = as_single(ctx, parse_simple(ctx, nullptr));
        return doc->wrap(def->tag, arg, doc->token("mo", def->output));
    }

    case SymbolAction::UnarySurround: {
        MathNode* left = doc->token("mo", def->output);
        MathNode* arg = parse_simple(ctx, nullptr);
        return doc->wrap("mrow", left, arg, doc->token("mo", def->extra));
    }

    case SymbolAction::UnaryAttribute: {
        MathNode* node = doc->wrap(def->tag, parse_simple(ctx, nullptr));
        math_node_set_attr(node, def->extra, def->output);
        return node;
    }

    case SymbolAction::UnaryFontScope: {
        FontScope scope(&ctx.scanner, def->font);
        return parse_simple(ctx, first);
    }

    case SymbolAction::BinaryWrap: {
        MathNode* first = as_single(ctx, parse_simple(ctx, nullptr));
        MathNode* second = as_single(ctx, parse_simple(ctx, nullptr));
        if (def->flags & SYMBOL_FLAG_SWAP_ARGS) {
            return doc->wrap(def->tag, second, first);
        }
        return doc->wrap(def->tag, first, second);
    }

    case SymbolAction::BinaryAttribute: {
        std::string value = parse_text_argument(ctx);
        MathNode* node = doc->wrap(def->tag, parse_simple(ctx, nullptr));
        math_node_set_attr(node, def->extra, value);
        return node;
    }

    case SymbolAction::LeftBracket:
    case SymbolAction::RightBracket: {
        MathNode* bracket = render_bracket(ctx, sym);
        return bracket ? bracket : doc->fragment();
    }

    case SymbolAction::MatrixOpen:
        return parse_matrix(ctx, sym);

    case SymbolAction::MatrixClose:
        return report_error(ctx, sym.start, ParseErrorCode::UnmatchedClosingBracket,
                            "Unmatched closing bracket");

    case SymbolAction::CellSeparator:
    case SymbolAction::RowSeparator:
        return doc->token("mo", def->output);

    case SymbolAction::Text:
        return doc->token("mtext", substitute(ctx, sym.text, sym.text_len));

    case SymbolAction::Number:
        return doc->token("mn", std::string(sym.text, sym.text_len));

    case SymbolAction::Error:
        return doc->error(sym.invalid_utf8 ? std::string("\uFFFD") : std::string(sym.text, sym.text_len));

    case SymbolAction::EndOfInput:
        return doc->fragment();
    }

    log_error("ascii_math: unhandled symbol action %d", (int)def->action);
    return doc->fragment();
}

// ============================================================================
// Grammar
// ============================================================================

static MathNode* parse_bracket_group(ParseContext& ctx, const ScannedSymbol& open) {
    MathNode* row = ctx.doc->element("mrow");
    math_node_append(row, render_bracket(ctx, open));
    math_node_append(row, parse_expression(ctx));

    ScannedSymbol close = ctx.scanner.peek();
    if (close.kind() == SymbolKind::RightBracket) {
        ctx.scanner.commit(close);
        math_node_append(row, render_bracket(ctx, close));
    } else {
        // end of input or a matrix separator; the latter is left for the matrix
        math_node_append(row, report_error(ctx, close.start, ParseErrorCode::MissingClosingParen,
                                           "Missing closing paren"));
    }
    return row;
}

static MathNode* parse_simple(ParseContext& ctx, ScannedSymbol* first) {
    DepthGuard guard(&ctx.scanner);
    ScannedSymbol sym = ctx.scanner.next();
    if (first) *first = sym;

    if (guard.exceeded()) {
        return report_error(ctx, sym.start, ParseErrorCode::NestingTooDeep, "Expression nested too deeply");
    }

    switch (sym.kind()) {
        case SymbolKind::LeftBracket:
            return parse_bracket_group(ctx, sym);
        case SymbolKind::MatrixLeftBracket:
            return parse_matrix(ctx, sym);
        default:
            return render_symbol(ctx, sym, first);
    }
}

static MathNode* parse_intermediate(ParseContext& ctx) {
    ScannedSymbol base_sym;
    MathNode* base = parse_simple(ctx, &base_sym);
    MathNode* sub = nullptr;
    MathNode* sup = nullptr;

    ScannedSymbol next = ctx.scanner.peek();
    if (next.is("_")) {
        ctx.scanner.commit(next);
        sub = parse_simple(ctx, nullptr);
        next = ctx.scanner.peek();
    }
    if (next.is("^")) {
        ctx.scanner.commit(next);
        sup = parse_simple(ctx, nullptr);
    }

    if (math_node_is_empty(sub)) sub = nullptr;
    if (math_node_is_empty(sup)) sup = nullptr;
    if (!sub && !sup) return base;

    base = as_single(ctx, base);
    sub = as_single(ctx, sub);
    sup = as_single(ctx, sup);

    bool under_over = base_sym.kind() == SymbolKind::UnderOver;
    if (sub && sup) return ctx.doc->wrap(under_over ? "munderover" : "msubsup", base, sub, sup);
    if (sub) return ctx.doc->wrap(under_over ? "munder" : "msub", base, sub);
    return ctx.doc->wrap(under_over ? "mover" : "msup", base, sup);
}

static MathNode* parse_expression(ParseContext& ctx) {
    MathNode* seq = ctx.doc->fragment();

    while (!is_terminator(ctx, ctx.scanner.peek())) {
        MathNode* term = parse_intermediate(ctx);

        // a single `/` binds the neighbouring terms; a second one in a row
        // renders as the plain operator
        ScannedSymbol next = ctx.scanner.peek();
        if (next.is("/")) {
            ctx.scanner.commit(next);
            MathNode* denominator = parse_intermediate(ctx);
            term = ctx.doc->wrap("mfrac", as_single(ctx, term), as_single(ctx, denominator));
        }
        math_node_append(seq, term);
    }
    return seq;
}

// ============================================================================
// Matrix
// ============================================================================

static MathNode* parse_matrix_row(ParseContext& ctx) {
    MathNode* row = ctx.doc->element("mtr");

    while (true) {
        MathNode* cell = ctx.doc->element("mtd");
        math_node_append(cell, parse_expression(ctx));

        ScannedSymbol next = ctx.scanner.peek();
        while (next.kind() == SymbolKind::RightBracket) {
            ctx.scanner.commit(next);
            math_node_append(cell, report_error(ctx, next.start, ParseErrorCode::UnmatchedClosingBracket,
                                                "Unmatched closing bracket"));
            math_node_append(cell, parse_expression(ctx));
            next = ctx.scanner.peek();
        }
        math_node_append(row, cell);

        switch (next.kind()) {
            case SymbolKind::MatrixCellSeparator:
                ctx.scanner.commit(next);
                break;
            case SymbolKind::MatrixRowSeparator:
                ctx.scanner.commit(next);
                return row;
            default:
                // matrix close or end of input, left for the caller
                return row;
        }
    }
}

static MathNode* parse_matrix(ParseContext& ctx, const ScannedSymbol& open) {
    MathNode* table = ctx.doc->element("mtable");
    {
        MatrixScope scope(&ctx.scanner);
        while (true) {
            ScannedSymbol next = ctx.scanner.peek();
            if (next.kind() == SymbolKind::MatrixRightBracket || next.kind() == SymbolKind::EndOfInput) break;
            math_node_append(table, parse_matrix_row(ctx));
        }
    }

    MathNode* left = render_bracket(ctx, open);
    MathNode* right = nullptr;
    ScannedSymbol close = ctx.scanner.peek();
    if (close.kind() == SymbolKind::MatrixRightBracket) {
        ctx.scanner.commit(close);
        right = render_bracket(ctx, close);
    } else {
        right = report_error(ctx, close.start, ParseErrorCode::MissingClosingBracket,
                             "Missing closing bracket");
    }

    log_debug("ascii_math: matrix with %zu rows", table->children.size());
    if (!left && !right) return table;
    return ctx.doc->wrap("mrow", left, table, right);
}

// ============================================================================
// Entry points
// ============================================================================

// Whole input; a closing bracket with nothing open is reported and skipped
static MathNode* parse_top(ParseContext& ctx) {
    MathNode* content = ctx.doc->fragment();
    while (true) {
        math_node_append(content, parse_expression(ctx));

        ScannedSymbol next = ctx.scanner.peek();
        if (next.kind() == SymbolKind::EndOfInput) break;

        ctx.scanner.commit(next);
        math_node_append(content, report_error(ctx, next.start, ParseErrorCode::UnmatchedClosingBracket,
                                               "Unmatched closing bracket"));
    }
    return content;
}

MathNode* translate_document(MathDocument* doc, const char* text, size_t len,
                             const TranslateOptions& opts, ParseErrorList* errors) {
    if (!text) {
        text = "";
        len = 0;
    }
    if (errors) errors->setMaxErrors(opts.max_errors);

    log_debug("ascii_math: translating '%.*s'", (int)len, text);
    ParseContext ctx(doc, text, len, errors);

    MathNode* style = doc->element("mstyle");
    math_node_set_attr(style, "displaystyle", "true");
    math_node_append(style, parse_top(ctx));

    MathNode* math = doc->element("math");
    math_node_set_attr(math, "display", opts.display_inline ? "inline" : "block");
    math_node_append(math, style);

    doc->setRoot(math);
    log_debug("ascii_math: %zu nodes", doc->nodeCount());
    return math;
}

std::string translate(const std::string& text, const TranslateOptions& opts, ParseErrorList* errors) {
    MathDocument doc;
    MathNode* root = translate_document(&doc, text.c_str(), text.length(), opts, errors);
    return mathml_to_string(root, opts.indent);
}

std::string translate(const std::string& text, bool display_inline) {
    TranslateOptions opts;
    opts.display_inline = display_inline;
    return translate(text, opts, nullptr);
}

std::string translate(const char* text, bool display_inline) {
    return translate(std::string(text ? text : ""), display_inline);
}

} // namespace asciimath
