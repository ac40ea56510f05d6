// math_symbols.cpp - AsciiMath symbol table
//
// Buckets are authored by hand: inside each bucket a pattern must come before
// every shorter pattern that is a prefix of it. Declaration order is
// significant and is checked by test_math_symbols_gtest.cpp.

#include "math_symbols.hpp"
#include "math_fonts.hpp"
#include "../lib/log.h"
#include <string.h>

namespace asciimath {

// ============================================================================
// Symbol constructors
// ============================================================================

static constexpr MathSymbol make_symbol(SymbolKind kind, SymbolAction action, const char* input,
                                        const char* output, const char* tag = nullptr,
                                        const char* extra = nullptr, const FontTable* font = nullptr,
                                        uint8_t flags = 0) {
    return MathSymbol{kind, action, input, output, tag, extra, font, flags};
}

static constexpr MathSymbol ident(const char* input, const char* output = nullptr) {
    return make_symbol(SymbolKind::Default, SymbolAction::Identifier, input, output ? output : input);
}

static constexpr MathSymbol oper(const char* input, const char* output) {
    return make_symbol(SymbolKind::Default, SymbolAction::Operator, input, output);
}

static constexpr MathSymbol text_oper(const char* input, const char* output = nullptr) {
    return make_symbol(SymbolKind::Default, SymbolAction::TextOperator, input, output ? output : input);
}

static constexpr MathSymbol under_over(const char* input, const char* output = nullptr) {
    return make_symbol(SymbolKind::UnderOver, SymbolAction::Operator, input, output ? output : input);
}

// function names such as sin, log: <mrow><mo>sin</mo>arg</mrow>
static constexpr MathSymbol unary(const char* input, const char* output = nullptr) {
    return make_symbol(SymbolKind::Default, SymbolAction::UnaryOperator, input, output ? output : input);
}

static constexpr MathSymbol unary_wrap(const char* input, const char* tag) {
    return make_symbol(SymbolKind::Default, SymbolAction::UnaryWrap, input, nullptr, tag);
}

static constexpr MathSymbol unary_text(const char* input) {
    return make_symbol(SymbolKind::Default, SymbolAction::UnaryText, input, nullptr, "mtext");
}

static constexpr MathSymbol unary_accent(const char* input, const char* tag, const char* accent) {
    return make_symbol(SymbolKind::UnderOver, SymbolAction::UnaryAccent, input, accent, tag);
}

static constexpr MathSymbol unary_surround(const char* input, const char* left, const char* right) {
    return make_symbol(SymbolKind::Default, SymbolAction::UnarySurround, input, left, nullptr, right);
}

static constexpr MathSymbol unary_attr(const char* input, const char* tag, const char* attr, const char* value) {
    return make_symbol(SymbolKind::Default, SymbolAction::UnaryAttribute, input, value, tag, attr);
}

static constexpr MathSymbol font_scope(const char* input, const FontTable* font) {
    return make_symbol(SymbolKind::Default, SymbolAction::UnaryFontScope, input, nullptr, nullptr, nullptr, font);
}

static constexpr MathSymbol binary_wrap(const char* input, const char* tag, uint8_t flags = 0) {
    return make_symbol(SymbolKind::Default, SymbolAction::BinaryWrap, input, nullptr, tag, nullptr, nullptr, flags);
}

static constexpr MathSymbol binary_attr(const char* input, const char* tag, const char* attr) {
    return make_symbol(SymbolKind::Default, SymbolAction::BinaryAttribute, input, nullptr, tag, attr);
}

static constexpr MathSymbol left_bracket(const char* input, const char* output = nullptr) {
    return make_symbol(SymbolKind::LeftBracket, SymbolAction::LeftBracket, input, output);
}

static constexpr MathSymbol right_bracket(const char* input, const char* output = nullptr) {
    return make_symbol(SymbolKind::RightBracket, SymbolAction::RightBracket, input, output);
}

static constexpr MathSymbol matrix_left(const char* input, const char* output = nullptr) {
    return make_symbol(SymbolKind::MatrixLeftBracket, SymbolAction::MatrixOpen, input, output);
}

static constexpr MathSymbol matrix_right(const char* input, const char* output = nullptr) {
    return make_symbol(SymbolKind::MatrixRightBracket, SymbolAction::MatrixClose, input, output);
}

static constexpr MathSymbol cell_separator(const char* input) {
    return make_symbol(SymbolKind::MatrixCellSeparator, SymbolAction::CellSeparator, input, input);
}

static constexpr MathSymbol row_separator(const char* input) {
    return make_symbol(SymbolKind::MatrixRowSeparator, SymbolAction::RowSeparator, input, input);
}

// ============================================================================
// Lowercase letters
// ============================================================================

static const MathSymbol SYMBOLS_a[] = {
    unary("arcsin"),
    unary("arccos"),
    unary("arctan"),
    ident("alpha", "\u03B1"),
    oper("aleph", "\u2135"),
    unary_surround("abs", "|", "|"),
    text_oper("and"),
    ident("a"),
};

static const MathSymbol SYMBOLS_b[] = {
    font_scope("bbb", &FONT_DOUBLE_STRUCK),
    font_scope("bb", &FONT_BOLD),
    ident("beta", "\u03B2"),
    unary_accent("bar", "mover", "\u00AF"),
    ident("b"),
};

static const MathSymbol SYMBOLS_c[] = {
    unary_attr("cancel", "menclose", "notation", "updiagonalstrike"),
    binary_attr("color", "mstyle", "mathcolor"),
    binary_attr("class", "mrow", "class"),
    oper("cdots", "\u22EF"),
    unary_surround("ceil", "\u2308", "\u2309"),
    unary("cosh"),
    unary("csch"),
    unary("cos"),
    unary("cot"),
    unary("csc"),
    font_scope("cc", &FONT_CALLIGRAPHIC),
    ident("chi", "\u03C7"),
    ident("c"),
};

static const MathSymbol SYMBOLS_d[] = {
    oper("diamonds", "\u22C4"),
    ident("delta", "\u03B4"),
    oper("ddots", "\u22F1"),
    unary_accent("ddot", "mover", ".."),
    oper("darr", "\u2193"),
    oper("del", "\u2202"),
    unary("det"),
    unary_accent("dot", "mover", "."),
    text_oper("dim"),
    ident("d"),
};

static const MathSymbol SYMBOLS_e[] = {
    ident("epsi", "\u03B5"),
    ident("eta", "\u03B7"),
    unary("exp"),
    ident("e"),
};

static const MathSymbol SYMBOLS_f[] = {
    unary_surround("floor", "\u230A", "\u230B"),
    oper("frown", "\u2322"),
    binary_wrap("frac", "mfrac"),
    font_scope("fr", &FONT_FRAKTUR),
    ident("f"),
};

static const MathSymbol SYMBOLS_g[] = {
    ident("gamma", "\u03B3"),
    oper("grad", "\u2207"),
    unary("gcd"),
    text_oper("glb"),
    ident("g"),
};

static const MathSymbol SYMBOLS_h[] = {
    oper("harr", "\u2194"),
    oper("hArr", "\u21D4"),
    unary_accent("hat", "mover", "^"),
    ident("h"),
};

static const MathSymbol SYMBOLS_i[] = {
    ident("iota", "\u03B9"),
    oper("int", "\u222B"),
    oper("in", "\u2208"),
    text_oper("if"),
    binary_attr("id", "mrow", "id"),
    ident("i"),
};

static const MathSymbol SYMBOLS_j[] = {
    ident("j"),
};

static const MathSymbol SYMBOLS_k[] = {
    ident("kappa", "\u03BA"),
    ident("k"),
};

static const MathSymbol SYMBOLS_l[] = {
    ident("lambda", "\u03BB"),
    oper("larr", "\u2190"),
    oper("lArr", "\u21D0"),
    under_over("lim"),
    unary("log"),
    unary("lcm"),
    text_oper("lub"),
    unary("ln"),
    ident("l"),
};

static const MathSymbol SYMBOLS_m[] = {
    under_over("min"),
    under_over("max"),
    text_oper("mod"),
    ident("mu", "\u03BC"),
    ident("m"),
};

static const MathSymbol SYMBOLS_n[] = {
    unary_surround("norm", "\u2225", "\u2225"),
    under_over("nnn", "\u22C2"),
    oper("not", "\u00AC"),
    oper("nn", "\u2229"),
    ident("nu", "\u03BD"),
    ident("n"),
};

static const MathSymbol SYMBOLS_o[] = {
    unary_accent("overarc", "mover", "\u23DC"),
    binary_wrap("overset", "mover", SYMBOL_FLAG_SWAP_ARGS),
    unary_accent("obrace", "mover", "\u23DE"),
    ident("omega", "\u03C9"),
    oper("oint", "\u222E"),
    text_oper("or"),
    oper("o+", "\u2295"),
    oper("ox", "\u2297"),
    oper("o.", "\u2299"),
    oper("oo", "\u221E"),
    ident("o"),
};

static const MathSymbol SYMBOLS_p[] = {
    under_over("prod", "\u220F"),
    ident("prop", "\u221D"),
    ident("phi", "\u03D5"),
    ident("psi", "\u03C8"),
    ident("pi", "\u03C0"),
    ident("p"),
};

static const MathSymbol SYMBOLS_q[] = {
    oper("qquad", "\u00A0\u00A0\u00A0\u00A0"),
    oper("quad", "\u00A0\u00A0"),
    ident("q"),
};

static const MathSymbol SYMBOLS_r[] = {
    oper("rarr", "\u2192"),
    oper("rArr", "\u21D2"),
    binary_wrap("root", "mroot", SYMBOL_FLAG_SWAP_ARGS),
    ident("rho", "\u03C1"),
    ident("r"),
};

static const MathSymbol SYMBOLS_s[] = {
    binary_wrap("stackrel", "mover", SYMBOL_FLAG_SWAP_ARGS),
    oper("setminus", "\\"),
    oper("square", "\u25A1"),
    ident("sigma", "\u03C3"),
    under_over("sube", "\u2286"),
    under_over("supe", "\u2287"),
    unary_wrap("sqrt", "msqrt"),
    unary("sinh"),
    unary("sech"),
    under_over("sum", "\u2211"),
    under_over("sub", "\u2282"),
    under_over("sup", "\u2283"),
    unary("sin"),
    unary("sec"),
    font_scope("sf", &FONT_SANS),
    ident("s"),
};

static const MathSymbol SYMBOLS_t[] = {
    ident("theta", "\u03B8"),
    unary_accent("tilde", "mover", "~"),
    unary_text("text"),
    unary("tanh"),
    unary("tan"),
    ident("tau", "\u03C4"),
    ident("t"),
};

static const MathSymbol SYMBOLS_u[] = {
    binary_wrap("underset", "munder", SYMBOL_FLAG_SWAP_ARGS),
    ident("upsilon", "\u03C5"),
    unary_accent("ubrace", "munder", "\u23DF"),
    oper("uarr", "\u2191"),
    under_over("uuu", "\u22C3"),
    oper("uu", "\u222A"),
    unary_accent("ul", "munder", "\u0332"),
    ident("u"),
};

static const MathSymbol SYMBOLS_v[] = {
    ident("varepsilon", "\u025B"),
    ident("vartheta", "\u03D1"),
    ident("varphi", "\u03C6"),
    oper("vdots", "\u22EE"),
    unary_accent("vec", "mover", "\u2192"),
    under_over("vvv", "\u22C1"),
    oper("vv", "\u2228"),
    ident("v"),
};

static const MathSymbol SYMBOLS_w[] = {
    ident("w"),
};

static const MathSymbol SYMBOLS_x[] = {
    ident("xi", "\u03BE"),
    oper("xx", "\u00D7"),
    ident("x"),
};

static const MathSymbol SYMBOLS_y[] = {
    ident("y"),
};

static const MathSymbol SYMBOLS_z[] = {
    ident("zeta", "\u03B6"),
    ident("z"),
};

// ============================================================================
// Uppercase letters
// ============================================================================

static const MathSymbol SYMBOLS_A[] = {
    unary("Arcsin"),
    unary("Arccos"),
    unary("Arctan"),
    unary_surround("Abs", "|", "|"),
    oper("AA", "\u2200"),
    ident("A"),
};

static const MathSymbol SYMBOLS_B[] = { ident("B") };

static const MathSymbol SYMBOLS_C[] = {
    unary("Cosh"),
    unary("Cos"),
    unary("Cot"),
    unary("Csc"),
    oper("CC", "\u2102"),
    ident("C"),
};

static const MathSymbol SYMBOLS_D[] = {
    oper("Delta", "\u0394"),
    ident("D"),
};

static const MathSymbol SYMBOLS_E[] = {
    oper("EE", "\u2203"),
    ident("E"),
};

static const MathSymbol SYMBOLS_F[] = { ident("F") };

static const MathSymbol SYMBOLS_G[] = {
    oper("Gamma", "\u0393"),
    ident("G"),
};

static const MathSymbol SYMBOLS_H[] = { ident("H") };
static const MathSymbol SYMBOLS_I[] = { ident("I") };
static const MathSymbol SYMBOLS_J[] = { ident("J") };
static const MathSymbol SYMBOLS_K[] = { ident("K") };

static const MathSymbol SYMBOLS_L[] = {
    oper("Lambda", "\u039B"),
    under_over("Lim"),
    unary("Log"),
    unary("Ln"),
    ident("L"),
};

static const MathSymbol SYMBOLS_M[] = { ident("M") };

static const MathSymbol SYMBOLS_N[] = {
    oper("NN", "\u2115"),
    ident("N"),
};

static const MathSymbol SYMBOLS_O[] = {
    oper("Omega", "\u03A9"),
    oper("O/", "\u2205"),
    ident("O"),
};

static const MathSymbol SYMBOLS_P[] = {
    oper("Phi", "\u03A6"),
    ident("Psi", "\u03A8"),
    oper("Pi", "\u03A0"),
    ident("P"),
};

static const MathSymbol SYMBOLS_Q[] = {
    oper("QQ", "\u211A"),
    ident("Q"),
};

static const MathSymbol SYMBOLS_R[] = {
    oper("RR", "\u211D"),
    ident("R"),
};

static const MathSymbol SYMBOLS_S[] = {
    oper("Sigma", "\u03A3"),
    unary("Sinh"),
    unary("Sin"),
    unary("Sec"),
    ident("S"),
};

static const MathSymbol SYMBOLS_T[] = {
    oper("Theta", "\u0398"),
    unary("Tanh"),
    unary("Tan"),
    oper("TT", "\u22A4"),
    ident("T"),
};

static const MathSymbol SYMBOLS_U[] = { ident("U") };
static const MathSymbol SYMBOLS_V[] = { ident("V") };
static const MathSymbol SYMBOLS_W[] = { ident("W") };

static const MathSymbol SYMBOLS_X[] = {
    ident("Xi", "\u039E"),
    ident("X"),
};

static const MathSymbol SYMBOLS_Y[] = { ident("Y") };

static const MathSymbol SYMBOLS_Z[] = {
    oper("ZZ", "\u2124"),
    ident("Z"),
};

// ============================================================================
// Operators, relations and arrows
// ============================================================================

static const MathSymbol SYMBOLS_minus[] = {
    oper("-<=", "\u2AAF"),
    oper("->>", "\u21A0"),
    oper("->", "\u2192"),
    oper("-<", "\u227A"),
    oper("-:", "\u00F7"),
    oper("-=", "\u2261"),
    oper("-+", "\u2213"),
    oper("-", "\u2212"),
};

static const MathSymbol SYMBOLS_star[] = {
    oper("***", "\u22C6"),
    oper("**", "\u2217"),
    oper("*", "\u22C5"),
};

static const MathSymbol SYMBOLS_plus[] = {
    oper("+-", "\u00B1"),
    oper("+", "+"),
};

// "/" renders empty: a bare slash only shows up when a fraction could not bind it
static const MathSymbol SYMBOLS_slash[] = {
    oper("/_\\", "\u25B3"),
    oper("/_", "\u2220"),
    oper("//", "/"),
    oper("/", ""),
};

static const MathSymbol SYMBOLS_backslash[] = {
    oper("\\\\", "\\"),
    oper("\\", "\u00A0"),
};

static const MathSymbol SYMBOLS_bar[] = {
    oper("|><|", "\u22C8"),
    oper("|><", "\u22C9"),
    oper("|->", "\u21A6"),
    oper("|--", "\u22A2"),
    oper("|==", "\u22A8"),
    oper("|__", "\u230A"),
    oper("|~", "\u2308"),
    matrix_right("|:}"),
    left_bracket("|:", "|"),
    matrix_right("|]", "]"),
    matrix_right("|)", ")"),
    matrix_right("|}", "}"),
};

static const MathSymbol SYMBOLS_less[] = {
    oper("<=>", "\u21D4"),
    oper("<=", "\u2264"),
    oper("<<", "\u226A"),
    oper("<", "<"),
};

static const MathSymbol SYMBOLS_greater[] = {
    oper(">->>", "\u2916"),
    oper(">->", "\u21A3"),
    oper("><|", "\u22CA"),
    oper(">-=", "\u2AB0"),
    oper(">=", "\u2265"),
    oper(">-", "\u227B"),
    oper(">>", "\u226B"),
    oper(">", ">"),
};

static const MathSymbol SYMBOLS_equal[] = {
    oper("=>", "\u21D2"),
    oper("=", "="),
};

static const MathSymbol SYMBOLS_at[] = {
    oper("@", "\u2218"),
};

static const MathSymbol SYMBOLS_caret[] = {
    under_over("^^^", "\u22C0"),
    oper("^^", "\u2227"),
    oper("^", ""),
};

static const MathSymbol SYMBOLS_tilde[] = {
    oper("~~", "\u2248"),
    oper("~=", "\u2245"),
    oper("~|", "\u2309"),
    oper("~", "\u223C"),
};

static const MathSymbol SYMBOLS_bang[] = {
    oper("!in", "\u2209"),
    oper("!=", "\u2260"),
    oper("!", "!"),
};

static const MathSymbol SYMBOLS_colon[] = {
    oper(":=", ":="),
    right_bracket(":)", "\u232A"),
    right_bracket(":|", "|"),
    right_bracket(":}"),
    oper(":.", "\u2234"),
    oper(":'", "\u2235"),
    oper(":", ":"),
};

static const MathSymbol SYMBOLS_semicolon[] = {
    row_separator(";;"),
    cell_separator(";"),
};

static const MathSymbol SYMBOLS_comma[] = {
    oper(",", ","),
};

static const MathSymbol SYMBOLS_dot[] = {
    oper("...", "..."),
};

static const MathSymbol SYMBOLS_underscore[] = {
    oper("__|", "\u230B"),
    oper("_|_", "\u22A5"),
    oper("_", ""),
};

static const MathSymbol SYMBOLS_quote[] = {
    oper("'", "\u2032"),
};

// ============================================================================
// Brackets
// ============================================================================

static const MathSymbol SYMBOLS_lparen[] = {
    left_bracket("(:", "\u2329"),
    matrix_left("(|", "("),
    left_bracket("(", "("),
};

static const MathSymbol SYMBOLS_rparen[] = {
    right_bracket(")", ")"),
};

static const MathSymbol SYMBOLS_lsquare[] = {
    matrix_left("[|", "["),
    left_bracket("[", "["),
};

static const MathSymbol SYMBOLS_rsquare[] = {
    right_bracket("]", "]"),
};

static const MathSymbol SYMBOLS_lbrace[] = {
    matrix_left("{:|"),
    left_bracket("{:"),
    matrix_left("{|", "{"),
    left_bracket("{", "{"),
};

static const MathSymbol SYMBOLS_rbrace[] = {
    right_bracket("}", "}"),
};

// ============================================================================
// Bucket registry
// ============================================================================

#define SYMBOL_BUCKET(key, arr) { key, arr, sizeof(arr) / sizeof(arr[0]) }

static const SymbolBucket SYMBOL_BUCKETS[] = {
    SYMBOL_BUCKET('a', SYMBOLS_a), SYMBOL_BUCKET('b', SYMBOLS_b), SYMBOL_BUCKET('c', SYMBOLS_c),
    SYMBOL_BUCKET('d', SYMBOLS_d), SYMBOL_BUCKET('e', SYMBOLS_e), SYMBOL_BUCKET('f', SYMBOLS_f),
    SYMBOL_BUCKET('g', SYMBOLS_g), SYMBOL_BUCKET('h', SYMBOLS_h), SYMBOL_BUCKET('i', SYMBOLS_i),
    SYMBOL_BUCKET('j', SYMBOLS_j), SYMBOL_BUCKET('k', SYMBOLS_k), SYMBOL_BUCKET('l', SYMBOLS_l),
    SYMBOL_BUCKET('m', SYMBOLS_m), SYMBOL_BUCKET('n', SYMBOLS_n), SYMBOL_BUCKET('o', SYMBOLS_o),
    SYMBOL_BUCKET('p', SYMBOLS_p), SYMBOL_BUCKET('q', SYMBOLS_q), SYMBOL_BUCKET('r', SYMBOLS_r),
    SYMBOL_BUCKET('s', SYMBOLS_s), SYMBOL_BUCKET('t', SYMBOLS_t), SYMBOL_BUCKET('u', SYMBOLS_u),
    SYMBOL_BUCKET('v', SYMBOLS_v), SYMBOL_BUCKET('w', SYMBOLS_w), SYMBOL_BUCKET('x', SYMBOLS_x),
    SYMBOL_BUCKET('y', SYMBOLS_y), SYMBOL_BUCKET('z', SYMBOLS_z),

    SYMBOL_BUCKET('A', SYMBOLS_A), SYMBOL_BUCKET('B', SYMBOLS_B), SYMBOL_BUCKET('C', SYMBOLS_C),
    SYMBOL_BUCKET('D', SYMBOLS_D), SYMBOL_BUCKET('E', SYMBOLS_E), SYMBOL_BUCKET('F', SYMBOLS_F),
    SYMBOL_BUCKET('G', SYMBOLS_G), SYMBOL_BUCKET('H', SYMBOLS_H), SYMBOL_BUCKET('I', SYMBOLS_I),
    SYMBOL_BUCKET('J', SYMBOLS_J), SYMBOL_BUCKET('K', SYMBOLS_K), SYMBOL_BUCKET('L', SYMBOLS_L),
    SYMBOL_BUCKET('M', SYMBOLS_M), SYMBOL_BUCKET('N', SYMBOLS_N), SYMBOL_BUCKET('O', SYMBOLS_O),
    SYMBOL_BUCKET('P', SYMBOLS_P), SYMBOL_BUCKET('Q', SYMBOLS_Q), SYMBOL_BUCKET('R', SYMBOLS_R),
    SYMBOL_BUCKET('S', SYMBOLS_S), SYMBOL_BUCKET('T', SYMBOLS_T), SYMBOL_BUCKET('U', SYMBOLS_U),
    SYMBOL_BUCKET('V', SYMBOLS_V), SYMBOL_BUCKET('W', SYMBOLS_W), SYMBOL_BUCKET('X', SYMBOLS_X),
    SYMBOL_BUCKET('Y', SYMBOLS_Y), SYMBOL_BUCKET('Z', SYMBOLS_Z),

    SYMBOL_BUCKET('-', SYMBOLS_minus), SYMBOL_BUCKET('*', SYMBOLS_star),
    SYMBOL_BUCKET('+', SYMBOLS_plus), SYMBOL_BUCKET('/', SYMBOLS_slash),
    SYMBOL_BUCKET('\\', SYMBOLS_backslash), SYMBOL_BUCKET('|', SYMBOLS_bar),
    SYMBOL_BUCKET('<', SYMBOLS_less), SYMBOL_BUCKET('>', SYMBOLS_greater),
    SYMBOL_BUCKET('=', SYMBOLS_equal), SYMBOL_BUCKET('@', SYMBOLS_at),
    SYMBOL_BUCKET('^', SYMBOLS_caret), SYMBOL_BUCKET('~', SYMBOLS_tilde),
    SYMBOL_BUCKET('!', SYMBOLS_bang), SYMBOL_BUCKET(':', SYMBOLS_colon),
    SYMBOL_BUCKET(';', SYMBOLS_semicolon), SYMBOL_BUCKET(',', SYMBOLS_comma),
    SYMBOL_BUCKET('.', SYMBOLS_dot), SYMBOL_BUCKET('_', SYMBOLS_underscore),
    SYMBOL_BUCKET('\'', SYMBOLS_quote),

    SYMBOL_BUCKET('(', SYMBOLS_lparen), SYMBOL_BUCKET(')', SYMBOLS_rparen),
    SYMBOL_BUCKET('[', SYMBOLS_lsquare), SYMBOL_BUCKET(']', SYMBOLS_rsquare),
    SYMBOL_BUCKET('{', SYMBOLS_lbrace), SYMBOL_BUCKET('}', SYMBOLS_rbrace),
};

static const size_t SYMBOL_BUCKET_COUNT = sizeof(SYMBOL_BUCKETS) / sizeof(SYMBOL_BUCKETS[0]);

// Direct index by ASCII key, built once on first lookup
struct BucketIndex {
    const SymbolBucket* by_key[128];

    BucketIndex() {
        memset(by_key, 0, sizeof(by_key));
        for (size_t i = 0; i < SYMBOL_BUCKET_COUNT; i++) {
            unsigned char key = (unsigned char)SYMBOL_BUCKETS[i].key;
            if (by_key[key]) {
                log_error("math_symbols: duplicate bucket for '%c'", SYMBOL_BUCKETS[i].key);
                continue;
            }
            by_key[key] = &SYMBOL_BUCKETS[i];
        }
    }
};

// ============================================================================
// Scanner-made symbols
// ============================================================================

static const MathSymbol SYMBOL_END_OF_INPUT =
    make_symbol(SymbolKind::EndOfInput, SymbolAction::EndOfInput, "", nullptr);
static const MathSymbol SYMBOL_TEXT =
    make_symbol(SymbolKind::Default, SymbolAction::Text, "", nullptr, "mtext");
static const MathSymbol SYMBOL_NUMBER =
    make_symbol(SymbolKind::Default, SymbolAction::Number, "", nullptr, "mn");
static const MathSymbol SYMBOL_ERROR =
    make_symbol(SymbolKind::Default, SymbolAction::Error, "", nullptr, "merror");

// ============================================================================
// Lookup
// ============================================================================

const SymbolBucket* find_symbol_bucket(char key) {
    static const BucketIndex index;
    unsigned char k = (unsigned char)key;
    if (k >= 128) return nullptr;
    return index.by_key[k];
}

const MathSymbol* match_symbol(const char* text, size_t len) {
    if (!text || len == 0) return nullptr;
    const SymbolBucket* bucket = find_symbol_bucket(text[0]);
    if (!bucket) return nullptr;

    for (size_t i = 0; i < bucket->count; i++) {
        const MathSymbol* sym = &bucket->symbols[i];
        size_t pattern_len = strlen(sym->input);
        if (pattern_len <= len && strncmp(text, sym->input, pattern_len) == 0) {
            return sym;
        }
    }
    return nullptr;
}

size_t symbol_bucket_count() {
    return SYMBOL_BUCKET_COUNT;
}

const SymbolBucket* symbol_bucket_at(size_t index) {
    return index < SYMBOL_BUCKET_COUNT ? &SYMBOL_BUCKETS[index] : nullptr;
}

const MathSymbol* symbol_end_of_input() { return &SYMBOL_END_OF_INPUT; }
const MathSymbol* symbol_text() { return &SYMBOL_TEXT; }
const MathSymbol* symbol_number() { return &SYMBOL_NUMBER; }
const MathSymbol* symbol_error() { return &SYMBOL_ERROR; }

const char* symbol_kind_name(SymbolKind kind) {
    static const char* names[] = {
        "default", "underover", "left-bracket", "right-bracket",
        "matrix-left-bracket", "matrix-right-bracket",
        "matrix-cell-separator", "matrix-row-separator", "end-of-input"
    };
    return names[(int)kind];
}

} // namespace asciimath
