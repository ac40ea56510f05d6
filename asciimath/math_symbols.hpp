// math_symbols.hpp - AsciiMath symbol table declarations
//
// The table maps the first character of a notation pattern to the ordered
// list of symbols starting with that character. Within a bucket a longer
// pattern always precedes any of its prefixes, so the first match found by
// the scanner is the longest one.

#ifndef ASCIIMATH_MATH_SYMBOLS_HPP
#define ASCIIMATH_MATH_SYMBOLS_HPP

#include <cstddef>
#include <cstdint>

namespace asciimath {

struct FontTable;

// Grammar classification of a symbol
enum class SymbolKind : uint8_t {
    Default,
    UnderOver,              // scripts render under/over (sum, lim, accents)
    LeftBracket,
    RightBracket,
    MatrixLeftBracket,
    MatrixRightBracket,
    MatrixCellSeparator,
    MatrixRowSeparator,
    EndOfInput
};

// How a symbol renders; argument-taking actions call back into the grammar
enum class SymbolAction : uint8_t {
    Identifier,         // <mi>output</mi>
    Operator,           // <mo>output</mo>
    TextOperator,       // <mrow><mspace/><mtext>output</mtext><mspace/></mrow>
    UnaryOperator,      // <mrow><mo>output</mo>arg</mrow>
    UnaryWrap,          // <tag>arg</tag>
    UnaryText,          // <mtext>raw text</mtext>
    UnaryAccent,        // <tag>arg<mo>output</mo></tag>
    UnarySurround,      // <mrow><mo>output</mo>arg<mo>extra</mo></mrow>
    UnaryAttribute,     // <tag extra="output">arg</tag>
    UnaryFontScope,     // arg with letters substituted through font
    BinaryWrap,         // <tag>arg1 arg2</tag>
    BinaryAttribute,    // <tag extra="text of arg1">arg2</tag>
    LeftBracket,        // <mo>output</mo> or nothing
    RightBracket,
    MatrixOpen,
    MatrixClose,
    CellSeparator,
    RowSeparator,
    // made by the scanner, never stored in the table
    Text,
    Number,
    Error,
    EndOfInput
};

// BinaryWrap: the second argument is emitted first (root index, over/under scripts)
#define SYMBOL_FLAG_SWAP_ARGS 0x01

struct MathSymbol {
    SymbolKind kind;
    SymbolAction action;
    const char* input;      // notation pattern
    const char* output;     // rendered text, nullptr renders nothing
    const char* tag;        // element name for wrapping actions
    const char* extra;      // closing operator text or attribute name
    const FontTable* font;  // substitution table for UnaryFontScope
    uint8_t flags;
};

struct SymbolBucket {
    char key;
    const MathSymbol* symbols;
    size_t count;
};

// Bucket for the first character of a pattern, nullptr if none
const SymbolBucket* find_symbol_bucket(char key);

// First (longest) table symbol whose pattern is a prefix of text
const MathSymbol* match_symbol(const char* text, size_t len);

// Enumeration of all buckets, in declaration order
size_t symbol_bucket_count();
const SymbolBucket* symbol_bucket_at(size_t index);

// Scanner-made symbols
const MathSymbol* symbol_end_of_input();
const MathSymbol* symbol_text();
const MathSymbol* symbol_number();
const MathSymbol* symbol_error();

const char* symbol_kind_name(SymbolKind kind);

} // namespace asciimath

#endif // ASCIIMATH_MATH_SYMBOLS_HPP
