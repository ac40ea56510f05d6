// math_fonts.hpp - Letter substitution tables for styled math alphabets
//
// Each table maps the 52 ASCII letters (A-Z then a-z) to a code point in the
// Unicode Mathematical Alphanumeric Symbols block, or to the Letterlike
// Symbols block where the math block has a reserved hole.

#ifndef ASCIIMATH_MATH_FONTS_HPP
#define ASCIIMATH_MATH_FONTS_HPP

#include <cstddef>
#include <cstdint>
#include <string>

namespace asciimath {

#define FONT_TABLE_SIZE 52

struct FontTable {
    const char* name;                   // table name for diagnostics and test output
    uint32_t letters[FONT_TABLE_SIZE];  // 0 = no substitution
};

extern const FontTable FONT_BOLD;
extern const FontTable FONT_SANS;
extern const FontTable FONT_CALLIGRAPHIC;
extern const FontTable FONT_FRAKTUR;
extern const FontTable FONT_DOUBLE_STRUCK;

// Code point for letter c in the table, or 0 when c is not an ASCII letter
// or the table has no entry for it
uint32_t font_substitute_char(const FontTable* table, char c);

// Append text to out, replacing ASCII letters through table (nullptr = copy)
void font_substitute_text(const FontTable* table, const char* text, size_t len, std::string* out);

// Append the UTF-8 encoding of codepoint; returns bytes written (0 if invalid)
size_t append_utf8(std::string* out, uint32_t codepoint);

} // namespace asciimath

#endif // ASCIIMATH_MATH_FONTS_HPP
