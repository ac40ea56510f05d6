// ascii_math.hpp - AsciiMath to MathML translation
//
// Entry points of the translator. Input is AsciiMath notation, output is a
// <math> element whose content mirrors the notation's structure. Translation
// never fails: problems are embedded as <merror> nodes and, when a
// ParseErrorList is supplied, recorded with their source location.

#ifndef ASCIIMATH_ASCII_MATH_HPP
#define ASCIIMATH_ASCII_MATH_HPP

#include "mathml_node.hpp"
#include "parse_error.hpp"
#include <cstddef>
#include <string>

namespace asciimath {

struct TranslateOptions {
    bool display_inline;    // display="inline" instead of "block"
    int indent;             // 0 = compact markup, else spaces per level
    size_t max_errors;      // diagnostic list limit

    TranslateOptions() : display_inline(false), indent(0), max_errors(100) {}
};

// Translate into doc and return the <math> root (also stored as doc->root()).
// errors may be null.
MathNode* translate_document(MathDocument* doc, const char* text, size_t len,
                             const TranslateOptions& opts, ParseErrorList* errors);

// Translate and serialize compactly
std::string translate(const char* text, bool display_inline = false);
std::string translate(const std::string& text, bool display_inline = false);

// Translate and serialize with options; errors may be null
std::string translate(const std::string& text, const TranslateOptions& opts, ParseErrorList* errors);

} // namespace asciimath

#endif // ASCIIMATH_ASCII_MATH_HPP
