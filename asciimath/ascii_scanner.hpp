// ascii_scanner.hpp - Longest-match tokenizer for AsciiMath notation
//
// The scanner resolves one symbol at a time from the cursor: end of input,
// quoted text, numeric literal, the longest symbol-table pattern, or a single
// unrecognized code point. It also carries the per-translation parse state the
// grammar needs: the font substitution stack, matrix depth and recursion depth.

#ifndef ASCIIMATH_ASCII_SCANNER_HPP
#define ASCIIMATH_ASCII_SCANNER_HPP

#include "math_symbols.hpp"
#include "source_tracker.hpp"
#include "parse_error.hpp"
#include <string>
#include <vector>

namespace asciimath {

struct FontTable;

#define ASCIIMATH_MAX_NESTING 200

// A resolved symbol plus where it sits in the source
struct ScannedSymbol {
    const MathSymbol* symbol;
    size_t start;           // offset of the first byte (after whitespace)
    size_t end;             // offset just past the symbol
    const char* text;       // literal content for Text, Number and Error
    size_t text_len;
    bool unterminated;      // Text without closing quote
    bool invalid_utf8;      // Error on a byte that does not start a code point

    SymbolKind kind() const { return symbol->kind; }
    SymbolAction action() const { return symbol->action; }

    // Pattern equality, used for the literal `_`, `^` and `/` checks
    bool is(const char* pattern) const;
};

class AsciiScanner {
public:
    AsciiScanner(const char* text, size_t len, ParseErrorList* errors);

    AsciiScanner(const AsciiScanner&) = delete;
    AsciiScanner& operator=(const AsciiScanner&) = delete;

    // Next symbol without moving the cursor
    ScannedSymbol peek() const;

    // Next symbol, cursor moved past it
    ScannedSymbol next();

    // Move past a symbol obtained from peek()
    void commit(const ScannedSymbol& sym);

    // Raw text between a bracket pair right at the cursor, for text(...).
    // Returns false (cursor unchanged) when no opening bracket follows.
    bool scanBracketedText(std::string* out);

    // Font substitution stack; only the innermost table applies
    void pushFont(const FontTable* font) { fonts_.push_back(font); }
    void popFont();
    const FontTable* currentFont() const { return fonts_.empty() ? nullptr : fonts_.back(); }
    size_t fontDepth() const { return fonts_.size(); }

    int matrixDepth() const { return matrix_depth_; }
    void enterMatrix() { matrix_depth_++; }
    void leaveMatrix() { if (matrix_depth_ > 0) matrix_depth_--; }

    int nesting() const { return nesting_; }
    void enterNesting() { nesting_++; }
    void leaveNesting() { if (nesting_ > 0) nesting_--; }

    // Record a diagnostic located at a source offset
    void reportError(size_t offset, ParseErrorCode code, const std::string& msg);
    void reportWarning(size_t offset, ParseErrorCode code, const std::string& msg);

    size_t offset() const { return tracker_.offset(); }
    ParseErrorList* errors() const { return errors_; }

private:
    SourceTracker tracker_;
    ParseErrorList* errors_;            // may be null
    std::vector<const FontTable*> fonts_;
    int matrix_depth_;
    int nesting_;
};

// ============================================================================
// Scope guards
// ============================================================================

// Pushes a substitution table for the lifetime of the guard
class FontScope {
public:
    FontScope(AsciiScanner* scanner, const FontTable* font) : scanner_(scanner) {
        scanner_->pushFont(font);
    }
    ~FontScope() { scanner_->popFont(); }

    FontScope(const FontScope&) = delete;
    FontScope& operator=(const FontScope&) = delete;

private:
    AsciiScanner* scanner_;
};

// Marks cell/row separators and matrix closers as expression terminators
class MatrixScope {
public:
    explicit MatrixScope(AsciiScanner* scanner) : scanner_(scanner) { scanner_->enterMatrix(); }
    ~MatrixScope() { scanner_->leaveMatrix(); }

    MatrixScope(const MatrixScope&) = delete;
    MatrixScope& operator=(const MatrixScope&) = delete;

private:
    AsciiScanner* scanner_;
};

// Bounds grammar recursion
class DepthGuard {
public:
    explicit DepthGuard(AsciiScanner* scanner) : scanner_(scanner) { scanner_->enterNesting(); }
    ~DepthGuard() { scanner_->leaveNesting(); }

    bool exceeded() const { return scanner_->nesting() > ASCIIMATH_MAX_NESTING; }

    DepthGuard(const DepthGuard&) = delete;
    DepthGuard& operator=(const DepthGuard&) = delete;

private:
    AsciiScanner* scanner_;
};

} // namespace asciimath

#endif // ASCIIMATH_ASCII_SCANNER_HPP
