#pragma once
#ifndef ASCIIMATH_PARSE_ERROR_HPP
#define ASCIIMATH_PARSE_ERROR_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

namespace asciimath {

// Source location in the notation text - 1-based line and column numbers
struct SourceLocation {
    size_t offset;      // Byte offset in source (0-based)
    size_t line;        // Line number (1-based)
    size_t column;      // Column number (1-based, counts UTF-8 code points)

    SourceLocation() : offset(0), line(1), column(1) {}
    SourceLocation(size_t off, size_t ln, size_t col)
        : offset(off), line(ln), column(col) {}

    bool isValid() const { return line > 0 && column > 0; }
};

enum class ParseErrorSeverity {
    ERROR,      // rendered inline as <merror>
    WARNING,    // recovered silently (unterminated quote)
    NOTE
};

// What went wrong; the message text mirrors the inline <merror> content
enum class ParseErrorCode {
    UnrecognizedToken,
    MissingClosingParen,
    MissingClosingBracket,
    UnmatchedClosingBracket,
    UnterminatedText,
    NestingTooDeep
};

const char* parse_error_code_name(ParseErrorCode code);

struct ParseError {
    SourceLocation location;
    ParseErrorSeverity severity;
    ParseErrorCode code;
    std::string message;
    std::string context_line;   // Source line where the error occurred

    ParseError(const SourceLocation& loc, ParseErrorSeverity sev, ParseErrorCode c,
               const std::string& msg)
        : location(loc), severity(sev), code(c), message(msg) {}

    ParseError(const SourceLocation& loc, ParseErrorSeverity sev, ParseErrorCode c,
               const std::string& msg, const std::string& ctx)
        : location(loc), severity(sev), code(c), message(msg), context_line(ctx) {}
};

// Bounded collection of translation diagnostics
class ParseErrorList {
private:
    std::vector<ParseError> errors_;
    size_t max_errors_;
    size_t error_count_;
    size_t warning_count_;

public:
    ParseErrorList(size_t max_errors = 100)
        : max_errors_(max_errors), error_count_(0), warning_count_(0) {}

    // Returns false once the limit is reached
    bool addError(const ParseError& error);

    void addError(const SourceLocation& loc, ParseErrorCode code, const std::string& msg,
                  const std::string& context);
    void addWarning(const SourceLocation& loc, ParseErrorCode code, const std::string& msg,
                    const std::string& context);

    bool shouldStop() const { return errors_.size() >= max_errors_; }

    bool hasErrors() const { return error_count_ > 0; }
    bool hasWarnings() const { return warning_count_ > 0; }
    size_t errorCount() const { return error_count_; }
    size_t warningCount() const { return warning_count_; }
    size_t totalCount() const { return errors_.size(); }

    // Number of entries recorded with the given code
    size_t countOf(ParseErrorCode code) const;

    const std::vector<ParseError>& errors() const { return errors_; }

    // "line 1, col 3: error: Missing closing paren" plus context and caret
    std::string formatErrors() const;
    std::string formatError(const ParseError& error) const;

    void setMaxErrors(size_t max) { max_errors_ = max; }
    size_t maxErrors() const { return max_errors_; }

    void clear() {
        errors_.clear();
        error_count_ = 0;
        warning_count_ = 0;
    }
};

} // namespace asciimath

#endif // ASCIIMATH_PARSE_ERROR_HPP
