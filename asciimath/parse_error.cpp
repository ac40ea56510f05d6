#include "parse_error.hpp"
#include <sstream>

namespace asciimath {

const char* parse_error_code_name(ParseErrorCode code) {
    switch (code) {
        case ParseErrorCode::UnrecognizedToken:       return "unrecognized-token";
        case ParseErrorCode::MissingClosingParen:     return "missing-closing-paren";
        case ParseErrorCode::MissingClosingBracket:   return "missing-closing-bracket";
        case ParseErrorCode::UnmatchedClosingBracket: return "unmatched-closing-bracket";
        case ParseErrorCode::UnterminatedText:        return "unterminated-text";
        case ParseErrorCode::NestingTooDeep:          return "nesting-too-deep";
    }
    return "unknown";
}

bool ParseErrorList::addError(const ParseError& error) {
    if (errors_.size() >= max_errors_) {
        return false;
    }

    errors_.push_back(error);

    switch (error.severity) {
        case ParseErrorSeverity::ERROR:
            error_count_++;
            break;
        case ParseErrorSeverity::WARNING:
            warning_count_++;
            break;
        case ParseErrorSeverity::NOTE:
            break;
    }
    return true;
}

void ParseErrorList::addError(const SourceLocation& loc, ParseErrorCode code,
                              const std::string& msg, const std::string& context) {
    addError(ParseError(loc, ParseErrorSeverity::ERROR, code, msg, context));
}

void ParseErrorList::addWarning(const SourceLocation& loc, ParseErrorCode code,
                                const std::string& msg, const std::string& context) {
    addError(ParseError(loc, ParseErrorSeverity::WARNING, code, msg, context));
}

size_t ParseErrorList::countOf(ParseErrorCode code) const {
    size_t count = 0;
    for (const ParseError& error : errors_) {
        if (error.code == code) count++;
    }
    return count;
}

std::string ParseErrorList::formatError(const ParseError& error) const {
    std::ostringstream oss;

    const char* severity_str = "";
    switch (error.severity) {
        case ParseErrorSeverity::ERROR:   severity_str = "error"; break;
        case ParseErrorSeverity::WARNING: severity_str = "warning"; break;
        case ParseErrorSeverity::NOTE:    severity_str = "note"; break;
    }

    oss << "line " << error.location.line << ", col " << error.location.column
        << ": " << severity_str << ": " << error.message
        << " [" << parse_error_code_name(error.code) << "]\n";

    if (!error.context_line.empty()) {
        oss << "  " << error.context_line << "\n";

        // caret under the column; columns count code points, so this only
        // lines up exactly for ASCII context
        if (error.location.column > 0 && error.location.column <= error.context_line.length() + 1) {
            oss << "  " << std::string(error.location.column - 1, ' ') << "^\n";
        }
    }
    return oss.str();
}

std::string ParseErrorList::formatErrors() const {
    if (errors_.empty()) {
        return "";
    }

    std::ostringstream oss;
    oss << "Translation diagnostics (" << error_count_ << " error";
    if (error_count_ != 1) oss << "s";
    if (warning_count_ > 0) {
        oss << ", " << warning_count_ << " warning";
        if (warning_count_ != 1) oss << "s";
    }
    oss << "):\n\n";

    for (size_t i = 0; i < errors_.size(); ++i) {
        oss << formatError(errors_[i]);
        if (i < errors_.size() - 1) {
            oss << "\n";
        }
    }

    if (errors_.size() >= max_errors_) {
        oss << "\n(limit of " << max_errors_ << " diagnostics reached)\n";
    }
    return oss.str();
}

} // namespace asciimath
