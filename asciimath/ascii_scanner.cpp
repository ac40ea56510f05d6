// ascii_scanner.cpp - Longest-match tokenizer for AsciiMath notation

#include "ascii_scanner.hpp"
#include "../lib/log.h"
#include <utf8proc.h>
#include <cctype>
#include <cstring>

namespace asciimath {

bool ScannedSymbol::is(const char* pattern) const {
    return symbol && symbol->input && strcmp(symbol->input, pattern) == 0;
}

AsciiScanner::AsciiScanner(const char* text, size_t len, ParseErrorList* errors)
    : tracker_(text, len)
    , errors_(errors)
    , matrix_depth_(0)
    , nesting_(0)
{
}

ScannedSymbol AsciiScanner::peek() const {
    const char* src = tracker_.data();
    size_t len = tracker_.length();
    size_t pos = tracker_.skipSpace(tracker_.offset());

    ScannedSymbol sym;
    sym.symbol = nullptr;
    sym.start = pos;
    sym.end = pos;
    sym.text = src + pos;
    sym.text_len = 0;
    sym.unterminated = false;
    sym.invalid_utf8 = false;

    if (pos >= len) {
        sym.symbol = symbol_end_of_input();
        return sym;
    }

    char c = src[pos];

    // quoted text runs to the closing quote or end of input
    if (c == '"') {
        size_t close = pos + 1;
        while (close < len && src[close] != '"') close++;
        sym.symbol = symbol_text();
        sym.text = src + pos + 1;
        sym.text_len = close - (pos + 1);
        sym.unterminated = close >= len;
        sym.end = sym.unterminated ? len : close + 1;
        return sym;
    }

    // digits with at most one decimal point; "..." after the digits is an
    // ellipsis, not a separator
    if (isdigit((unsigned char)c)) {
        size_t end = pos;
        while (end < len && isdigit((unsigned char)src[end])) end++;
        bool ellipsis = end + 2 < len && src[end + 1] == '.' && src[end + 2] == '.';
        if (end < len && src[end] == '.' && !ellipsis) {
            end++;
            while (end < len && isdigit((unsigned char)src[end])) end++;
        }
        sym.symbol = symbol_number();
        sym.text_len = end - pos;
        sym.end = end;
        return sym;
    }

    const MathSymbol* match = match_symbol(src + pos, len - pos);
    if (match) {
        sym.symbol = match;
        sym.end = pos + strlen(match->input);
        return sym;
    }

    // unrecognized: consume one code point
    utf8proc_int32_t codepoint = 0;
    utf8proc_ssize_t width = utf8proc_iterate((const utf8proc_uint8_t*)(src + pos),
                                              (utf8proc_ssize_t)(len - pos), &codepoint);
    if (width <= 0) {
        width = 1;
        sym.invalid_utf8 = true;
    }
    sym.symbol = symbol_error();
    sym.text_len = (size_t)width;
    sym.end = pos + (size_t)width;
    return sym;
}

void AsciiScanner::commit(const ScannedSymbol& sym) {
    if (!tracker_.advanceTo(sym.end)) {
        log_error("ascii_scanner: cannot move cursor from %zu to %zu", tracker_.offset(), sym.end);
        return;
    }

    switch (sym.action()) {
        case SymbolAction::Text:
            if (sym.unterminated) {
                reportWarning(sym.start, ParseErrorCode::UnterminatedText, "Unterminated quoted text");
            }
            break;
        case SymbolAction::Error:
            if (sym.invalid_utf8) {
                reportError(sym.start, ParseErrorCode::UnrecognizedToken, "Invalid UTF-8 byte");
            } else {
                reportError(sym.start, ParseErrorCode::UnrecognizedToken,
                            "Unrecognized token '" + std::string(sym.text, sym.text_len) + "'");
            }
            break;
        default:
            break;
    }
}

ScannedSymbol AsciiScanner::next() {
    ScannedSymbol sym = peek();
    commit(sym);
    log_debug("ascii_scanner: %s '%.*s' at %zu", symbol_kind_name(sym.kind()),
              (int)(sym.end - sym.start), tracker_.data() + sym.start, sym.start);
    return sym;
}

bool AsciiScanner::scanBracketedText(std::string* out) {
    const char* src = tracker_.data();
    size_t len = tracker_.length();
    size_t pos = tracker_.skipSpace(tracker_.offset());
    if (pos >= len) return false;

    char open = src[pos];
    char close;
    switch (open) {
        case '(': close = ')'; break;
        case '[': close = ']'; break;
        case '{': close = '}'; break;
        default: return false;
    }

    size_t start = pos + 1;
    size_t end = start;
    int depth = 1;
    while (end < len) {
        if (src[end] == open) {
            depth++;
        } else if (src[end] == close && --depth == 0) {
            break;
        }
        end++;
    }

    out->assign(src + start, end - start);
    if (end >= len) {
        reportWarning(pos, ParseErrorCode::UnterminatedText, "Unterminated text argument");
        tracker_.advanceTo(len);
    } else {
        tracker_.advanceTo(end + 1);
    }
    return true;
}

void AsciiScanner::popFont() {
    if (fonts_.empty()) {
        log_error("ascii_scanner: font stack underflow");
        return;
    }
    fonts_.pop_back();
}

void AsciiScanner::reportError(size_t offset, ParseErrorCode code, const std::string& msg) {
    log_debug("ascii_scanner: error at %zu: %s", offset, msg.c_str());
    if (!errors_) return;
    SourceLocation loc = tracker_.locationAt(offset);
    errors_->addError(loc, code, msg, tracker_.extractLine(loc.line));
}

void AsciiScanner::reportWarning(size_t offset, ParseErrorCode code, const std::string& msg) {
    log_debug("ascii_scanner: warning at %zu: %s", offset, msg.c_str());
    if (!errors_) return;
    SourceLocation loc = tracker_.locationAt(offset);
    errors_->addWarning(loc, code, msg, tracker_.extractLine(loc.line));
}

} // namespace asciimath
