// test_ascii_scanner_gtest.cpp - Tokenizer tests

#include <gtest/gtest.h>
#include <cstring>
#include <string>
#include <vector>

#include "asciimath/ascii_scanner.hpp"
#include "asciimath/math_fonts.hpp"

using namespace asciimath;

class AsciiScannerTest : public ::testing::Test {
protected:
    ParseErrorList errors;

    // Scan the whole input, returning the matched pattern or literal text
    std::vector<std::string> tokens(const char* input) {
        AsciiScanner scanner(input, strlen(input), &errors);
        std::vector<std::string> out;
        while (true) {
            ScannedSymbol sym = scanner.next();
            if (sym.kind() == SymbolKind::EndOfInput) break;
            switch (sym.action()) {
                case SymbolAction::Text:
                case SymbolAction::Number:
                case SymbolAction::Error:
                    out.push_back(std::string(sym.text, sym.text_len));
                    break;
                default:
                    out.push_back(sym.symbol->input);
                    break;
            }
        }
        return out;
    }
};

TEST_F(AsciiScannerTest, EmptyInput) {
    AsciiScanner scanner("", 0, &errors);
    EXPECT_EQ(scanner.peek().kind(), SymbolKind::EndOfInput);
    EXPECT_EQ(scanner.next().kind(), SymbolKind::EndOfInput);
    EXPECT_EQ(scanner.next().kind(), SymbolKind::EndOfInput);
}

TEST_F(AsciiScannerTest, WhitespaceOnly) {
    const char* input = "  \t\n ";
    AsciiScanner scanner(input, strlen(input), &errors);
    EXPECT_EQ(scanner.next().kind(), SymbolKind::EndOfInput);
}

TEST_F(AsciiScannerTest, PeekDoesNotMove) {
    const char* input = "  x+y";
    AsciiScanner scanner(input, strlen(input), &errors);
    ScannedSymbol first = scanner.peek();
    ScannedSymbol again = scanner.peek();
    EXPECT_EQ(first.symbol, again.symbol);
    EXPECT_EQ(first.start, 2u);
    EXPECT_EQ(first.end, 3u);
    EXPECT_EQ(scanner.offset(), 0u);

    scanner.commit(first);
    EXPECT_EQ(scanner.offset(), 3u);
    EXPECT_STREQ(scanner.next().symbol->input, "+");
}

TEST_F(AsciiScannerTest, SimpleSequence) {
    std::vector<std::string> expected = { "a", "^", "2", "+", "b", "^", "2", "=", "c", "^", "2" };
    EXPECT_EQ(tokens("a^2+b^2=c^2"), expected);
}

TEST_F(AsciiScannerTest, LongestMatch) {
    std::vector<std::string> expected = { "sinh", "x", "->", "oo" };
    EXPECT_EQ(tokens("sinh x -> oo"), expected);
}

TEST_F(AsciiScannerTest, AdjacentNamesSplitGreedily) {
    // "sinx" is sin followed by x, "ab" is two identifiers
    std::vector<std::string> expected = { "sin", "x", "a", "b" };
    EXPECT_EQ(tokens("sinx ab"), expected);
}

TEST_F(AsciiScannerTest, Numbers) {
    std::vector<std::string> expected = { "3.14", "+", "42" };
    EXPECT_EQ(tokens("3.14 + 42"), expected);
}

TEST_F(AsciiScannerTest, NumberTakesOneDecimalPoint) {
    std::vector<std::string> expected = { "1.2", ".", "3" };
    EXPECT_EQ(tokens("1.2.3"), expected);
}

TEST_F(AsciiScannerTest, EllipsisAfterNumber) {
    std::vector<std::string> expected = { "1", "..." };
    EXPECT_EQ(tokens("1..."), expected);
    EXPECT_EQ(errors.totalCount(), 0u);
}

TEST_F(AsciiScannerTest, TrailingPointBelongsToNumber) {
    std::vector<std::string> expected = { "2.", "+", "1" };
    EXPECT_EQ(tokens("2. + 1"), expected);
    std::vector<std::string> at_end = { "x", "=", "3." };
    EXPECT_EQ(tokens("x = 3."), at_end);
    EXPECT_EQ(errors.totalCount(), 0u);
}

TEST_F(AsciiScannerTest, QuotedText) {
    const char* input = "\"if\" x > 0";
    AsciiScanner scanner(input, strlen(input), &errors);
    ScannedSymbol sym = scanner.next();
    EXPECT_EQ(sym.action(), SymbolAction::Text);
    EXPECT_EQ(std::string(sym.text, sym.text_len), "if");
    EXPECT_FALSE(sym.unterminated);
    EXPECT_EQ(sym.end, 4u);
    EXPECT_STREQ(scanner.next().symbol->input, "x");
}

TEST_F(AsciiScannerTest, QuotedTextKeepsInnerSpaces) {
    std::vector<std::string> expected = { " a  b ", "c" };
    EXPECT_EQ(tokens("\" a  b \" c"), expected);
}

TEST_F(AsciiScannerTest, UnterminatedQuoteRunsToEnd) {
    const char* input = "x \"abc";
    AsciiScanner scanner(input, strlen(input), &errors);
    scanner.next();
    ScannedSymbol sym = scanner.next();
    EXPECT_EQ(sym.action(), SymbolAction::Text);
    EXPECT_TRUE(sym.unterminated);
    EXPECT_EQ(std::string(sym.text, sym.text_len), "abc");
    EXPECT_EQ(scanner.next().kind(), SymbolKind::EndOfInput);

    EXPECT_FALSE(errors.hasErrors());
    EXPECT_EQ(errors.warningCount(), 1u);
    EXPECT_EQ(errors.countOf(ParseErrorCode::UnterminatedText), 1u);
    EXPECT_EQ(errors.errors()[0].location.column, 3u);
}

TEST_F(AsciiScannerTest, UnrecognizedCharacter) {
    std::vector<std::string> expected = { "a", "#", "b" };
    EXPECT_EQ(tokens("a # b"), expected);
    ASSERT_EQ(errors.errorCount(), 1u);
    const ParseError& error = errors.errors()[0];
    EXPECT_EQ(error.code, ParseErrorCode::UnrecognizedToken);
    EXPECT_EQ(error.message, "Unrecognized token '#'");
    EXPECT_EQ(error.location.column, 3u);
    EXPECT_EQ(error.context_line, "a # b");
}

TEST_F(AsciiScannerTest, UnrecognizedMultibyteCharacter) {
    // one whole code point is consumed, not one byte
    std::vector<std::string> expected = { "\xE2\x82\xAC", "x" };
    EXPECT_EQ(tokens("\xE2\x82\xAC x"), expected);
    EXPECT_EQ(errors.errorCount(), 1u);
}

TEST_F(AsciiScannerTest, InvalidUtf8Byte) {
    const char* input = "\xFF" "a";
    AsciiScanner scanner(input, strlen(input), &errors);
    ScannedSymbol sym = scanner.next();
    EXPECT_EQ(sym.action(), SymbolAction::Error);
    EXPECT_TRUE(sym.invalid_utf8);
    EXPECT_EQ(sym.end, 1u);
    EXPECT_STREQ(scanner.next().symbol->input, "a");
    EXPECT_EQ(errors.countOf(ParseErrorCode::UnrecognizedToken), 1u);
}

TEST_F(AsciiScannerTest, PeekReportsNothing) {
    const char* input = "#";
    AsciiScanner scanner(input, strlen(input), &errors);
    scanner.peek();
    scanner.peek();
    EXPECT_EQ(errors.totalCount(), 0u);
    scanner.next();
    EXPECT_EQ(errors.totalCount(), 1u);
}

TEST_F(AsciiScannerTest, MatrixTokens) {
    std::vector<std::string> expected = { "[|", "a", ";", "b", ";;", "c", ";", "d", "|]" };
    EXPECT_EQ(tokens("[| a; b;; c; d |]"), expected);
}

TEST_F(AsciiScannerTest, ErrorLocationOnSecondLine) {
    tokens("a +\n  b # c");
    ASSERT_EQ(errors.totalCount(), 1u);
    const ParseError& error = errors.errors()[0];
    EXPECT_EQ(error.location.line, 2u);
    EXPECT_EQ(error.location.column, 5u);
    EXPECT_EQ(error.context_line, "  b # c");
}

TEST_F(AsciiScannerTest, BracketedText) {
    const char* input = "text( a (b) c ) x";
    AsciiScanner scanner(input, strlen(input), &errors);
    EXPECT_STREQ(scanner.next().symbol->input, "text");
    std::string raw;
    ASSERT_TRUE(scanner.scanBracketedText(&raw));
    EXPECT_EQ(raw, " a (b) c ");
    EXPECT_STREQ(scanner.next().symbol->input, "x");
}

TEST_F(AsciiScannerTest, BracketedTextNeedsBracket) {
    const char* input = "text x";
    AsciiScanner scanner(input, strlen(input), &errors);
    scanner.next();
    std::string raw;
    EXPECT_FALSE(scanner.scanBracketedText(&raw));
    EXPECT_STREQ(scanner.next().symbol->input, "x");
}

TEST_F(AsciiScannerTest, BracketedTextUnterminated) {
    const char* input = "text(abc";
    AsciiScanner scanner(input, strlen(input), &errors);
    scanner.next();
    std::string raw;
    ASSERT_TRUE(scanner.scanBracketedText(&raw));
    EXPECT_EQ(raw, "abc");
    EXPECT_EQ(scanner.next().kind(), SymbolKind::EndOfInput);
    EXPECT_EQ(errors.countOf(ParseErrorCode::UnterminatedText), 1u);
}

TEST_F(AsciiScannerTest, FontStack) {
    AsciiScanner scanner("", 0, &errors);
    EXPECT_EQ(scanner.currentFont(), nullptr);
    {
        FontScope bold(&scanner, &FONT_BOLD);
        EXPECT_EQ(scanner.currentFont(), &FONT_BOLD);
        {
            FontScope fraktur(&scanner, &FONT_FRAKTUR);
            EXPECT_EQ(scanner.currentFont(), &FONT_FRAKTUR);
            EXPECT_EQ(scanner.fontDepth(), 2u);
        }
        EXPECT_EQ(scanner.currentFont(), &FONT_BOLD);
    }
    EXPECT_EQ(scanner.currentFont(), nullptr);
    EXPECT_EQ(scanner.fontDepth(), 0u);
}

TEST_F(AsciiScannerTest, MatrixAndDepthGuards) {
    AsciiScanner scanner("", 0, &errors);
    {
        MatrixScope outer(&scanner);
        MatrixScope inner(&scanner);
        EXPECT_EQ(scanner.matrixDepth(), 2);
    }
    EXPECT_EQ(scanner.matrixDepth(), 0);

    {
        DepthGuard guard(&scanner);
        EXPECT_EQ(scanner.nesting(), 1);
        EXPECT_FALSE(guard.exceeded());
    }
    EXPECT_EQ(scanner.nesting(), 0);
}

TEST_F(AsciiScannerTest, NoErrorListIsAllowed) {
    const char* input = "# \"open";
    AsciiScanner scanner(input, strlen(input), nullptr);
    EXPECT_EQ(scanner.next().action(), SymbolAction::Error);
    EXPECT_EQ(scanner.next().action(), SymbolAction::Text);
    EXPECT_EQ(scanner.next().kind(), SymbolKind::EndOfInput);
}
