// test_math_symbols_gtest.cpp - Symbol table ordering and lookup tests

#include <gtest/gtest.h>
#include <cstring>
#include <set>
#include <string>

#include "asciimath/math_symbols.hpp"
#include "asciimath/math_fonts.hpp"
#include "asciimath/ascii_scanner.hpp"

using namespace asciimath;

class MathSymbolsTest : public ::testing::Test {
protected:
    const MathSymbol* lookup(const char* text) {
        return match_symbol(text, strlen(text));
    }
};

// ============================================================================
// Table structure
// ============================================================================

TEST_F(MathSymbolsTest, BucketsAreNotEmpty) {
    ASSERT_GT(symbol_bucket_count(), 60u);
    for (size_t i = 0; i < symbol_bucket_count(); i++) {
        const SymbolBucket* bucket = symbol_bucket_at(i);
        ASSERT_NE(bucket, nullptr);
        EXPECT_GT(bucket->count, 0u) << "bucket '" << bucket->key << "'";
    }
    EXPECT_EQ(symbol_bucket_at(symbol_bucket_count()), nullptr);
}

TEST_F(MathSymbolsTest, PatternsStartWithBucketKey) {
    for (size_t i = 0; i < symbol_bucket_count(); i++) {
        const SymbolBucket* bucket = symbol_bucket_at(i);
        for (size_t j = 0; j < bucket->count; j++) {
            const char* input = bucket->symbols[j].input;
            ASSERT_NE(input, nullptr);
            ASSERT_GT(strlen(input), 0u);
            EXPECT_EQ(input[0], bucket->key) << "pattern '" << input << "'";
        }
    }
}

TEST_F(MathSymbolsTest, LongerPatternsComeFirst) {
    for (size_t i = 0; i < symbol_bucket_count(); i++) {
        const SymbolBucket* bucket = symbol_bucket_at(i);
        for (size_t j = 0; j < bucket->count; j++) {
            const char* earlier = bucket->symbols[j].input;
            size_t earlier_len = strlen(earlier);
            for (size_t k = j + 1; k < bucket->count; k++) {
                const char* later = bucket->symbols[k].input;
                bool later_extends_earlier = strlen(later) > earlier_len &&
                                             strncmp(later, earlier, earlier_len) == 0;
                EXPECT_FALSE(later_extends_earlier)
                    << "'" << earlier << "' shadows '" << later << "' in bucket '" << bucket->key << "'";
            }
        }
    }
}

TEST_F(MathSymbolsTest, PatternsAreUnique) {
    std::set<std::string> seen;
    for (size_t i = 0; i < symbol_bucket_count(); i++) {
        const SymbolBucket* bucket = symbol_bucket_at(i);
        for (size_t j = 0; j < bucket->count; j++) {
            EXPECT_TRUE(seen.insert(bucket->symbols[j].input).second)
                << "duplicate pattern '" << bucket->symbols[j].input << "'";
        }
    }
}

TEST_F(MathSymbolsTest, BucketLookupMatchesKey) {
    for (size_t i = 0; i < symbol_bucket_count(); i++) {
        const SymbolBucket* bucket = symbol_bucket_at(i);
        EXPECT_EQ(find_symbol_bucket(bucket->key), bucket);
    }
    EXPECT_EQ(find_symbol_bucket('#'), nullptr);
    EXPECT_EQ(find_symbol_bucket('"'), nullptr);
    EXPECT_EQ(find_symbol_bucket('\xCE'), nullptr);
}

// Every pattern scanned on its own comes back as itself
TEST_F(MathSymbolsTest, EveryPatternScansToItself) {
    for (size_t i = 0; i < symbol_bucket_count(); i++) {
        const SymbolBucket* bucket = symbol_bucket_at(i);
        for (size_t j = 0; j < bucket->count; j++) {
            const MathSymbol* expected = &bucket->symbols[j];
            AsciiScanner scanner(expected->input, strlen(expected->input), nullptr);
            ScannedSymbol sym = scanner.next();
            EXPECT_EQ(sym.symbol, expected) << "pattern '" << expected->input << "'";
            EXPECT_EQ(sym.end, strlen(expected->input));
            EXPECT_EQ(scanner.next().kind(), SymbolKind::EndOfInput);
        }
    }
}

// ============================================================================
// Lookup
// ============================================================================

TEST_F(MathSymbolsTest, LongestMatchWins) {
    EXPECT_STREQ(lookup("sinh x")->input, "sinh");
    EXPECT_STREQ(lookup("sin x")->input, "sin");
    EXPECT_STREQ(lookup("sube")->input, "sube");
    EXPECT_STREQ(lookup("sub")->input, "sub");
    EXPECT_STREQ(lookup("->>")->input, "->>");
    EXPECT_STREQ(lookup("-> x")->input, "->");
    EXPECT_STREQ(lookup(">->>")->input, ">->>");
    EXPECT_STREQ(lookup("|><|")->input, "|><|");
    EXPECT_STREQ(lookup("***")->input, "***");
    EXPECT_STREQ(lookup("bbb R")->input, "bbb");
    EXPECT_STREQ(lookup("bb R")->input, "bb");
    EXPECT_STREQ(lookup("{:| a |:}")->input, "{:|");
    EXPECT_STREQ(lookup(";;")->input, ";;");
    EXPECT_STREQ(lookup("; b")->input, ";");
}

TEST_F(MathSymbolsTest, LengthLimitsMatch) {
    // only "s" fits in one byte of "sum"
    const MathSymbol* sym = match_symbol("sum", 1);
    ASSERT_NE(sym, nullptr);
    EXPECT_STREQ(sym->input, "s");
    EXPECT_EQ(match_symbol("sum", 0), nullptr);
    EXPECT_EQ(match_symbol(nullptr, 3), nullptr);
}

TEST_F(MathSymbolsTest, UnknownCharacters) {
    EXPECT_EQ(lookup("#"), nullptr);
    EXPECT_EQ(lookup("?"), nullptr);
    EXPECT_EQ(lookup("."), nullptr);
    EXPECT_EQ(lookup("|"), nullptr);
    EXPECT_EQ(lookup("\xCE\xB1"), nullptr);
}

TEST_F(MathSymbolsTest, Kinds) {
    EXPECT_EQ(lookup("sum")->kind, SymbolKind::UnderOver);
    EXPECT_EQ(lookup("lim")->kind, SymbolKind::UnderOver);
    EXPECT_EQ(lookup("hat")->kind, SymbolKind::UnderOver);
    EXPECT_EQ(lookup("x")->kind, SymbolKind::Default);
    EXPECT_EQ(lookup("(")->kind, SymbolKind::LeftBracket);
    EXPECT_EQ(lookup("(:")->kind, SymbolKind::LeftBracket);
    EXPECT_EQ(lookup(":)")->kind, SymbolKind::RightBracket);
    EXPECT_EQ(lookup("]")->kind, SymbolKind::RightBracket);
    EXPECT_EQ(lookup("[|")->kind, SymbolKind::MatrixLeftBracket);
    EXPECT_EQ(lookup("|]")->kind, SymbolKind::MatrixRightBracket);
    EXPECT_EQ(lookup(";")->kind, SymbolKind::MatrixCellSeparator);
    EXPECT_EQ(lookup(";;")->kind, SymbolKind::MatrixRowSeparator);
}

TEST_F(MathSymbolsTest, Actions) {
    EXPECT_EQ(lookup("alpha")->action, SymbolAction::Identifier);
    EXPECT_STREQ(lookup("alpha")->output, "α");
    EXPECT_EQ(lookup("+-")->action, SymbolAction::Operator);
    EXPECT_STREQ(lookup("+-")->output, "±");
    EXPECT_EQ(lookup("and")->action, SymbolAction::TextOperator);
    EXPECT_EQ(lookup("sin")->action, SymbolAction::UnaryOperator);
    EXPECT_EQ(lookup("sqrt")->action, SymbolAction::UnaryWrap);
    EXPECT_STREQ(lookup("sqrt")->tag, "msqrt");
    EXPECT_EQ(lookup("text")->action, SymbolAction::UnaryText);
    EXPECT_EQ(lookup("abs")->action, SymbolAction::UnarySurround);
    EXPECT_EQ(lookup("cancel")->action, SymbolAction::UnaryAttribute);
    EXPECT_EQ(lookup("frac")->action, SymbolAction::BinaryWrap);
    EXPECT_EQ(lookup("color")->action, SymbolAction::BinaryAttribute);
    EXPECT_STREQ(lookup("color")->extra, "mathcolor");
}

TEST_F(MathSymbolsTest, SwappedArguments) {
    EXPECT_TRUE(lookup("root")->flags & SYMBOL_FLAG_SWAP_ARGS);
    EXPECT_TRUE(lookup("overset")->flags & SYMBOL_FLAG_SWAP_ARGS);
    EXPECT_TRUE(lookup("underset")->flags & SYMBOL_FLAG_SWAP_ARGS);
    EXPECT_TRUE(lookup("stackrel")->flags & SYMBOL_FLAG_SWAP_ARGS);
    EXPECT_FALSE(lookup("frac")->flags & SYMBOL_FLAG_SWAP_ARGS);
}

TEST_F(MathSymbolsTest, FontScopes) {
    EXPECT_EQ(lookup("bb")->action, SymbolAction::UnaryFontScope);
    EXPECT_EQ(lookup("bb")->font, &FONT_BOLD);
    EXPECT_EQ(lookup("bbb")->font, &FONT_DOUBLE_STRUCK);
    EXPECT_EQ(lookup("cc")->font, &FONT_CALLIGRAPHIC);
    EXPECT_EQ(lookup("fr")->font, &FONT_FRAKTUR);
    EXPECT_EQ(lookup("sf")->font, &FONT_SANS);
    // names that merely start like a font command
    EXPECT_STREQ(lookup("beta")->input, "beta");
    EXPECT_STREQ(lookup("frac")->input, "frac");
    EXPECT_STREQ(lookup("frown")->input, "frown");
}

TEST_F(MathSymbolsTest, CorrectedEntries) {
    EXPECT_STREQ(lookup("ox")->output, "⊗");
    EXPECT_STREQ(lookup("o+")->output, "⊕");
    EXPECT_STREQ(lookup("__|")->output, "⌋");
    EXPECT_STREQ(lookup("_|_")->output, "⊥");
    EXPECT_EQ(lookup("_")->action, SymbolAction::Operator);
}

TEST_F(MathSymbolsTest, InvisibleBrackets) {
    EXPECT_EQ(lookup("{:")->output, nullptr);
    EXPECT_EQ(lookup(":}")->output, nullptr);
    EXPECT_STREQ(lookup("{")->output, "{");
    EXPECT_STREQ(lookup("}")->output, "}");
    EXPECT_EQ(lookup("{:|")->output, nullptr);
    EXPECT_EQ(lookup("|:}")->output, nullptr);
    EXPECT_STREQ(lookup("[|")->output, "[");
    EXPECT_STREQ(lookup("|)")->output, ")");
}

TEST_F(MathSymbolsTest, ScannerSymbols) {
    EXPECT_EQ(symbol_end_of_input()->kind, SymbolKind::EndOfInput);
    EXPECT_EQ(symbol_text()->action, SymbolAction::Text);
    EXPECT_EQ(symbol_number()->action, SymbolAction::Number);
    EXPECT_EQ(symbol_error()->action, SymbolAction::Error);
    EXPECT_STREQ(symbol_kind_name(SymbolKind::UnderOver), "underover");
    EXPECT_STREQ(symbol_kind_name(SymbolKind::MatrixRowSeparator), "matrix-row-separator");
}
