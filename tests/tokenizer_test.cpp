#include <gtest/gtest.h>

#include "stackpp/syntax/tokenizer.hpp"

using stackpp::syntax::tokenize;
using Tokens = std::vector<std::string>;

TEST(Tokenizer, SplitsOnWhitespace) {
    EXPECT_EQ(tokenize("3 4\tadd\nprint\r\n"), (Tokens{"3", "4", "add", "print"}));
}

TEST(Tokenizer, CollapsesRepeatedSeparators) {
    EXPECT_EQ(tokenize("   1    2   "), (Tokens{"1", "2"}));
    EXPECT_TRUE(tokenize("").empty());
    EXPECT_TRUE(tokenize(" \n\t ").empty());
}

TEST(Tokenizer, FullWidthSpaceSeparates) {
    EXPECT_EQ(tokenize("1\xE3\x80\x80" "2"), (Tokens{"1", "2"}));
}

TEST(Tokenizer, QuotedStringKeepsWhitespace) {
    EXPECT_EQ(tokenize("\"hello  world\" print"), (Tokens{"\"hello  world\"", "print"}));
}

TEST(Tokenizer, ClosingQuoteEndsToken) {
    EXPECT_EQ(tokenize("\"a\"\"b\""), (Tokens{"\"a\"", "\"b\""}));
}

TEST(Tokenizer, BracesInsideQuotesAreText) {
    EXPECT_EQ(tokenize("\"{ x }\" 1"), (Tokens{"\"{ x }\"", "1"}));
}

TEST(Tokenizer, NestedBlockIsOneToken) {
    auto tokens = tokenize("{ 1 { 2 { 3 } } } eval");
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[0], "{ 1 { 2 { 3 } } }");
    EXPECT_EQ(tokens[1], "eval");
}

TEST(Tokenizer, QuoteInsideBlockDoesNotToggle) {
    auto tokens = tokenize("{ \"a b\" print } eval");
    EXPECT_EQ(tokens, (Tokens{"{ \"a b\" print }", "eval"}));
}

TEST(Tokenizer, AdjacentBlocksSplit) {
    EXPECT_EQ(tokenize("{a}{b}"), (Tokens{"{a}", "{b}"}));
}

TEST(Tokenizer, PrefixBeforeBraceStaysInToken) {
    EXPECT_EQ(tokenize("x{ 1 } 2"), (Tokens{"x{ 1 }", "2"}));
}

TEST(Tokenizer, StrayClosingBraceDiscarded) {
    EXPECT_EQ(tokenize("1 } 2"), (Tokens{"1", "2"}));
}

TEST(Tokenizer, UnbalancedBlockDropped) {
    EXPECT_EQ(tokenize("1 2 { 3 add"), (Tokens{"1", "2"}));
    EXPECT_EQ(tokenize("1 { { 2 }"), (Tokens{"1"}));
}

TEST(Tokenizer, UnterminatedQuoteDropped) {
    EXPECT_EQ(tokenize("1 \"never closed"), (Tokens{"1"}));
}

TEST(Tokenizer, KeepsMultibyteText) {
    EXPECT_EQ(tokenize("\"\xE3\x81\x82\" print"), (Tokens{"\"\xE3\x81\x82\"", "print"}));
}
