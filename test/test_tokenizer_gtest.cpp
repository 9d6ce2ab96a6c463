/*
 * Tokenizer Test Suite (GTest)
 * ============================
 *
 * Covers token classification, number disambiguation, slice contiguity and
 * restarting from arbitrary offsets.
 */

#include "../src/mdtree-lex.h"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <string>
#include <vector>

using T = TokenType;

// ========================================================================
// Classification
// ========================================================================

TEST(TokenizerTest, Plaintext) {
    std::vector<Token> expected{
        tok(T::plaintext, 0, 6),
        tok(T::whitespace, 6, 7),
        tok(T::plaintext, 7, 13),
    };
    EXPECT_EQ(md_tokenize("Hello, World!"), expected);
}

TEST(TokenizerTest, Hash) {
    std::vector<Token> expected{
        tok(T::hash, 0, 3),
        tok(T::whitespace, 3, 4),
        tok(T::plaintext, 4, 10),
        tok(T::whitespace, 10, 11),
        tok(T::plaintext, 11, 15),
    };
    EXPECT_EQ(md_tokenize("### Header Text"), expected);
}

TEST(TokenizerTest, Numbers) {
    std::vector<Token> expected{
        tok(T::num_dot, 0, 2),
        tok(T::whitespace, 2, 3),
        tok(T::plaintext, 3, 7),
        tok(T::newline, 7, 8),
        tok(T::num_dot, 8, 11),
        tok(T::whitespace, 11, 12),
        tok(T::plaintext, 12, 16),
    };
    EXPECT_EQ(md_tokenize("1. Item\n12. Item"), expected);
}

TEST(TokenizerTest, EmptyInputProducesNoTokens) {
    EXPECT_TRUE(md_tokenize("").empty());

    Tokenizer tokenizer(0, "");
    EXPECT_FALSE(tokenizer.next().has_value());
}

TEST(TokenizerTest, MarkersAreNotMerged) {
    std::vector<Token> expected{
        tok(T::dash, 0, 1),
        tok(T::dash, 1, 2),
        tok(T::asterisk, 2, 3),
        tok(T::plus, 3, 4),
        tok(T::right_caret, 4, 5),
        tok(T::right_caret, 5, 6),
    };
    EXPECT_EQ(md_tokenize("--*+>>"), expected);
}

TEST(TokenizerTest, HashRunHasNoLengthLimit) {
    std::vector<Token> expected{
        tok(T::hash, 0, 9),
        tok(T::whitespace, 9, 10),
        tok(T::hash, 10, 12),
    };
    EXPECT_EQ(md_tokenize("######### ##"), expected);
}

TEST(TokenizerTest, HashFollowedByText) {
    std::vector<Token> expected{
        tok(T::hash, 0, 1),
        tok(T::plaintext, 1, 4),
    };
    EXPECT_EQ(md_tokenize("#abc"), expected);
}

TEST(TokenizerTest, BlockQuoteMarker) {
    std::vector<Token> expected{
        tok(T::right_caret, 0, 1),
        tok(T::whitespace, 1, 2),
        tok(T::plaintext, 2, 7),
    };
    EXPECT_EQ(md_tokenize("> quote"), expected);
}

TEST(TokenizerTest, EachNewlineIsOneToken) {
    std::vector<Token> expected{
        tok(T::plaintext, 0, 1),
        tok(T::newline, 1, 2),
        tok(T::newline, 2, 3),
        tok(T::plaintext, 3, 4),
    };
    EXPECT_EQ(md_tokenize("a\n\nb"), expected);
}

TEST(TokenizerTest, TabsAndSpacesMerge) {
    std::vector<Token> expected{
        tok(T::whitespace, 0, 3),
        tok(T::plaintext, 3, 4),
        tok(T::whitespace, 4, 5),
    };
    EXPECT_EQ(md_tokenize("\t \tx "), expected);
}

TEST(TokenizerTest, MarkersInsideTextStayText) {
    std::vector<Token> expected{tok(T::plaintext, 0, 9)};
    EXPECT_EQ(md_tokenize("a-b*c+d#e"), expected);
}

TEST(TokenizerTest, MultiByteCharactersAreText) {
    // "\xc3\xa9" and "\xc3\xb6" are two bytes each.
    std::vector<Token> expected{
        tok(T::plaintext, 0, 6),
        tok(T::whitespace, 6, 7),
        tok(T::plaintext, 7, 13),
    };
    EXPECT_EQ(md_tokenize("h\xc3\xa9llo w\xc3\xb6rld"), expected);
}

// ========================================================================
// Number disambiguation
// ========================================================================

TEST(TokenizerNumberTest, ParenMarker) {
    std::vector<Token> expected{
        tok(T::num_paren, 0, 3),
        tok(T::whitespace, 3, 4),
        tok(T::plaintext, 4, 5),
    };
    EXPECT_EQ(md_tokenize("42) x"), expected);
}

TEST(TokenizerNumberTest, DigitsFollowedByLetterMergeIntoOneToken) {
    std::vector<Token> expected{tok(T::plaintext, 0, 5)};
    EXPECT_EQ(md_tokenize("12abc"), expected);
}

TEST(TokenizerNumberTest, DigitsFollowedBySpaceAreText) {
    // The blank after the digits belongs to the same text token.
    std::vector<Token> expected{tok(T::plaintext, 0, 4)};
    EXPECT_EQ(md_tokenize("12 x"), expected);

    std::vector<Token> year{
        tok(T::plaintext, 0, 8),
    };
    EXPECT_EQ(md_tokenize("2024 was"), year);
}

TEST(TokenizerNumberTest, DigitsFollowedByTabAreText) {
    std::vector<Token> expected{
        tok(T::plaintext, 0, 3),
        tok(T::newline, 3, 4),
    };
    EXPECT_EQ(md_tokenize("7\tx\n"), expected);
}

TEST(TokenizerNumberTest, OnlyOneBlankIsAbsorbed) {
    std::vector<Token> expected{
        tok(T::plaintext, 0, 3),
        tok(T::whitespace, 3, 5),
        tok(T::plaintext, 5, 6),
    };
    EXPECT_EQ(md_tokenize("12   x"), expected);
}

TEST(TokenizerNumberTest, DigitsFollowedBySpaceAtEndOfInput) {
    std::vector<Token> expected{tok(T::plaintext, 0, 3)};
    EXPECT_EQ(md_tokenize("12 "), expected);
}

TEST(TokenizerNumberTest, DigitsAtEndOfInputAreText) {
    std::vector<Token> expected{tok(T::plaintext, 0, 3)};
    EXPECT_EQ(md_tokenize("123"), expected);
}

TEST(TokenizerNumberTest, DigitsBeforeNewlineAreText) {
    std::vector<Token> expected{
        tok(T::plaintext, 0, 2),
        tok(T::newline, 2, 3),
    };
    EXPECT_EQ(md_tokenize("12\n"), expected);
}

TEST(TokenizerNumberTest, DecimalNumberSplitsAtDot) {
    std::vector<Token> expected{
        tok(T::num_dot, 0, 2),
        tok(T::plaintext, 2, 3),
    };
    EXPECT_EQ(md_tokenize("1.5"), expected);
}

TEST(TokenizerNumberTest, TextAfterReclassificationContinues) {
    // Once digits turn into text, '.' no longer ends the token.
    std::vector<Token> expected{tok(T::plaintext, 0, 6)};
    EXPECT_EQ(md_tokenize("1a.2)b"), expected);
}

// ========================================================================
// Cursor behaviour
// ========================================================================

TEST(TokenizerCursorTest, StartsAtGivenOffset) {
    std::vector<Token> expected{
        tok(T::plaintext, 4, 10),
        tok(T::whitespace, 10, 11),
        tok(T::plaintext, 11, 15),
    };
    EXPECT_EQ(md_tokenize("### Header Text", 4), expected);
}

TEST(TokenizerCursorTest, StaysExhausted) {
    Tokenizer tokenizer(0, "ab");
    ASSERT_TRUE(tokenizer.next().has_value());
    EXPECT_EQ(tokenizer.offset(), 2u);
    EXPECT_FALSE(tokenizer.next().has_value());
    EXPECT_FALSE(tokenizer.next().has_value());
    EXPECT_EQ(tokenizer.offset(), 2u);
}

TEST(TokenizerCursorTest, RangeForMatchesTokenize) {
    const std::string text = "- item\n2) two\n";
    std::vector<Token> seen;
    for (const Token& token : Tokenizer(0, text))
        seen.push_back(token);
    EXPECT_EQ(seen, md_tokenize(text));
}

TEST(TokenizerCursorTest, LookaheadLeavesMissingSlotsEmpty) {
    std::optional<Token> la[3];
    md_lookahead("# x", 0, la, 3);
    EXPECT_EQ(la[0], tok(T::hash, 0, 1));
    EXPECT_EQ(la[1], tok(T::whitespace, 1, 2));
    EXPECT_EQ(la[2], tok(T::plaintext, 2, 3));

    md_lookahead("# x", 2, la, 3);
    EXPECT_EQ(la[0], tok(T::plaintext, 2, 3));
    EXPECT_FALSE(la[1].has_value());
    EXPECT_FALSE(la[2].has_value());
}

// ========================================================================
// Properties over sample inputs
// ========================================================================

static const char* const sample_inputs[] = {
    "",
    "Hello, World!",
    "### Header Text",
    "1. Item\n12. Item",
    "12abc 3) 4.\n\n",
    "> - * + # ## ####### x",
    "\t\t  \n \n",
    "trailing space   ",
    "a\tb\tc\n#\n##\n",
    "99999999999999999999",
    "h\xc3\xa9llo\n> w\xc3\xb6rld",
};

TEST(TokenizerPropertyTest, SlicesAreContiguousAndCoverInput) {
    for (const char* input : sample_inputs) {
        const std::string text = input;
        SCOPED_TRACE(text);

        const auto tokens = md_tokenize(text);
        MDT_OFFSET expected_beg = 0;
        for (const Token& token : tokens) {
            EXPECT_EQ(token.slice.beg, expected_beg);
            EXPECT_LT(token.slice.beg, token.slice.end);
            expected_beg = token.slice.end;
        }
        EXPECT_EQ(expected_beg, text.size());
    }
}

TEST(TokenizerPropertyTest, RestartingAtTokenBoundaryIsDeterministic) {
    for (const char* input : sample_inputs) {
        const std::string text = input;
        SCOPED_TRACE(text);

        const auto tokens = md_tokenize(text);
        EXPECT_EQ(md_tokenize(text), tokens);

        for (size_t i = 0; i < tokens.size(); i++) {
            const auto tail = md_tokenize(text, tokens[i].slice.beg);
            ASSERT_EQ(tail.size(), tokens.size() - i);
            for (size_t j = 0; j < tail.size(); j++)
                EXPECT_EQ(tail[j], tokens[i + j]);
        }
    }
}
