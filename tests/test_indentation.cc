#include <gtest/gtest.h>

#include <vector>

#include "indentation.hpp"
#include "lex_test_helpers.hpp"

static bool is_dedent_token(const TokenOrError& item) {
    return std::holds_alternative<Token>(item) && std::get<Token>(item).type == TokenType::DEDENT;
}

static bool is_dedent_error(const TokenOrError& item) {
    return std::holds_alternative<LexError>(item) && std::get<LexError>(item).kind == LexErrorKind::DEDENT;
}

TEST(IndentTrackerTest, StartsAtBaseLevel) {
    IndentTracker tracker;
    EXPECT_EQ(tracker.depth(), 1u);
    EXPECT_EQ(tracker.current(), 0u);
    EXPECT_FALSE(tracker.has_pending());
}

TEST(IndentTrackerTest, PushesDeeperLevels) {
    IndentTracker tracker;
    EXPECT_EQ(tracker.at_line_start(0, 1), IndentChange::NONE);
    EXPECT_EQ(tracker.at_line_start(4, 2), IndentChange::INDENT);
    EXPECT_EQ(tracker.at_line_start(4, 3), IndentChange::NONE);
    EXPECT_EQ(tracker.at_line_start(8, 4), IndentChange::INDENT);
    std::vector<unsigned> expected = {0, 4, 8};
    EXPECT_EQ(tracker.levels(), expected);
}

TEST(IndentTrackerTest, BalancedDedentDrainsOnePerCall) {
    IndentTracker tracker;
    tracker.at_line_start(4, 1);
    tracker.at_line_start(8, 2);
    EXPECT_EQ(tracker.at_line_start(0, 3), IndentChange::DEDENT);
    EXPECT_EQ(tracker.pending().mode, DedentRun::Mode::BALANCED);
    EXPECT_EQ(tracker.pending().remaining, 2u);

    EXPECT_TRUE(is_dedent_token(tracker.take_pending()));
    EXPECT_TRUE(tracker.has_pending());
    EXPECT_TRUE(is_dedent_token(tracker.take_pending()));
    EXPECT_FALSE(tracker.has_pending());
    EXPECT_EQ(tracker.depth(), 1u);
}

TEST(IndentTrackerTest, MisalignedDedentEndsWithOneError) {
    IndentTracker tracker;
    tracker.at_line_start(4, 1);
    tracker.at_line_start(8, 2);
    EXPECT_EQ(tracker.at_line_start(2, 3), IndentChange::DEDENT);
    EXPECT_EQ(tracker.pending().mode, DedentRun::Mode::MISMATCHED);
    EXPECT_EQ(tracker.pending().remaining, 1u);

    EXPECT_TRUE(is_dedent_token(tracker.take_pending()));
    EXPECT_TRUE(is_dedent_error(tracker.take_pending()));
    EXPECT_FALSE(tracker.has_pending());
    EXPECT_EQ(tracker.current(), 0u);
}

TEST(IndentTrackerTest, SingleLevelMisalignment) {
    IndentTracker tracker;
    tracker.at_line_start(4, 1);
    tracker.at_line_start(2, 2);
    EXPECT_EQ(tracker.pending().remaining, 0u);
    EXPECT_TRUE(tracker.has_pending());
    EXPECT_TRUE(is_dedent_error(tracker.take_pending()));
    EXPECT_FALSE(tracker.has_pending());
}

TEST(IndentTrackerTest, PartialDedentToExistingLevel) {
    IndentTracker tracker;
    tracker.at_line_start(2, 1);
    tracker.at_line_start(6, 2);
    tracker.at_line_start(9, 3);
    EXPECT_EQ(tracker.at_line_start(2, 4), IndentChange::DEDENT);
    EXPECT_EQ(tracker.pending().mode, DedentRun::Mode::BALANCED);
    EXPECT_EQ(tracker.pending().remaining, 2u);
    EXPECT_EQ(tracker.current(), 2u);
}

TEST(IndentTrackerTest, PopRemainingStopsAtBase) {
    IndentTracker tracker;
    tracker.at_line_start(4, 1);
    tracker.at_line_start(8, 2);
    EXPECT_TRUE(tracker.pop_remaining());
    EXPECT_TRUE(tracker.pop_remaining());
    EXPECT_FALSE(tracker.pop_remaining());
    EXPECT_EQ(tracker.depth(), 1u);
}

// Through the full lexer

TEST(IndentationTest, IndentedLineProducesIndentAndTrailingDedent) {
    std::vector<LexResult> expected = {
        tok(1, TokenType::INDENT),
        tok(1, TokenType::IDENTIFIER, "x"),
        tok(1, TokenType::NEWLINE),
        tok(0, TokenType::DEDENT),
    };
    EXPECT_EQ(lex("    x\n"), expected);
}

TEST(IndentationTest, NestedBlocksCloseAtEndOfInput) {
    std::vector<LexResult> expected = {
        tok(1, TokenType::IF),
        tok(1, TokenType::IDENTIFIER, "a"),
        tok(1, TokenType::COLON),
        tok(1, TokenType::NEWLINE),
        tok(2, TokenType::INDENT),
        tok(2, TokenType::IF),
        tok(2, TokenType::IDENTIFIER, "b"),
        tok(2, TokenType::COLON),
        tok(2, TokenType::NEWLINE),
        tok(3, TokenType::INDENT),
        tok(3, TokenType::PASS),
        tok(3, TokenType::NEWLINE),
        tok(0, TokenType::DEDENT),
        tok(0, TokenType::DEDENT),
    };
    EXPECT_EQ(lex("if a:\n    if b:\n        pass\n"), expected);
}

TEST(IndentationTest, BalancedDedentInsideFile) {
    std::vector<LexResult> expected = {
        tok(1, TokenType::IDENTIFIER, "a"),
        tok(1, TokenType::NEWLINE),
        tok(2, TokenType::INDENT),
        tok(2, TokenType::IDENTIFIER, "b"),
        tok(2, TokenType::NEWLINE),
        tok(3, TokenType::INDENT),
        tok(3, TokenType::IDENTIFIER, "c"),
        tok(3, TokenType::NEWLINE),
        tok(4, TokenType::DEDENT),
        tok(4, TokenType::DEDENT),
        tok(4, TokenType::IDENTIFIER, "d"),
        tok(4, TokenType::NEWLINE),
    };
    EXPECT_EQ(lex("a\n  b\n    c\nd\n"), expected);
}

TEST(IndentationTest, MisalignedDedent) {
    std::vector<LexResult> expected = {
        tok(1, TokenType::IDENTIFIER, "a"),
        tok(1, TokenType::NEWLINE),
        tok(2, TokenType::INDENT),
        tok(2, TokenType::IDENTIFIER, "b"),
        tok(2, TokenType::NEWLINE),
        tok(3, TokenType::INDENT),
        tok(3, TokenType::IDENTIFIER, "c"),
        tok(3, TokenType::NEWLINE),
        tok(4, TokenType::DEDENT),
        err(4, LexErrorKind::DEDENT),
        tok(4, TokenType::IDENTIFIER, "d"),
        tok(4, TokenType::NEWLINE),
    };
    EXPECT_EQ(lex("a\n    b\n        c\n  d\n"), expected);
}

TEST(IndentationTest, ExactlyOneErrorPerMisalignment) {
    auto items = lex("if x:\n        a\n    b\n");
    int errors = 0;
    for (const auto& item : items) {
        if (!item.ok() && item.error().kind == LexErrorKind::DEDENT) errors++;
    }
    EXPECT_EQ(errors, 1);
}

TEST(IndentationTest, TabCountsAsEightColumns) {
    std::vector<LexResult> expected = {
        tok(1, TokenType::IF),
        tok(1, TokenType::IDENTIFIER, "a"),
        tok(1, TokenType::COLON),
        tok(1, TokenType::NEWLINE),
        tok(2, TokenType::INDENT),
        tok(2, TokenType::IDENTIFIER, "b"),
        tok(2, TokenType::NEWLINE),
        tok(3, TokenType::IDENTIFIER, "c"),
        tok(3, TokenType::NEWLINE),
        tok(0, TokenType::DEDENT),
    };
    EXPECT_EQ(lex("if a:\n\tb\n        c\n"), expected);
}

TEST(IndentationTest, BlankAndCommentLinesAreIgnored) {
    std::vector<LexResult> expected = {
        tok(1, TokenType::IDENTIFIER, "a"),
        tok(1, TokenType::NEWLINE),
        tok(5, TokenType::IDENTIFIER, "b"),
        tok(5, TokenType::NEWLINE),
    };
    EXPECT_EQ(lex("a\n\n      # comment\n  \nb\n"), expected);
}

TEST(IndentationTest, StackReturnsToBaseForAnyInput) {
    const char* sources[] = {
        "a\n  b\n    c\n      d\n",
        "if x:\n\ty\n\t\tz\n",
        "a\n    b\n  c\n",
        "(\n    a\n",
        "'''open\n",
    };
    for (const char* source : sources) {
        Scanner scanner(source);
        while (scanner.next()) {
        }
        EXPECT_EQ(scanner.indentation().depth(), 1u) << source;
    }
}

TEST(IndentationTest, OneTrailingDedentPerOpenLevel) {
    auto items = lex("a\n b\n  c\n   d\n");
    int indents = 0;
    int trailing_dedents = 0;
    for (const auto& item : items) {
        if (item.is(TokenType::INDENT)) indents++;
        if (item.is(TokenType::DEDENT) && item.line == 0) trailing_dedents++;
    }
    EXPECT_EQ(indents, 3);
    EXPECT_EQ(trailing_dedents, 3);
}
