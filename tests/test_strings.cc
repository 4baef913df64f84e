#include <gtest/gtest.h>

#include "lex_test_helpers.hpp"
#include "lexer.hpp"

// First item of the stream for a one-literal source
static LexResult first(const std::string& source) {
    auto items = lex(source);
    return items.empty() ? LexResult() : items.front();
}

static LexResult str(const std::string& value, int line = 1) {
    return tok(line, TokenType::STRING, value);
}

static LexResult bytes(const std::string& value, int line = 1) {
    return tok(line, TokenType::BYTES, value);
}

// String literals

TEST(StringTest, SingleAndDoubleQuotes) {
    EXPECT_EQ(first("'abc'"), str("abc"));
    EXPECT_EQ(first("\"abc\""), str("abc"));
    EXPECT_EQ(first("''"), str(""));
    EXPECT_EQ(first("'say \"hi\"'"), str("say \"hi\""));
}

TEST(StringTest, StringFollowedByNewline) {
    std::vector<LexResult> expected = {
        str("hello world"),
        tok(1, TokenType::NEWLINE),
    };
    EXPECT_EQ(lex("\"hello world\"\n"), expected);
}

TEST(StringTest, SimpleEscapes) {
    EXPECT_EQ(first("'\\a\\b\\f\\n\\r\\t\\v'"), str("\a\b\f\n\r\t\v"));
    EXPECT_EQ(first("'\\\\ \\' \\\"'"), str("\\ ' \""));
}

TEST(StringTest, UnknownEscapeKeepsBackslash) {
    EXPECT_EQ(first("'\\q\\d'"), str("\\q\\d"));
}

TEST(StringTest, OctalEscapes) {
    EXPECT_EQ(first("'\\101\\7'"), str("A\x07"));
    EXPECT_EQ(first("'\\1234'"), str("S4"));
    EXPECT_EQ(first("'a\\0b'"), str(std::string("a\0b", 3)));
}

TEST(StringTest, HexEscapes) {
    EXPECT_EQ(first("'\\x41\\x7a'"), str("Az"));
    EXPECT_EQ(first("'\\xe9'"), str("\xC3\xA9"));
    EXPECT_EQ(first("'\\x4'"), err(1, LexErrorKind::HEX_ESCAPE_SHORT));
    EXPECT_EQ(first("'\\xg0'"), err(1, LexErrorKind::HEX_ESCAPE_SHORT));
}

TEST(StringTest, UnicodeEscapes) {
    EXPECT_EQ(first("'\\u00e9'"), str("\xC3\xA9"));
    EXPECT_EQ(first("'\\U0001F600'"), str("\xF0\x9F\x98\x80"));
    EXPECT_EQ(first("'\\u12'"), err(1, LexErrorKind::MALFORMED_UNICODE_ESCAPE));
    EXPECT_EQ(first("'\\U0000004'"), err(1, LexErrorKind::MALFORMED_UNICODE_ESCAPE));
    EXPECT_EQ(first("'\\ud800'"), err(1, LexErrorKind::MALFORMED_UNICODE_ESCAPE));
    EXPECT_EQ(first("'\\U00110000'"), err(1, LexErrorKind::MALFORMED_UNICODE_ESCAPE));
}

TEST(StringTest, NamedUnicodeEscapes) {
    EXPECT_EQ(first("'\\N{BLACK STAR}'"), str("\xE2\x98\x85"));
    EXPECT_EQ(first("'\\N{LATIN SMALL LETTER A}!'"), str("a!"));
    EXPECT_EQ(first("'\\N{NOT A REAL NAME}'"), err(1, LexErrorKind::UNKNOWN_UNICODE_NAME, "NOT A REAL NAME"));
    EXPECT_EQ(first("'\\Nx'"), err(1, LexErrorKind::MALFORMED_NAMED_UNICODE_ESCAPE));
    EXPECT_EQ(first("'\\N{BLACK STAR"), err(1, LexErrorKind::MALFORMED_NAMED_UNICODE_ESCAPE));
}

TEST(StringTest, RawStrings) {
    EXPECT_EQ(first("r'\\n\\x'"), str("\\n\\x"));
    EXPECT_EQ(first("R'\\N{BLACK STAR}'"), str("\\N{BLACK STAR}"));
    EXPECT_EQ(first("r'a\\'b'"), str("a\\'b"));
}

TEST(StringTest, Prefixes) {
    EXPECT_EQ(first("u'x'"), str("x"));
    EXPECT_EQ(first("U\"x\""), str("x"));
    EXPECT_EQ(first("b'x'"), bytes("x"));
    EXPECT_EQ(first("B'x'"), bytes("x"));
    EXPECT_EQ(first("Rb'\\n'"), bytes("\\n"));
    EXPECT_EQ(first("bR'\\n'"), bytes("\\n"));
}

TEST(StringTest, PrefixLettersWithoutQuoteAreIdentifiers) {
    std::vector<LexResult> expected = {
        tok(1, TokenType::IDENTIFIER, "rb"),
        tok(1, TokenType::IDENTIFIER, "bar"),
        tok(1, TokenType::IDENTIFIER, "f"),
        str("x"),
        tok(1, TokenType::NEWLINE),
    };
    EXPECT_EQ(lex("rb bar f'x'\n"), expected);
}

TEST(StringTest, UnterminatedStringResumesAtLineEnd) {
    std::vector<LexResult> expected = {
        err(1, LexErrorKind::UNTERMINATED_STRING),
        tok(1, TokenType::NEWLINE),
        tok(2, TokenType::IDENTIFIER, "x"),
        tok(2, TokenType::NEWLINE),
    };
    EXPECT_EQ(lex("'abc\nx\n"), expected);
}

TEST(StringTest, UnterminatedAtEndOfInput) {
    std::vector<LexResult> expected = {
        err(1, LexErrorKind::UNTERMINATED_STRING),
        tok(1, TokenType::NEWLINE),
    };
    EXPECT_EQ(lex("\"abc"), expected);
}

TEST(StringTest, BackslashNewlineContinuesLiteral) {
    std::vector<LexResult> expected = {
        str("ab  cd"),
        tok(2, TokenType::NEWLINE),
    };
    EXPECT_EQ(lex("'ab\\\n  cd'\n"), expected);
}

TEST(StringTest, RawBackslashNewlineIsKept) {
    EXPECT_EQ(first("r'ab\\\ncd'"), str("ab\\\ncd"));
}

TEST(StringTest, BackslashAtEndOfInput) {
    std::vector<LexResult> expected = {
        err(2, LexErrorKind::UNTERMINATED_STRING),
    };
    EXPECT_EQ(lex("'ab\\"), expected);
}

// Triple-quoted literals

TEST(StringTest, TripleQuotedSpansLines) {
    std::vector<LexResult> expected = {
        str("a\n  b"),
        tok(2, TokenType::NEWLINE),
    };
    EXPECT_EQ(lex("'''a\n  b'''\n"), expected);
}

TEST(StringTest, TripleQuotedKeepsInnerQuotes) {
    EXPECT_EQ(first("'''it's \"x\" ''ok'''"), str("it's \"x\" ''ok"));
    EXPECT_EQ(first("\"\"\"a\"\"b\"\"\""), str("a\"\"b"));
}

TEST(StringTest, TripleQuotedDoesNotAffectIndentation) {
    std::vector<LexResult> expected = {
        tok(1, TokenType::IDENTIFIER, "x"),
        tok(1, TokenType::ASSIGN),
        str("\n        body\n"),
        tok(3, TokenType::NEWLINE),
        tok(4, TokenType::IDENTIFIER, "y"),
        tok(4, TokenType::NEWLINE),
    };
    EXPECT_EQ(lex("x = \"\"\"\n        body\n\"\"\"\ny\n"), expected);
}

TEST(StringTest, UnterminatedTripleQuoted) {
    std::vector<LexResult> expected = {
        err(2, LexErrorKind::UNTERMINATED_TRIPLE_STRING),
    };
    EXPECT_EQ(lex("'''abc\n"), expected);
    EXPECT_EQ(lex("'''abc"), expected);
}

TEST(StringTest, UnterminatedTripleQuotedInsideBlock) {
    std::vector<LexResult> expected = {
        tok(1, TokenType::INDENT),
        err(3, LexErrorKind::UNTERMINATED_TRIPLE_STRING),
        tok(0, TokenType::DEDENT),
    };
    EXPECT_EQ(lex("  \"\"\"one\ntwo\n"), expected);
}

// Bytes literals

TEST(BytesTest, PlainBytes) {
    EXPECT_EQ(first("b'abc'"), bytes("abc"));
    EXPECT_EQ(first("b''"), bytes(""));
}

TEST(BytesTest, EscapesNarrowToOctets) {
    EXPECT_EQ(first("b'\\x00\\xff'"), bytes(std::string("\x00\xff", 2)));
    EXPECT_EQ(first("b'\\101\\n'"), bytes("A\n"));
    EXPECT_EQ(first("b'\\q'"), bytes("\\q"));
}

TEST(BytesTest, CharacterEscapesAreInvalid) {
    EXPECT_EQ(first("b'\\u0041'"), err(1, LexErrorKind::INVALID_CHARACTER, "u"));
    EXPECT_EQ(first("b'\\U00000041'"), err(1, LexErrorKind::INVALID_CHARACTER, "U"));
    EXPECT_EQ(first("b'\\N{BLACK STAR}'"), err(1, LexErrorKind::INVALID_CHARACTER, "N"));
}

TEST(BytesTest, NonAsciiEscapeIsInvalid) {
    EXPECT_EQ(first("b'\\\xC3\xA9'"), err(1, LexErrorKind::INVALID_CHARACTER, "\xC3\xA9"));
    EXPECT_EQ(first("rb'\\\xC3\xA9'"), err(1, LexErrorKind::INVALID_CHARACTER, "\xC3\xA9"));
}

TEST(BytesTest, RawBytesKeepEscapes) {
    EXPECT_EQ(first("rb'\\u0041'"), bytes("\\u0041"));
    EXPECT_EQ(first("br'\\x00'"), bytes("\\x00"));
}

TEST(BytesTest, HexEscapeShort) {
    EXPECT_EQ(first("b'\\x1'"), err(1, LexErrorKind::HEX_ESCAPE_SHORT));
}

TEST(BytesTest, TripleQuotedBytes) {
    EXPECT_EQ(first("b'''a\nb'''"), bytes("a\nb"));
}
