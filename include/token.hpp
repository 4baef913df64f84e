#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

// Token types produced by the scanner (keep in sync with token.cpp names/lexemes)
enum class TokenType {
    // -----------------------
    // Layout (synthesized)
    // -----------------------
    NEWLINE,
    INDENT,
    DEDENT,

    // -----------------------
    // Keyword literals
    // -----------------------
    FALSE_LITERAL,
    NONE_LITERAL,
    TRUE_LITERAL,

    // -----------------------
    // Keywords
    // -----------------------
    AND,
    AS,
    ASSERT,
    BREAK,
    CLASS,
    CONTINUE,
    DEF,
    DEL,
    ELIF,
    ELSE,
    EXCEPT,
    FINALLY,
    FOR,
    FROM,
    GLOBAL,
    IF,
    IMPORT,
    IN,
    IS,
    LAMBDA,
    NONLOCAL,
    NOT,
    OR,
    PASS,
    RAISE,
    RETURN,
    TRY,
    WHILE,
    WITH,
    YIELD,

    // -----------------------
    // Arithmetic
    // -----------------------
    PLUS,
    MINUS,
    STAR,
    POWER,
    SLASH,
    DOUBLESLASH,
    PERCENT,
    AT_SIGN,

    // -----------------------
    // Bitwise
    // -----------------------
    BIT_SHIFT_LEFT,
    BIT_SHIFT_RIGHT,
    AMPERSAND,
    BIT_OR,
    BIT_XOR,
    TILDE,

    // -----------------------
    // Comparison
    // -----------------------
    LESSTHAN,
    GREATERTHAN,
    LESSOREQUALTHAN,
    GREATEROREQUALTHAN,
    EQUALITY,
    NOTEQUAL,

    // -----------------------
    // Punctuation
    // -----------------------
    OPENPARENTHESIS,
    CLOSEPARENTHESIS,
    OPENBRACKET,
    CLOSEBRACKET,
    OPENBRACE,
    CLOSEBRACE,
    COMMA,
    COLON,
    DOT,
    ELLIPSIS,
    SEMICOLON,
    ARROW,

    // -----------------------
    // Assignment / compound assignment
    // -----------------------
    ASSIGN,
    PLUS_ASSIGN,
    MINUS_ASSIGN,
    TIMES_ASSIGN,
    SLASH_ASSIGN,
    DOUBLESLASH_ASSIGN,
    PERCENT_ASSIGN,
    AT_ASSIGN,
    BIT_AND_ASSIGN,
    BIT_OR_ASSIGN,
    BIT_XOR_ASSIGN,
    SHIFT_RIGHT_ASSIGN,
    SHIFT_LEFT_ASSIGN,
    DOUBLESTAR_ASSIGN,

    // -----------------------
    // Literals & identifiers (carry a payload)
    // -----------------------
    IDENTIFIER,
    STRING,  // decoded text (UTF-8)
    BYTES,   // decoded octets
    DEC_INTEGER,
    BIN_INTEGER,
    OCT_INTEGER,
    HEX_INTEGER,
    FLOAT,
    IMAGINARY
};

// Upper-case stable name, e.g. "DEC_INTEGER".
const char* token_type_name(TokenType type);

// Compound `op=` form of an operator; returns `type` unchanged when none exists.
TokenType with_equal(TokenType type);

bool has_payload(TokenType type);

struct Token {
    TokenType type = TokenType::NEWLINE;
    // Lexeme for identifiers and numbers (exact source text), decoded text for
    // STRING, raw octets for BYTES; empty for keywords, operators and layout.
    std::string value;

    Token() = default;
    explicit Token(TokenType t, std::string v = "")
        : type(t), value(std::move(v)) {}

    bool is_decimal_integer() const { return type == TokenType::DEC_INTEGER; }
    bool is_float() const { return type == TokenType::FLOAT; }
    bool is_number() const;

    // Canonical source text for keywords/operators, the payload otherwise.
    std::string lexeme() const;

    std::vector<uint8_t> bytes() const {
        return std::vector<uint8_t>(value.begin(), value.end());
    }

    std::string debug_string() const;

    bool operator==(const Token& other) const {
        return type == other.type && value == other.value;
    }
    bool operator!=(const Token& other) const { return !(*this == other); }
};
