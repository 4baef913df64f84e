#pragma once

#include <stdexcept>
#include <string>
#include <variant>

#include "token.hpp"

// Diagnosable problems reported in place of a token.
enum class LexErrorKind {
    BAD_LINE_CONTINUATION,
    UNTERMINATED_STRING,
    UNTERMINATED_TRIPLE_STRING,
    INVALID_CHARACTER,  // detail: the character
    DEDENT,
    HEX_ESCAPE_SHORT,
    MALFORMED_UNICODE_ESCAPE,
    MALFORMED_NAMED_UNICODE_ESCAPE,
    UNKNOWN_UNICODE_NAME,  // detail: the name
    MISSING_DIGITS,
    MALFORMED_FLOAT,
    MALFORMED_IMAGINARY,
    INVALID_SYMBOL,  // detail: the character
    INTERNAL         // detail: what went wrong
};

const char* lex_error_kind_name(LexErrorKind kind);

struct LexError {
    LexErrorKind kind = LexErrorKind::INTERNAL;
    std::string detail;

    LexError() = default;
    explicit LexError(LexErrorKind k, std::string d = "")
        : kind(k), detail(std::move(d)) {}

    std::string message() const;

    bool operator==(const LexError& other) const {
        return kind == other.kind && detail == other.detail;
    }
    bool operator!=(const LexError& other) const { return !(*this == other); }
};

using TokenOrError = std::variant<Token, LexError>;

// One item of the token stream: the detection line plus a token or an error.
// Line 0 is used for the dedents synthesized at end of input.
struct LexResult {
    int line = 0;
    TokenOrError result;

    LexResult() = default;
    LexResult(int ln, Token tok) : line(ln), result(std::move(tok)) {}
    LexResult(int ln, LexError err) : line(ln), result(std::move(err)) {}
    LexResult(int ln, TokenOrError res) : line(ln), result(std::move(res)) {}

    bool ok() const { return std::holds_alternative<Token>(result); }
    const Token& token() const { return std::get<Token>(result); }
    const LexError& error() const { return std::get<LexError>(result); }

    bool is(TokenType type) const { return ok() && token().type == type; }

    std::string debug_string() const;

    bool operator==(const LexResult& other) const {
        return line == other.line && result == other.result;
    }
    bool operator!=(const LexResult& other) const { return !(*this == other); }
};

// Broken scanner invariant. Not recoverable, never yielded as a stream item.
class LexerFault : public std::runtime_error {
   public:
    LexerFault(const std::string& message, int line)
        : std::runtime_error(format_message(message, line)), line_(line) {}

    int line() const { return line_; }

   private:
    int line_;

    static std::string format_message(const std::string& message, int line) {
        return "Internal lexer fault at line " + std::to_string(line) + "\n" + message;
    }
};
