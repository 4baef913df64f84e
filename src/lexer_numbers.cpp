// Numeric literal grammar: radix-prefixed integers, decimal integers,
// point/exponent floats and imaginary numbers. Lexemes keep their exact
// source text, including the case of prefix and exponent letters.
#include <string>
#include <utility>

#include "lexer.hpp"

namespace {

bool is_digit_in_radix(char32_t c, unsigned radix) {
    unsigned value;
    if (c >= U'0' && c <= U'9')
        value = c - U'0';
    else if (c >= U'a' && c <= U'z')
        value = 10 + (c - U'a');
    else if (c >= U'A' && c <= U'Z')
        value = 10 + (c - U'A');
    else
        return false;
    return value < radix;
}

bool is_decimal_digit(char32_t c) {
    return is_digit_in_radix(c, 10);
}

// Numeric lexemes are ASCII.
void push_char(std::string& lexeme, char32_t c) {
    lexeme.push_back(static_cast<char>(c));
}

// Consume the current character unconditionally, then every following one
// that satisfies `pred`.
template <typename Pred>
std::string consume_and_while(std::string lexeme, LineCursor& line, Pred pred) {
    push_char(lexeme, line.advance());
    while (!line.at_end() && pred(line.peek())) {
        push_char(lexeme, line.advance());
    }
    return lexeme;
}

TokenOrError require_radix_digits(std::string lexeme, LineCursor& line, unsigned radix, TokenType type) {
    if (line.at_end() || !is_digit_in_radix(line.peek(), radix)) {
        return LexError(LexErrorKind::MISSING_DIGITS);
    }
    lexeme = consume_and_while(std::move(lexeme), line, [radix](char32_t c) { return is_digit_in_radix(c, radix); });
    return Token(type, std::move(lexeme));
}

bool is_token(const TokenOrError& result) {
    return std::holds_alternative<Token>(result);
}

TokenOrError build_point_float(TokenOrError result, LineCursor& line) {
    if (!is_token(result) || !line.peek_is(U'.')) return result;

    const Token& token = std::get<Token>(result);
    if (!token.is_decimal_integer()) return LexError(LexErrorKind::MALFORMED_FLOAT);

    std::string lexeme = token.value;
    push_char(lexeme, line.advance());  // the '.'

    if (!line.at_end() && is_decimal_digit(line.peek())) {
        return require_radix_digits(std::move(lexeme), line, 10, TokenType::FLOAT);
    }
    return Token(TokenType::FLOAT, std::move(lexeme));
}

TokenOrError build_exp_float(TokenOrError result, LineCursor& line) {
    if (!is_token(result) || !(line.peek_is(U'e') || line.peek_is(U'E'))) return result;

    const Token& token = std::get<Token>(result);
    if (!token.is_decimal_integer() && !token.is_float()) return LexError(LexErrorKind::MALFORMED_FLOAT);

    std::string lexeme = token.value;
    push_char(lexeme, line.advance());  // e|E

    if (line.peek_is(U'+') || line.peek_is(U'-')) {
        push_char(lexeme, line.advance());
    }
    return require_radix_digits(std::move(lexeme), line, 10, TokenType::FLOAT);
}

TokenOrError build_img_float(TokenOrError result, LineCursor& line) {
    if (!is_token(result) || !(line.peek_is(U'j') || line.peek_is(U'J'))) return result;

    const Token& token = std::get<Token>(result);
    if (!token.is_decimal_integer() && !token.is_float()) return LexError(LexErrorKind::MALFORMED_IMAGINARY);

    std::string lexeme = token.value;
    push_char(lexeme, line.advance());  // j|J
    return Token(TokenType::IMAGINARY, std::move(lexeme));
}

TokenOrError build_float_part(TokenOrError result, LineCursor& line) {
    result = build_point_float(std::move(result), line);
    result = build_exp_float(std::move(result), line);
    return build_img_float(std::move(result), line);
}

// A zero-led decimal such as 0123 is only legal as part of a float or
// imaginary literal.
TokenOrError require_float_part(TokenOrError result, LineCursor& line) {
    char32_t c = line.peek();
    bool float_part = !line.at_end() && (c == U'.' || c == U'e' || c == U'E' || c == U'j' || c == U'J');
    if (!float_part) return LexError(LexErrorKind::MALFORMED_FLOAT);
    return build_float_part(std::move(result), line);
}

TokenOrError build_zero_prefixed(LineCursor& line) {
    std::string lexeme;
    push_char(lexeme, line.advance());  // the '0'

    switch (line.peek()) {
        case U'o':
        case U'O':
            push_char(lexeme, line.advance());
            return require_radix_digits(std::move(lexeme), line, 8, TokenType::OCT_INTEGER);
        case U'x':
        case U'X':
            push_char(lexeme, line.advance());
            return require_radix_digits(std::move(lexeme), line, 16, TokenType::HEX_INTEGER);
        case U'b':
        case U'B':
            push_char(lexeme, line.advance());
            return require_radix_digits(std::move(lexeme), line, 2, TokenType::BIN_INTEGER);
        case U'0': {
            lexeme = consume_and_while(std::move(lexeme), line, [](char32_t c) { return c == U'0'; });
            if (!line.at_end() && is_decimal_digit(line.peek())) {
                TokenOrError token = require_radix_digits(std::move(lexeme), line, 10, TokenType::DEC_INTEGER);
                return require_float_part(std::move(token), line);
            }
            return build_float_part(Token(TokenType::DEC_INTEGER, std::move(lexeme)), line);
        }
        default:
            break;
    }

    if (!line.at_end() && is_decimal_digit(line.peek())) {
        TokenOrError token = require_radix_digits(std::move(lexeme), line, 10, TokenType::DEC_INTEGER);
        return require_float_part(std::move(token), line);
    }
    return build_float_part(Token(TokenType::DEC_INTEGER, std::move(lexeme)), line);
}

TokenOrError build_dot_prefixed(LineCursor& line) {
    std::string lexeme;
    push_char(lexeme, line.advance());  // the '.'

    if (line.at_end() || !is_decimal_digit(line.peek())) {
        return LexError(LexErrorKind::INTERNAL, "dot");
    }
    TokenOrError result = require_radix_digits(std::move(lexeme), line, 10, TokenType::FLOAT);
    result = build_exp_float(std::move(result), line);
    return build_img_float(std::move(result), line);
}

}  // namespace

TokenOrError scan_number(LineCursor& line) {
    char32_t c = line.peek();
    if (c == U'0') return build_zero_prefixed(line);
    if (c == U'.') return build_dot_prefixed(line);

    TokenOrError result = require_radix_digits(std::string(), line, 10, TokenType::DEC_INTEGER);
    return build_float_part(std::move(result), line);
}
