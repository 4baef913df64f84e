#include "lexer.hpp"

#include <unicode/uchar.h>

#include <utility>

#include "keywords.hpp"
#include "literal_join.hpp"

bool is_xid_start(char32_t c) {
    if (c == U'_') return true;
    if (c < 0x80) return (c >= U'a' && c <= U'z') || (c >= U'A' && c <= U'Z');
    return u_hasBinaryProperty(static_cast<UChar32>(c), UCHAR_ALPHABETIC) != 0;
}

bool is_xid_continue(char32_t c) {
    if (is_xid_start(c)) return true;
    if (c < 0x80) return c >= U'0' && c <= U'9';
    return (U_GET_GC_MASK(static_cast<UChar32>(c)) & U_GC_N_MASK) != 0;
}

static bool is_quote(char32_t c) {
    return c == U'\'' || c == U'"';
}

std::optional<LiteralPrefix> detect_literal_prefix(const LineCursor& line) {
    char32_t c = line.peek();
    char32_t c1 = line.peek(1);
    LiteralPrefix prefix;

    switch (c) {
        case U'\'':
        case U'"':
            return prefix;
        case U'u':
        case U'U':
            if (!is_quote(c1)) break;
            prefix.length = 1;
            return prefix;
        case U'r':
        case U'R':
            prefix.is_raw = true;
            if (is_quote(c1)) {
                prefix.length = 1;
                return prefix;
            }
            if ((c1 == U'b' || c1 == U'B') && is_quote(line.peek(2))) {
                prefix.is_bytes = true;
                prefix.length = 2;
                return prefix;
            }
            break;
        case U'b':
        case U'B':
            prefix.is_bytes = true;
            if (is_quote(c1)) {
                prefix.length = 1;
                return prefix;
            }
            if ((c1 == U'r' || c1 == U'R') && is_quote(line.peek(2))) {
                prefix.is_raw = true;
                prefix.length = 2;
                return prefix;
            }
            break;
        default:
            break;
    }
    return std::nullopt;
}

// Constructor
Scanner::Scanner(const std::string& source) : lines(source) {}

std::optional<LexResult> Scanner::handle_line_start(LineCursor line) {
    int number = line.number();
    IndentChange change = indents.at_line_start(line.indentation(), number);
    current_line = std::move(line);
    if (change == IndentChange::INDENT) {
        return LexResult(number, Token(TokenType::INDENT));
    }
    return std::nullopt;
}

std::optional<LexResult> Scanner::next() {
    while (true) {
        if (!current_line) {
            std::optional<LineCursor> line = lines.next_line();
            if (!line) {
                // end of input: close every open block, one per pull
                if (indents.pop_remaining()) return LexResult(0, Token(TokenType::DEDENT));
                return std::nullopt;
            }
            // blank and comment-only lines never touch the indentation stack
            if (line->is_logically_blank()) continue;

            if (auto indent = handle_line_start(std::move(*line))) return indent;
        }

        LineCursor& line = *current_line;

        if (indents.has_pending()) {
            return LexResult(line.number(), indents.take_pending());
        }

        line.skip_spaces();
        char32_t c = line.peek();

        // end of logical line (or comment)
        if (line.at_end() || c == U'#') {
            if (paren_level == 0) {
                int number = line.number();
                current_line.reset();
                return LexResult(number, Token(TokenType::NEWLINE));
            }
            // implicit line join: no token, no indentation check
            current_line = lines.next_line();
            continue;
        }

        if (auto prefix = detect_literal_prefix(line)) {
            return scan_literal(*prefix);
        }

        if (is_xid_start(c)) {
            return scan_identifier(line);
        }

        if ((c >= U'0' && c <= U'9') || (c == U'.' && line.peek(1) >= U'0' && line.peek(1) <= U'9')) {
            int number = line.number();
            return LexResult(number, scan_number(line));
        }

        if (c == U'\\') {
            line.advance();
            if (line.at_end()) {
                // explicit line join
                current_line = lines.next_line();
                continue;
            }
            return LexResult(line.number(), LexError(LexErrorKind::BAD_LINE_CONTINUATION));
        }

        return scan_symbol(line);
    }
}

LexResult Scanner::scan_identifier(LineCursor& line) {
    std::string id;
    append_utf8(id, line.advance());
    while (!line.at_end() && is_xid_continue(line.peek())) {
        append_utf8(id, line.advance());
    }
    return LexResult(line.number(), keyword_lookup(id));
}

static TokenType match_one(LineCursor& line, TokenType type) {
    line.advance();
    return type;
}

static TokenType match_pair_opt(TokenType old_type, LineCursor& line, char32_t c, TokenType matched) {
    if (line.peek_is(c)) {
        line.advance();
        return matched;
    }
    return old_type;
}

// `x`, `xx`, `x=`, `xx=` family, e.g. * ** *= **=
static TokenType match_pair_eq_opt(LineCursor& line, TokenType initial, char32_t paired, TokenType paired_type) {
    TokenType type = match_pair_opt(initial, line, paired, paired_type);
    return match_pair_opt(type, line, U'=', with_equal(type));
}

LexResult Scanner::scan_symbol(LineCursor& line) {
    int number = line.number();
    char32_t c = line.peek();
    TokenType type;

    switch (c) {
        case U'(':
            paren_level++;
            type = match_one(line, TokenType::OPENPARENTHESIS);
            break;
        case U')':
            if (paren_level > 0) paren_level--;
            type = match_one(line, TokenType::CLOSEPARENTHESIS);
            break;
        case U'[':
            paren_level++;
            type = match_one(line, TokenType::OPENBRACKET);
            break;
        case U']':
            if (paren_level > 0) paren_level--;
            type = match_one(line, TokenType::CLOSEBRACKET);
            break;
        case U'{':
            paren_level++;
            type = match_one(line, TokenType::OPENBRACE);
            break;
        case U'}':
            if (paren_level > 0) paren_level--;
            type = match_one(line, TokenType::CLOSEBRACE);
            break;
        case U',':
            type = match_one(line, TokenType::COMMA);
            break;
        case U':':
            type = match_one(line, TokenType::COLON);
            break;
        case U';':
            type = match_one(line, TokenType::SEMICOLON);
            break;
        case U'~':
            type = match_one(line, TokenType::TILDE);
            break;
        case U'=':
            type = match_pair_opt(match_one(line, TokenType::ASSIGN), line, U'=', TokenType::EQUALITY);
            break;
        case U'@':
            type = match_pair_opt(match_one(line, TokenType::AT_SIGN), line, U'=', TokenType::AT_ASSIGN);
            break;
        case U'%':
            type = match_pair_opt(match_one(line, TokenType::PERCENT), line, U'=', TokenType::PERCENT_ASSIGN);
            break;
        case U'&':
            type = match_pair_opt(match_one(line, TokenType::AMPERSAND), line, U'=', TokenType::BIT_AND_ASSIGN);
            break;
        case U'|':
            type = match_pair_opt(match_one(line, TokenType::BIT_OR), line, U'=', TokenType::BIT_OR_ASSIGN);
            break;
        case U'^':
            type = match_pair_opt(match_one(line, TokenType::BIT_XOR), line, U'=', TokenType::BIT_XOR_ASSIGN);
            break;
        case U'+':
            type = match_pair_opt(match_one(line, TokenType::PLUS), line, U'=', TokenType::PLUS_ASSIGN);
            break;
        case U'*':
            type = match_pair_eq_opt(line, match_one(line, TokenType::STAR), U'*', TokenType::POWER);
            break;
        case U'/':
            type = match_pair_eq_opt(line, match_one(line, TokenType::SLASH), U'/', TokenType::DOUBLESLASH);
            break;
        case U'<':
            type = match_pair_eq_opt(line, match_one(line, TokenType::LESSTHAN), U'<', TokenType::BIT_SHIFT_LEFT);
            break;
        case U'>':
            type = match_pair_eq_opt(line, match_one(line, TokenType::GREATERTHAN), U'>', TokenType::BIT_SHIFT_RIGHT);
            break;
        case U'-':
            type = match_pair_opt(match_one(line, TokenType::MINUS), line, U'=', TokenType::MINUS_ASSIGN);
            if (type == TokenType::MINUS) {
                type = match_pair_opt(type, line, U'>', TokenType::ARROW);
            }
            break;
        case U'!':
            // only valid as part of !=
            line.advance();
            if (!line.peek_is(U'=')) {
                return LexResult(number, LexError(LexErrorKind::INVALID_SYMBOL, "!"));
            }
            type = match_one(line, TokenType::NOTEQUAL);
            break;
        case U'.':
            line.advance();
            type = TokenType::DOT;
            // ".." is not an operator: it lexes as two dots
            if (line.peek_is(U'.') && line.peek_is(U'.', 1)) {
                line.advance();
                line.advance();
                type = TokenType::ELLIPSIS;
            }
            break;
        default:
            if (line.at_end()) {
                return LexResult(number, LexError(LexErrorKind::INTERNAL, "error processing symbol"));
            }
            // always step past the offending character
            line.advance();
            return LexResult(number, LexError(LexErrorKind::INVALID_SYMBOL, to_utf8(c)));
    }

    return LexResult(number, Token(type));
}

Lexer::Lexer(const std::string& source, const std::string& filename)
    : filename_(filename),
      stages(std::make_unique<StringJoiner>(
          std::make_unique<BytesJoiner>(
              std::make_unique<Scanner>(source)))) {}

std::optional<LexResult> Lexer::next() {
    return stages->next();
}

std::vector<LexResult> Lexer::tokenize() {
    std::vector<LexResult> out;
    while (auto item = next()) {
        out.push_back(std::move(*item));
    }
    return out;
}
