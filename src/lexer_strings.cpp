// String and bytes literals: quote/triple-quote handling, continuation over
// physical lines and escape decoding. Bytes literals narrow every character
// to one octet.
#include <unicode/uchar.h>

#include <string>
#include <utility>

#include "lexer.hpp"

namespace {

void append_char(std::string& out, char32_t c, bool is_bytes) {
    if (is_bytes) {
        out.push_back(static_cast<char>(c & 0xFF));
    } else {
        append_utf8(out, c);
    }
}

void append_all(std::string& out, const std::u32string& text, bool is_bytes) {
    for (char32_t c : text) append_char(out, c, is_bytes);
}

bool is_octal_digit(char32_t c) {
    return c >= U'0' && c <= U'7';
}

int hex_value(char32_t c) {
    if (c >= U'0' && c <= U'9') return static_cast<int>(c - U'0');
    if (c >= U'a' && c <= U'f') return 10 + static_cast<int>(c - U'a');
    if (c >= U'A' && c <= U'F') return 10 + static_cast<int>(c - U'A');
    return -1;
}

// \\ \' \" \a \b \f \n \r \t \v
bool simple_escape(char32_t e, char32_t& decoded) {
    switch (e) {
        case U'\\':
            decoded = U'\\';
            return true;
        case U'\'':
            decoded = U'\'';
            return true;
        case U'"':
            decoded = U'"';
            return true;
        case U'a':
            decoded = 0x07;  // BEL
            return true;
        case U'b':
            decoded = 0x08;  // BS
            return true;
        case U'f':
            decoded = 0x0C;  // FF
            return true;
        case U'n':
            decoded = U'\n';
            return true;
        case U'r':
            decoded = U'\r';
            return true;
        case U't':
            decoded = U'\t';
            return true;
        case U'v':
            decoded = 0x0B;  // VT
            return true;
        default:
            return false;
    }
}

// Up to three octal digits, the first already consumed.
char32_t read_octal(LineCursor& line, char32_t first) {
    char32_t value = first - U'0';
    for (int digits = 1; digits < 3 && is_octal_digit(line.peek()); ++digits) {
        value = value * 8 + (line.advance() - U'0');
    }
    return value;
}

// Exactly `count` hex digits. Digits that were present are consumed even
// when the run is too short.
bool read_hex(LineCursor& line, int count, char32_t& value) {
    value = 0;
    int digits = 0;
    while (digits < count && hex_value(line.peek()) >= 0) {
        value = (value << 4) | static_cast<char32_t>(hex_value(line.advance()));
        digits++;
    }
    return digits == count;
}

char32_t lookup_unicode_name(const std::string& name, bool& found) {
    UErrorCode status = U_ZERO_ERROR;
    UChar32 c = u_charFromName(U_UNICODE_CHAR_NAME, name.c_str(), &status);
    if (U_FAILURE(status)) {
        status = U_ZERO_ERROR;
        c = u_charFromName(U_CHAR_NAME_ALIAS, name.c_str(), &status);
    }
    found = U_SUCCESS(status) && c >= 0;
    return found ? static_cast<char32_t>(c) : 0;
}

// \N{NAME}
std::optional<LexError> decode_named(std::string& out, LineCursor& line) {
    if (!line.peek_is(U'{')) {
        return LexError(LexErrorKind::MALFORMED_NAMED_UNICODE_ESCAPE);
    }
    line.advance();  // consume {

    std::string name;
    while (!line.at_end() && line.peek() != U'}') {
        append_utf8(name, line.advance());
    }
    if (!line.peek_is(U'}')) {
        return LexError(LexErrorKind::MALFORMED_NAMED_UNICODE_ESCAPE);
    }
    line.advance();  // consume }

    bool found = false;
    char32_t c = lookup_unicode_name(name, found);
    if (!found) {
        return LexError(LexErrorKind::UNKNOWN_UNICODE_NAME, name);
    }
    append_utf8(out, c);
    return std::nullopt;
}

std::optional<LexError> decode_text_escape(std::string& out, LineCursor& line, char32_t e, bool is_raw) {
    char32_t decoded = 0;
    if (!is_raw) {
        if (simple_escape(e, decoded)) {
            append_utf8(out, decoded);
            return std::nullopt;
        }
        if (is_octal_digit(e)) {
            append_utf8(out, read_octal(line, e));
            return std::nullopt;
        }
        switch (e) {
            case U'x':
                if (!read_hex(line, 2, decoded)) return LexError(LexErrorKind::HEX_ESCAPE_SHORT);
                append_utf8(out, decoded);
                return std::nullopt;
            case U'N':
                return decode_named(out, line);
            case U'u':
            case U'U':
                if (!read_hex(line, e == U'u' ? 4 : 8, decoded) || decoded > 0x10FFFF ||
                    (decoded >= 0xD800 && decoded <= 0xDFFF)) {
                    return LexError(LexErrorKind::MALFORMED_UNICODE_ESCAPE);
                }
                append_utf8(out, decoded);
                return std::nullopt;
            default:
                break;
        }
    }
    // unknown escape (or raw literal): keep the backslash
    out.push_back('\\');
    append_utf8(out, e);
    return std::nullopt;
}

std::optional<LexError> decode_byte_escape(std::string& out, LineCursor& line, char32_t e, bool is_raw) {
    char32_t decoded = 0;
    if (!is_raw) {
        if (simple_escape(e, decoded)) {
            out.push_back(static_cast<char>(decoded));
            return std::nullopt;
        }
        if (is_octal_digit(e)) {
            out.push_back(static_cast<char>(read_octal(line, e) & 0xFF));
            return std::nullopt;
        }
        switch (e) {
            case U'x':
                if (!read_hex(line, 2, decoded)) return LexError(LexErrorKind::HEX_ESCAPE_SHORT);
                out.push_back(static_cast<char>(decoded));
                return std::nullopt;
            case U'N':
            case U'u':
            case U'U':
                // character escapes have no meaning in bytes
                return LexError(LexErrorKind::INVALID_CHARACTER, to_utf8(e));
            default:
                break;
        }
    }
    if (e >= 0x80) {
        return LexError(LexErrorKind::INVALID_CHARACTER, to_utf8(e));
    }
    out.push_back('\\');
    out.push_back(static_cast<char>(e));
    return std::nullopt;
}

LexErrorKind unterminated(bool is_triple) {
    return is_triple ? LexErrorKind::UNTERMINATED_TRIPLE_STRING : LexErrorKind::UNTERMINATED_STRING;
}

}  // namespace

std::optional<LexResult> Scanner::decode_escape(std::string& out, const LiteralPrefix& prefix, bool is_triple) {
    LineCursor& line = *current_line;
    int number = line.number();

    if (line.at_end()) {
        // backslash-newline: the literal continues on the next physical line
        if (prefix.is_raw) {
            out.push_back('\\');
            out.push_back('\n');
        }
        current_line = lines.next_line();
        if (!current_line) {
            return LexResult(number + 1, LexError(unterminated(is_triple)));
        }
        append_all(out, current_line->leading_spaces(), prefix.is_bytes);
        return std::nullopt;
    }

    char32_t e = line.advance();
    std::optional<LexError> err = prefix.is_bytes ? decode_byte_escape(out, line, e, prefix.is_raw)
                                                  : decode_text_escape(out, line, e, prefix.is_raw);
    if (err) return LexResult(number, std::move(*err));
    return std::nullopt;
}

LexResult Scanner::scan_literal(const LiteralPrefix& prefix) {
    LineCursor& start = *current_line;
    for (size_t k = 0; k < prefix.length; ++k) start.advance();

    char32_t quote = start.advance();
    bool is_triple = start.peek_is(quote) && start.peek_is(quote, 1);
    if (is_triple) {
        // consume second two quote characters
        start.advance();
        start.advance();
    }

    int first_line = start.number();
    std::string content;

    while (true) {
        LineCursor& line = *current_line;

        if (line.at_end()) {
            if (!is_triple) {
                return LexResult(line.number(), LexError(LexErrorKind::UNTERMINATED_STRING));
            }
            // triple-quoted: keep the newline and the next line's indentation
            content.push_back('\n');
            int number = line.number();
            current_line = lines.next_line();
            if (!current_line) {
                return LexResult(number + 1, LexError(LexErrorKind::UNTERMINATED_TRIPLE_STRING));
            }
            append_all(content, current_line->leading_spaces(), prefix.is_bytes);
            continue;
        }

        char32_t c = line.advance();

        if (c == U'\\') {
            if (auto failure = decode_escape(content, prefix, is_triple)) return std::move(*failure);
            continue;
        }

        if (c == quote) {
            if (!is_triple) break;
            if (line.peek_is(quote) && line.peek_is(quote, 1)) {
                // consume closing quotes
                line.advance();
                line.advance();
                break;
            }
        }

        append_char(content, c, prefix.is_bytes);
    }

    TokenType type = prefix.is_bytes ? TokenType::BYTES : TokenType::STRING;
    return LexResult(first_line, Token(type, std::move(content)));
}
