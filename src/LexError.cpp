#include "LexError.hpp"

#include <sstream>

const char* lex_error_kind_name(LexErrorKind kind) {
    switch (kind) {
        case LexErrorKind::BAD_LINE_CONTINUATION:
            return "BAD_LINE_CONTINUATION";
        case LexErrorKind::UNTERMINATED_STRING:
            return "UNTERMINATED_STRING";
        case LexErrorKind::UNTERMINATED_TRIPLE_STRING:
            return "UNTERMINATED_TRIPLE_STRING";
        case LexErrorKind::INVALID_CHARACTER:
            return "INVALID_CHARACTER";
        case LexErrorKind::DEDENT:
            return "DEDENT";
        case LexErrorKind::HEX_ESCAPE_SHORT:
            return "HEX_ESCAPE_SHORT";
        case LexErrorKind::MALFORMED_UNICODE_ESCAPE:
            return "MALFORMED_UNICODE_ESCAPE";
        case LexErrorKind::MALFORMED_NAMED_UNICODE_ESCAPE:
            return "MALFORMED_NAMED_UNICODE_ESCAPE";
        case LexErrorKind::UNKNOWN_UNICODE_NAME:
            return "UNKNOWN_UNICODE_NAME";
        case LexErrorKind::MISSING_DIGITS:
            return "MISSING_DIGITS";
        case LexErrorKind::MALFORMED_FLOAT:
            return "MALFORMED_FLOAT";
        case LexErrorKind::MALFORMED_IMAGINARY:
            return "MALFORMED_IMAGINARY";
        case LexErrorKind::INVALID_SYMBOL:
            return "INVALID_SYMBOL";
        case LexErrorKind::INTERNAL:
            return "INTERNAL";
    }
    return "UNKNOWN";
}

std::string LexError::message() const {
    switch (kind) {
        case LexErrorKind::BAD_LINE_CONTINUATION:
            return "unexpected character after line continuation character";
        case LexErrorKind::UNTERMINATED_STRING:
            return "unterminated string literal";
        case LexErrorKind::UNTERMINATED_TRIPLE_STRING:
            return "unterminated triple-quoted string literal";
        case LexErrorKind::INVALID_CHARACTER:
            return "invalid character '" + detail + "' in bytes literal";
        case LexErrorKind::DEDENT:
            return "unindent does not match any outer indentation level";
        case LexErrorKind::HEX_ESCAPE_SHORT:
            return "truncated \\xXX escape";
        case LexErrorKind::MALFORMED_UNICODE_ESCAPE:
            return "truncated or invalid \\uXXXX / \\UXXXXXXXX escape";
        case LexErrorKind::MALFORMED_NAMED_UNICODE_ESCAPE:
            return "malformed \\N character escape";
        case LexErrorKind::UNKNOWN_UNICODE_NAME:
            return "unknown Unicode character name '" + detail + "'";
        case LexErrorKind::MISSING_DIGITS:
            return "missing digits after radix prefix or exponent";
        case LexErrorKind::MALFORMED_FLOAT:
            return "malformed floating point literal";
        case LexErrorKind::MALFORMED_IMAGINARY:
            return "malformed imaginary literal";
        case LexErrorKind::INVALID_SYMBOL:
            return "invalid character '" + detail + "'";
        case LexErrorKind::INTERNAL:
            return "internal error: " + detail;
    }
    return detail;
}

std::string LexResult::debug_string() const {
    std::ostringstream ss;
    ss << line << ": ";
    if (ok()) {
        ss << token().debug_string();
    } else {
        ss << "error " << lex_error_kind_name(error().kind) << ": " << error().message();
    }
    return ss.str();
}
