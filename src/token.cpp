#include "token.hpp"

#include <sstream>
#include <unordered_map>

namespace {

struct TokenInfo {
    const char* name;
    const char* text;  // canonical lexeme, empty for payload and layout tokens
};

const std::unordered_map<TokenType, TokenInfo>& token_table() {
    static const std::unordered_map<TokenType, TokenInfo> table = {
        {TokenType::NEWLINE, {"NEWLINE", ""}},
        {TokenType::INDENT, {"INDENT", ""}},
        {TokenType::DEDENT, {"DEDENT", ""}},

        {TokenType::FALSE_LITERAL, {"FALSE_LITERAL", "False"}},
        {TokenType::NONE_LITERAL, {"NONE_LITERAL", "None"}},
        {TokenType::TRUE_LITERAL, {"TRUE_LITERAL", "True"}},

        {TokenType::AND, {"AND", "and"}},
        {TokenType::AS, {"AS", "as"}},
        {TokenType::ASSERT, {"ASSERT", "assert"}},
        {TokenType::BREAK, {"BREAK", "break"}},
        {TokenType::CLASS, {"CLASS", "class"}},
        {TokenType::CONTINUE, {"CONTINUE", "continue"}},
        {TokenType::DEF, {"DEF", "def"}},
        {TokenType::DEL, {"DEL", "del"}},
        {TokenType::ELIF, {"ELIF", "elif"}},
        {TokenType::ELSE, {"ELSE", "else"}},
        {TokenType::EXCEPT, {"EXCEPT", "except"}},
        {TokenType::FINALLY, {"FINALLY", "finally"}},
        {TokenType::FOR, {"FOR", "for"}},
        {TokenType::FROM, {"FROM", "from"}},
        {TokenType::GLOBAL, {"GLOBAL", "global"}},
        {TokenType::IF, {"IF", "if"}},
        {TokenType::IMPORT, {"IMPORT", "import"}},
        {TokenType::IN, {"IN", "in"}},
        {TokenType::IS, {"IS", "is"}},
        {TokenType::LAMBDA, {"LAMBDA", "lambda"}},
        {TokenType::NONLOCAL, {"NONLOCAL", "nonlocal"}},
        {TokenType::NOT, {"NOT", "not"}},
        {TokenType::OR, {"OR", "or"}},
        {TokenType::PASS, {"PASS", "pass"}},
        {TokenType::RAISE, {"RAISE", "raise"}},
        {TokenType::RETURN, {"RETURN", "return"}},
        {TokenType::TRY, {"TRY", "try"}},
        {TokenType::WHILE, {"WHILE", "while"}},
        {TokenType::WITH, {"WITH", "with"}},
        {TokenType::YIELD, {"YIELD", "yield"}},

        {TokenType::PLUS, {"PLUS", "+"}},
        {TokenType::MINUS, {"MINUS", "-"}},
        {TokenType::STAR, {"STAR", "*"}},
        {TokenType::POWER, {"POWER", "**"}},
        {TokenType::SLASH, {"SLASH", "/"}},
        {TokenType::DOUBLESLASH, {"DOUBLESLASH", "//"}},
        {TokenType::PERCENT, {"PERCENT", "%"}},
        {TokenType::AT_SIGN, {"AT_SIGN", "@"}},

        {TokenType::BIT_SHIFT_LEFT, {"BIT_SHIFT_LEFT", "<<"}},
        {TokenType::BIT_SHIFT_RIGHT, {"BIT_SHIFT_RIGHT", ">>"}},
        {TokenType::AMPERSAND, {"AMPERSAND", "&"}},
        {TokenType::BIT_OR, {"BIT_OR", "|"}},
        {TokenType::BIT_XOR, {"BIT_XOR", "^"}},
        {TokenType::TILDE, {"TILDE", "~"}},

        {TokenType::LESSTHAN, {"LESSTHAN", "<"}},
        {TokenType::GREATERTHAN, {"GREATERTHAN", ">"}},
        {TokenType::LESSOREQUALTHAN, {"LESSOREQUALTHAN", "<="}},
        {TokenType::GREATEROREQUALTHAN, {"GREATEROREQUALTHAN", ">="}},
        {TokenType::EQUALITY, {"EQUALITY", "=="}},
        {TokenType::NOTEQUAL, {"NOTEQUAL", "!="}},

        {TokenType::OPENPARENTHESIS, {"OPENPARENTHESIS", "("}},
        {TokenType::CLOSEPARENTHESIS, {"CLOSEPARENTHESIS", ")"}},
        {TokenType::OPENBRACKET, {"OPENBRACKET", "["}},
        {TokenType::CLOSEBRACKET, {"CLOSEBRACKET", "]"}},
        {TokenType::OPENBRACE, {"OPENBRACE", "{"}},
        {TokenType::CLOSEBRACE, {"CLOSEBRACE", "}"}},
        {TokenType::COMMA, {"COMMA", ","}},
        {TokenType::COLON, {"COLON", ":"}},
        {TokenType::DOT, {"DOT", "."}},
        {TokenType::ELLIPSIS, {"ELLIPSIS", "..."}},
        {TokenType::SEMICOLON, {"SEMICOLON", ";"}},
        {TokenType::ARROW, {"ARROW", "->"}},

        {TokenType::ASSIGN, {"ASSIGN", "="}},
        {TokenType::PLUS_ASSIGN, {"PLUS_ASSIGN", "+="}},
        {TokenType::MINUS_ASSIGN, {"MINUS_ASSIGN", "-="}},
        {TokenType::TIMES_ASSIGN, {"TIMES_ASSIGN", "*="}},
        {TokenType::SLASH_ASSIGN, {"SLASH_ASSIGN", "/="}},
        {TokenType::DOUBLESLASH_ASSIGN, {"DOUBLESLASH_ASSIGN", "//="}},
        {TokenType::PERCENT_ASSIGN, {"PERCENT_ASSIGN", "%="}},
        {TokenType::AT_ASSIGN, {"AT_ASSIGN", "@="}},
        {TokenType::BIT_AND_ASSIGN, {"BIT_AND_ASSIGN", "&="}},
        {TokenType::BIT_OR_ASSIGN, {"BIT_OR_ASSIGN", "|="}},
        {TokenType::BIT_XOR_ASSIGN, {"BIT_XOR_ASSIGN", "^="}},
        {TokenType::SHIFT_RIGHT_ASSIGN, {"SHIFT_RIGHT_ASSIGN", ">>="}},
        {TokenType::SHIFT_LEFT_ASSIGN, {"SHIFT_LEFT_ASSIGN", "<<="}},
        {TokenType::DOUBLESTAR_ASSIGN, {"DOUBLESTAR_ASSIGN", "**="}},

        {TokenType::IDENTIFIER, {"IDENTIFIER", ""}},
        {TokenType::STRING, {"STRING", ""}},
        {TokenType::BYTES, {"BYTES", ""}},
        {TokenType::DEC_INTEGER, {"DEC_INTEGER", ""}},
        {TokenType::BIN_INTEGER, {"BIN_INTEGER", ""}},
        {TokenType::OCT_INTEGER, {"OCT_INTEGER", ""}},
        {TokenType::HEX_INTEGER, {"HEX_INTEGER", ""}},
        {TokenType::FLOAT, {"FLOAT", ""}},
        {TokenType::IMAGINARY, {"IMAGINARY", ""}}};
    return table;
}

}  // namespace

const char* token_type_name(TokenType type) {
    auto it = token_table().find(type);
    if (it != token_table().end()) return it->second.name;
    return "TOKEN(?)";
}

TokenType with_equal(TokenType type) {
    switch (type) {
        case TokenType::STAR:
            return TokenType::TIMES_ASSIGN;
        case TokenType::POWER:
            return TokenType::DOUBLESTAR_ASSIGN;
        case TokenType::SLASH:
            return TokenType::SLASH_ASSIGN;
        case TokenType::DOUBLESLASH:
            return TokenType::DOUBLESLASH_ASSIGN;
        case TokenType::LESSTHAN:
            return TokenType::LESSOREQUALTHAN;
        case TokenType::BIT_SHIFT_LEFT:
            return TokenType::SHIFT_LEFT_ASSIGN;
        case TokenType::GREATERTHAN:
            return TokenType::GREATEROREQUALTHAN;
        case TokenType::BIT_SHIFT_RIGHT:
            return TokenType::SHIFT_RIGHT_ASSIGN;
        default:
            return type;
    }
}

bool has_payload(TokenType type) {
    switch (type) {
        case TokenType::IDENTIFIER:
        case TokenType::STRING:
        case TokenType::BYTES:
        case TokenType::DEC_INTEGER:
        case TokenType::BIN_INTEGER:
        case TokenType::OCT_INTEGER:
        case TokenType::HEX_INTEGER:
        case TokenType::FLOAT:
        case TokenType::IMAGINARY:
            return true;
        default:
            return false;
    }
}

bool Token::is_number() const {
    switch (type) {
        case TokenType::DEC_INTEGER:
        case TokenType::BIN_INTEGER:
        case TokenType::OCT_INTEGER:
        case TokenType::HEX_INTEGER:
        case TokenType::FLOAT:
        case TokenType::IMAGINARY:
            return true;
        default:
            return false;
    }
}

std::string Token::lexeme() const {
    if (has_payload(type)) return value;
    auto it = token_table().find(type);
    if (it != token_table().end()) return it->second.text;
    return "";
}

std::string Token::debug_string() const {
    std::ostringstream ss;
    ss << token_type_name(type);
    if (type == TokenType::BYTES) {
        ss << " b'";
        for (unsigned char c : value) {
            if (c >= 0x20 && c < 0x7f && c != '\\' && c != '\'') {
                ss << c;
            } else {
                static const char* hex = "0123456789abcdef";
                ss << "\\x" << hex[c >> 4] << hex[c & 0x0f];
            }
        }
        ss << "'";
    } else if (has_payload(type)) {
        ss << " '" << value << "'";
    }
    return ss.str();
}
