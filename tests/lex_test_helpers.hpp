#pragma once

#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "LexError.hpp"
#include "lexer.hpp"
#include "token.hpp"

// gtest failure output for stream items
inline void PrintTo(const LexResult& item, std::ostream* os) {
    *os << item.debug_string();
}

inline void PrintTo(const Token& token, std::ostream* os) {
    *os << token.debug_string();
}

inline std::vector<LexResult> lex(const std::string& source) {
    Lexer lexer(source, "<test>");
    return lexer.tokenize();
}

inline LexResult tok(int line, TokenType type, std::string value = "") {
    return LexResult(line, Token(type, std::move(value)));
}

inline LexResult err(int line, LexErrorKind kind, std::string detail = "") {
    return LexResult(line, LexError(kind, std::move(detail)));
}

// Token types only, errors skipped
inline std::vector<TokenType> getTokenTypes(const std::string& source) {
    std::vector<TokenType> types;
    for (const auto& item : lex(source)) {
        if (item.ok()) types.push_back(item.token().type);
    }
    return types;
}
