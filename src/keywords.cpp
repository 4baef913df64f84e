#include "keywords.hpp"

#include <unordered_map>

namespace {

const std::unordered_map<std::string, TokenType>& keyword_table() {
    static const std::unordered_map<std::string, TokenType> keywords = {
        // keyword literals
        {"False", TokenType::FALSE_LITERAL},
        {"None", TokenType::NONE_LITERAL},
        {"True", TokenType::TRUE_LITERAL},

        // boolean operators / tests
        {"and", TokenType::AND},
        {"or", TokenType::OR},
        {"not", TokenType::NOT},
        {"in", TokenType::IN},
        {"is", TokenType::IS},

        // declarations
        {"def", TokenType::DEF},
        {"class", TokenType::CLASS},
        {"lambda", TokenType::LAMBDA},
        {"global", TokenType::GLOBAL},
        {"nonlocal", TokenType::NONLOCAL},
        {"del", TokenType::DEL},

        // modules
        {"import", TokenType::IMPORT},
        {"from", TokenType::FROM},
        {"as", TokenType::AS},

        // control flow
        {"if", TokenType::IF},
        {"elif", TokenType::ELIF},
        {"else", TokenType::ELSE},
        {"for", TokenType::FOR},
        {"while", TokenType::WHILE},
        {"break", TokenType::BREAK},
        {"continue", TokenType::CONTINUE},
        {"pass", TokenType::PASS},
        {"return", TokenType::RETURN},
        {"yield", TokenType::YIELD},
        {"with", TokenType::WITH},
        {"assert", TokenType::ASSERT},

        // exceptions
        {"try", TokenType::TRY},
        {"except", TokenType::EXCEPT},
        {"finally", TokenType::FINALLY},
        {"raise", TokenType::RAISE}};
    return keywords;
}

}  // namespace

Token keyword_lookup(const std::string& word) {
    auto it = keyword_table().find(word);
    if (it != keyword_table().end()) return Token(it->second);
    return Token(TokenType::IDENTIFIER, word);
}

bool is_keyword(const std::string& word) {
    return keyword_table().count(word) != 0;
}
