#pragma once

#include <string>

#include "token.hpp"

// Keyword token for a reserved word, IDENTIFIER (carrying `word`) otherwise.
Token keyword_lookup(const std::string& word);

bool is_keyword(const std::string& word);
