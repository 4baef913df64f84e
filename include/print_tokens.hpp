#pragma once
#include <nlohmann/json.hpp>
#include <ostream>
#include <vector>

#include "LexError.hpp"
#include "SourceManager.hpp"

// Human-readable dump, one item per line, between banners.
void print_tokens(const std::vector<LexResult>& items, std::ostream& out, bool use_color = false);

// Each error with the offending source line and a caret under it.
void print_lex_errors(const std::vector<LexResult>& items, const SourceManager& src, std::ostream& out, bool use_color = false);

// [{"line": n, "token": NAME, "value": ...} | {"line": n, "error": KIND, "detail": ...}]
nlohmann::json tokens_to_json(const std::vector<LexResult>& items);
