#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "LexError.hpp"
#include "indentation.hpp"
#include "line_reader.hpp"
#include "token.hpp"
#include "token_source.hpp"

// Simplified identifier predicates (Unicode Alphabetic / numeric categories
// plus underscore) standing in for XID_Start / XID_Continue.
bool is_xid_start(char32_t c);
bool is_xid_continue(char32_t c);

// Recognised string/bytes prefix at the cursor: u, r, b, rb, br (any case).
struct LiteralPrefix {
    bool is_bytes = false;
    bool is_raw = false;
    size_t length = 0;  // prefix letters before the opening quote
};

std::optional<LiteralPrefix> detect_literal_prefix(const LineCursor& line);

// Numeric literal starting at the cursor (a digit, or '.' followed by a digit).
TokenOrError scan_number(LineCursor& line);

// Core scanner: pulls physical lines lazily and yields raw (line, token|error)
// items. String and bytes literals are not joined here.
class Scanner : public TokenSource {
   public:
    explicit Scanner(const std::string& source);

    std::optional<LexResult> next() override;

    unsigned bracket_depth() const { return paren_level; }
    const IndentTracker& indentation() const { return indents; }

   private:
    LineReader lines;
    std::optional<LineCursor> current_line;
    IndentTracker indents;

    // unmatched ( [ { (suppresses NEWLINE and indentation inside brackets)
    unsigned paren_level = 0;

    std::optional<LexResult> handle_line_start(LineCursor line);
    LexResult scan_identifier(LineCursor& line);
    LexResult scan_symbol(LineCursor& line);

    // string / bytes literals (lexer_strings.cpp)
    LexResult scan_literal(const LiteralPrefix& prefix);
    // Handles the character after a backslash; an error item on failure.
    std::optional<LexResult> decode_escape(std::string& out, const LiteralPrefix& prefix, bool is_triple);
};

// Public lexer: scanner -> bytes joiner -> string joiner.
class Lexer : public TokenSource {
   public:
    Lexer(const std::string& source, const std::string& filename = "");

    std::optional<LexResult> next() override;

    // Drain the remaining stream.
    std::vector<LexResult> tokenize();

    const std::string& filename() const { return filename_; }

   private:
    std::string filename_;
    std::unique_ptr<TokenSource> stages;
};
