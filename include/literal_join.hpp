#pragma once

#include <memory>
#include <optional>
#include <utility>

#include "token_source.hpp"

// Wraps a source with one item of lookahead.
class PeekableSource {
   public:
    explicit PeekableSource(std::unique_ptr<TokenSource> inner);

    const std::optional<LexResult>& peek();
    std::optional<LexResult> next();

   private:
    std::unique_ptr<TokenSource> inner_;
    std::optional<LexResult> peeked_;
    bool has_peeked_ = false;
};

// Merges a run of adjacent literal tokens of one type into a single token
// carrying the line of the first one.
class LiteralJoiner : public TokenSource {
   public:
    LiteralJoiner(std::unique_ptr<TokenSource> inner, TokenType literal);

    std::optional<LexResult> next() override;

   private:
    PeekableSource source_;
    TokenType literal_;

    bool literal_follows();
};

class BytesJoiner : public LiteralJoiner {
   public:
    explicit BytesJoiner(std::unique_ptr<TokenSource> inner)
        : LiteralJoiner(std::move(inner), TokenType::BYTES) {}
};

class StringJoiner : public LiteralJoiner {
   public:
    explicit StringJoiner(std::unique_ptr<TokenSource> inner)
        : LiteralJoiner(std::move(inner), TokenType::STRING) {}
};
