#include "literal_join.hpp"

#include <utility>

PeekableSource::PeekableSource(std::unique_ptr<TokenSource> inner)
    : inner_(std::move(inner)) {}

const std::optional<LexResult>& PeekableSource::peek() {
    if (!has_peeked_) {
        peeked_ = inner_->next();
        has_peeked_ = true;
    }
    return peeked_;
}

std::optional<LexResult> PeekableSource::next() {
    if (has_peeked_) {
        has_peeked_ = false;
        return std::move(peeked_);
    }
    return inner_->next();
}

LiteralJoiner::LiteralJoiner(std::unique_ptr<TokenSource> inner, TokenType literal)
    : source_(std::move(inner)), literal_(literal) {}

bool LiteralJoiner::literal_follows() {
    const auto& upcoming = source_.peek();
    return upcoming.has_value() && upcoming->is(literal_);
}

std::optional<LexResult> LiteralJoiner::next() {
    std::optional<LexResult> item = source_.next();
    if (!item || !item->is(literal_)) return item;

    Token merged = item->token();
    while (literal_follows()) {
        std::optional<LexResult> follow = source_.next();
        merged.value += follow->token().value;
    }
    return LexResult(item->line, std::move(merged));
}
