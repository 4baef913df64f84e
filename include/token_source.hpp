#pragma once

#include <optional>

#include "LexError.hpp"

// Pull contract shared by the scanner and every stage wrapping it.
// std::nullopt means the stream is exhausted.
class TokenSource {
   public:
    virtual ~TokenSource() = default;
    virtual std::optional<LexResult> next() = 0;
};
