#pragma once

#include <optional>
#include <vector>

#include "LexError.hpp"

// Outcome of evaluating the indentation of a non-blank line start.
enum class IndentChange {
    NONE,
    INDENT,
    DEDENT  // dedents are now pending, drain them with take_pending()
};

// Dedent run still to be emitted.
// BALANCED: `remaining` ordinary dedents.
// MISMATCHED: `remaining` ordinary dedents, then one DEDENT error.
struct DedentRun {
    enum class Mode { BALANCED, MISMATCHED };

    Mode mode = Mode::BALANCED;
    unsigned remaining = 0;

    bool empty() const { return mode == Mode::BALANCED && remaining == 0; }
};

// Indentation stack (base 0) and the pending dedent run.
class IndentTracker {
   public:
    IndentTracker();

    // Compare a line's indentation width against the stack and update it.
    // Throws LexerFault if the stack was found empty.
    IndentChange at_line_start(unsigned width, int line);

    bool has_pending() const { return !pending_.empty(); }

    // One item of the pending run: a DEDENT token or the misalignment error.
    TokenOrError take_pending();

    // End of input: pop one remaining level. False once only the base is left.
    bool pop_remaining();

    size_t depth() const { return indent_stack.size(); }
    unsigned current() const { return indent_stack.back(); }
    const std::vector<unsigned>& levels() const { return indent_stack; }
    const DedentRun& pending() const { return pending_; }

   private:
    std::vector<unsigned> indent_stack;
    DedentRun pending_;
};
