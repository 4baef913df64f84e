#include "indentation.hpp"

IndentTracker::IndentTracker() {
    indent_stack.push_back(0);
}

IndentChange IndentTracker::at_line_start(unsigned width, int line) {
    if (indent_stack.empty()) {
        throw LexerFault("indentation stack is empty", line);
    }

    unsigned curIndent = indent_stack.back();
    if (width > curIndent) {
        indent_stack.push_back(width);
        return IndentChange::INDENT;
    }
    if (width == curIndent) {
        return IndentChange::NONE;
    }

    unsigned popped = 0;
    while (indent_stack.size() > 1 && width < indent_stack.back()) {
        indent_stack.pop_back();
        popped++;
    }

    if (indent_stack.back() == width) {
        pending_.mode = DedentRun::Mode::BALANCED;
        pending_.remaining = popped;
    } else {
        // landed between two levels: the last level of the run becomes the error
        pending_.mode = DedentRun::Mode::MISMATCHED;
        pending_.remaining = popped - 1;
    }
    return IndentChange::DEDENT;
}

TokenOrError IndentTracker::take_pending() {
    if (pending_.remaining > 0) {
        pending_.remaining--;
        return Token(TokenType::DEDENT);
    }
    if (pending_.mode == DedentRun::Mode::MISMATCHED) {
        pending_.mode = DedentRun::Mode::BALANCED;
        return LexError(LexErrorKind::DEDENT);
    }
    return LexError(LexErrorKind::INTERNAL, "no pending dedent");
}

bool IndentTracker::pop_remaining() {
    if (indent_stack.size() <= 1) return false;
    indent_stack.pop_back();
    return true;
}
