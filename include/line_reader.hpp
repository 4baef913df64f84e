#pragma once

#include <cstddef>
#include <optional>
#include <string>

// Columns a tab advances to (next multiple of this value).
constexpr unsigned TAB_STOP_SIZE = 8;

// Inter-token whitespace. Carriage return is treated as plain whitespace.
inline bool is_space(char32_t c) {
    return c == U' ' || c == U'\t' || c == U'\f' || c == U'\r';
}

// One physical line, positioned after its leading whitespace.
class LineCursor {
   public:
    LineCursor(int number, std::u32string text);

    int number() const { return number_; }
    unsigned indentation() const { return indentation_; }
    const std::u32string& leading_spaces() const { return leading_; }

    bool at_end() const { return pos_ >= chars_.size(); }

    // Code point `offset` positions ahead, or 0 past the end of the line.
    char32_t peek(size_t offset = 0) const {
        size_t idx = pos_ + offset;
        return idx < chars_.size() ? chars_[idx] : 0;
    }
    bool peek_is(char32_t c, size_t offset = 0) const {
        return pos_ + offset < chars_.size() && chars_[pos_ + offset] == c;
    }

    char32_t advance() {
        if (at_end()) return 0;
        return chars_[pos_++];
    }

    // True when nothing but a comment remains: blank or comment-only line.
    bool is_logically_blank() const { return at_end() || peek() == U'#'; }

    void skip_spaces() {
        while (!at_end() && is_space(chars_[pos_])) pos_++;
    }

   private:
    int number_;
    unsigned indentation_ = 0;
    std::u32string leading_;
    std::u32string chars_;
    size_t pos_ = 0;
};

// Width of a run of leading whitespace with tab stops expanded.
unsigned measure_indentation(const std::u32string& leading);

// Splits a UTF-8 buffer into physical lines on demand.
class LineReader {
   public:
    explicit LineReader(const std::string& source);

    std::optional<LineCursor> next_line();

    // Number of the most recently produced line (0 before the first one).
    int last_line_number() const { return line_number_; }

   private:
    const std::string src;
    size_t i = 0;
    int line_number_ = 0;
};

// Decodes UTF-8 text into code points (ill-formed input becomes U+FFFD).
std::u32string decode_utf8(const std::string& text);

// Appends a code point to a UTF-8 string.
void append_utf8(std::string& out, char32_t c);

std::string to_utf8(char32_t c);
