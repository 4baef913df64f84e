#include "line_reader.hpp"

#include <unicode/utf8.h>

#include <cstdint>
#include <utility>

std::u32string decode_utf8(const std::string& text) {
    std::u32string out;
    out.reserve(text.size());
    const uint8_t* s = reinterpret_cast<const uint8_t*>(text.data());
    int32_t length = static_cast<int32_t>(text.size());
    int32_t i = 0;
    while (i < length) {
        UChar32 c;
        U8_NEXT(s, i, length, c);
        if (c < 0) c = 0xFFFD;
        out.push_back(static_cast<char32_t>(c));
    }
    return out;
}

void append_utf8(std::string& out, char32_t c) {
    uint8_t buf[U8_MAX_LENGTH];
    int32_t len = 0;
    U8_APPEND_UNSAFE(buf, len, static_cast<UChar32>(c));
    out.append(reinterpret_cast<const char*>(buf), static_cast<size_t>(len));
}

std::string to_utf8(char32_t c) {
    std::string s;
    append_utf8(s, c);
    return s;
}

unsigned measure_indentation(const std::u32string& leading) {
    unsigned width = 0;
    for (char32_t c : leading) {
        if (c == U'\t') {
            width += TAB_STOP_SIZE - width % TAB_STOP_SIZE;
        } else {
            width++;
        }
    }
    return width;
}

LineCursor::LineCursor(int number, std::u32string text)
    : number_(number), chars_(std::move(text)) {
    while (!at_end() && is_space(chars_[pos_])) {
        leading_.push_back(chars_[pos_]);
        pos_++;
    }
    indentation_ = measure_indentation(leading_);
}

LineReader::LineReader(const std::string& source) : src(source) {
    // skip UTF-8 BOM if present
    if (src.size() >= 3 && (unsigned char)src[0] == 0xEF && (unsigned char)src[1] == 0xBB && (unsigned char)src[2] == 0xBF) {
        i = 3;
    }
}

std::optional<LineCursor> LineReader::next_line() {
    if (i >= src.size()) return std::nullopt;

    size_t end = src.find('\n', i);
    size_t next = end == std::string::npos ? src.size() : end + 1;
    if (end == std::string::npos) end = src.size();

    // CRLF: drop the carriage return that precedes the line feed
    size_t stop = end;
    if (stop > i && src[stop - 1] == '\r') stop--;

    std::u32string text = decode_utf8(src.substr(i, stop - i));
    i = next;
    line_number_++;
    return LineCursor(line_number_, std::move(text));
}
