#include "print_tokens.hpp"

#include <string>
#include <utility>

#include "colors.hpp"

static std::string paint(const std::string& text, const std::string& color, bool use_color) {
    return use_color ? color + text + Color::reset : text;
}

void print_tokens(const std::vector<LexResult>& items, std::ostream& out, bool use_color) {
    out << "---- TOKEN DUMP (" << items.size() << " items) ----\n";
    for (const LexResult& item : items) {
        out << item.line << ": ";
        if (item.ok()) {
            const Token& tok = item.token();
            out << paint(token_type_name(tok.type), Color::cyan, use_color);
            if (has_payload(tok.type)) {
                // debug_string already renders the payload after the name
                std::string rendered = tok.debug_string();
                out << rendered.substr(std::string(token_type_name(tok.type)).size());
            }
        } else {
            const LexError& err = item.error();
            out << paint(std::string("error ") + lex_error_kind_name(err.kind), Color::red, use_color)
                << ": " << err.message();
        }
        out << "\n";
    }
    out << "---- END TOKEN DUMP ----\n";
}

void print_lex_errors(const std::vector<LexResult>& items, const SourceManager& src, std::ostream& out, bool use_color) {
    for (const LexResult& item : items) {
        if (item.ok()) continue;
        const LexError& err = item.error();
        out << paint("error", Color::bright_red, use_color) << " at " << src.location(item.line)
            << ": " << err.message() << "\n";
        if (item.line >= 1 && item.line <= src.line_count()) {
            out << src.format_error_context(item.line) << "\n";
        }
    }
}

nlohmann::json tokens_to_json(const std::vector<LexResult>& items) {
    nlohmann::json arr = nlohmann::json::array();
    for (const LexResult& item : items) {
        nlohmann::json j;
        j["line"] = item.line;
        if (item.ok()) {
            const Token& tok = item.token();
            j["token"] = token_type_name(tok.type);
            if (tok.type == TokenType::BYTES) {
                j["value"] = tok.bytes();
            } else if (has_payload(tok.type)) {
                j["value"] = tok.value;
            }
        } else {
            const LexError& err = item.error();
            j["error"] = lex_error_kind_name(err.kind);
            if (!err.detail.empty()) j["detail"] = err.detail;
            j["message"] = err.message();
        }
        arr.push_back(std::move(j));
    }
    return arr;
}
