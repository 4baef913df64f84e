#pragma once
#include <map>
#include <sstream>
#include <string>

// Keeps the full source text and a line map for diagnostics.
class SourceManager {
   public:
    std::string filename;
    std::string source;
    std::map<int, std::string> lines;

    SourceManager(const std::string& fname, const std::string& src)
        : filename(fname), source(src) {
        build_line_map();
    }

    std::string get_line(int line_num) const {
        auto it = lines.find(line_num);
        return it != lines.end() ? it->second : "";
    }

    int line_count() const { return static_cast<int>(lines.size()); }

    std::string location(int line) const {
        return (filename.empty() ? "<stdin>" : filename) + ":" + std::to_string(line);
    }

    // ` * 12 | text` followed by a caret under `col` (1-based).
    std::string format_error_context(int line, int col = 1) const {
        std::stringstream ss;
        ss << " * " << line << " | ";
        std::string prefix = ss.str();
        std::string line_text = get_line(line);
        ss << line_text << "\n";
        ss << std::string(prefix.size() + (col > 1 ? col - 1 : 0), ' ') << "^";
        return ss.str();
    }

   private:
    void build_line_map() {
        int line_num = 1;
        std::string current_line;

        for (char c : source) {
            if (c == '\n') {
                if (!current_line.empty() && current_line.back() == '\r') current_line.pop_back();
                lines[line_num] = current_line;
                current_line.clear();
                line_num++;
            } else {
                current_line += c;
            }
        }
        if (!current_line.empty()) {
            if (current_line.back() == '\r') current_line.pop_back();
            lines[line_num] = current_line;
        }
    }
};
