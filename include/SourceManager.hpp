#pragma once
#include <sstream>
#include <string>
#include <vector>

// Keeps the text of a script so errors can quote the offending line.
class SourceManager {
   public:
    std::string filename;
    std::string source;

    SourceManager(const std::string& fname, const std::string& src)
        : filename(fname), source(src) {
        split_lines();
    }

    std::string get_line(int line_num) const {
        if (line_num < 1 || static_cast<size_t>(line_num) > lines.size()) return "";
        return lines[line_num - 1];
    }

    // " * 3 | let x = add(1, );"
    //                        ^
    std::string format_error_context(int line, int col) const {
        std::stringstream ss;
        std::string prefix = " * " + std::to_string(line) + " | ";
        ss << prefix << get_line(line) << "\n";
        ss << std::string(prefix.size() + (col > 0 ? col - 1 : 0), ' ') << "^";
        return ss.str();
    }

   private:
    std::vector<std::string> lines;

    void split_lines() {
        std::string current;
        for (char c : source) {
            if (c == '\n') {
                lines.push_back(current);
                current.clear();
            } else if (c != '\r') {
                current += c;
            }
        }
        if (!current.empty()) lines.push_back(current);
    }
};
