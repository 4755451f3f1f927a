#include "wscheck/core/whitespace_fix.hpp"
#include "wscheck/core/line_classifier.hpp"
#include "wscheck/core/text_lines.hpp"
#include <stdexcept>

namespace wscheck {

auto expand_tabs(std::string_view line, size_t tab_size) -> std::string {
    if (tab_size == 0) {
        throw std::invalid_argument("tab size must be positive");
    }

    std::string expanded;
    expanded.reserve(line.size());

    for (char c : line) {
        if (c == '\t') {
            size_t spaces = tab_size - (expanded.size() % tab_size);
            expanded.append(spaces, ' ');
        } else {
            expanded.push_back(c);
        }
    }

    return expanded;
}

auto fix_line(std::string_view line, size_t tab_size) -> std::string {
    auto expanded = expand_tabs(line, tab_size);
    auto last = expanded.find_last_not_of(" \t");
    if (last == std::string::npos) {
        return "";
    }
    expanded.erase(last + 1);
    return expanded;
}

auto mark_violations(std::string_view line, size_t tab_size) -> MarkedLine {
    if (tab_size == 0) {
        throw std::invalid_argument("tab size must be positive");
    }

    size_t trailing_start = line.size();
    while (trailing_start > 0 && is_blank_char(line[trailing_start - 1])) {
        --trailing_start;
    }

    MarkedLine marked;
    for (size_t i = 0; i < line.size(); ++i) {
        size_t width = 1;
        if (line[i] == '\t') {
            width = tab_size - (marked.expanded.size() % tab_size);
            marked.expanded.append(width, ' ');
        } else {
            marked.expanded.push_back(line[i]);
        }

        bool offending = line[i] == '\t' || i >= trailing_start;
        marked.markers.append(width, offending ? '^' : ' ');
    }

    auto last = marked.markers.find_last_not_of(' ');
    marked.markers.erase(last == std::string::npos ? 0 : last + 1);
    return marked;
}

auto fix_content(std::string_view content, size_t tab_size) -> std::string {
    auto lines = split_lines(content);
    for (auto& line : lines) {
        line.text = fix_line(line.text, tab_size);
    }
    return join_lines(lines);
}

} // namespace wscheck
