#include "wscheck/core/line_classifier.hpp"

namespace wscheck {

auto is_blank_char(char c) -> bool {
    return c == ' ' || c == '\t';
}

auto classify_line(std::string_view line, size_t line_number) -> std::vector<Violation> {
    std::vector<Violation> violations;

    // Start of the trailing run; equals line.size() when there is none
    size_t trailing_start = line.size();
    while (trailing_start > 0 && is_blank_char(line[trailing_start - 1])) {
        --trailing_start;
    }

    for (size_t i = 0; i < trailing_start; ++i) {
        if (line[i] == '\t') {
            violations.push_back(Violation{.line = line_number,
                                           .column = i + 1,
                                           .kind = ViolationKind::TAB,
                                           .raw_char = line[i]});
        }
    }

    if (trailing_start < line.size()) {
        violations.push_back(Violation{.line = line_number,
                                       .column = trailing_start + 1,
                                       .kind = ViolationKind::TRAILING_WHITESPACE,
                                       .raw_char = line[trailing_start]});
    }

    return violations;
}

} // namespace wscheck
