#pragma once

#include "wscheck/core/violation.hpp"
#include <string_view>
#include <vector>

namespace wscheck {

// Classify one line (terminator excluded). Tabs are reported individually
// unless they belong to the trailing whitespace run, which is reported once
// at the column of its first character. Detection does not depend on tab size.
auto classify_line(std::string_view line, size_t line_number) -> std::vector<Violation>;

auto is_blank_char(char c) -> bool;

} // namespace wscheck
