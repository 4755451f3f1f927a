#pragma once

#include <string>
#include <string_view>

namespace wscheck {

// Replace every tab with spaces up to the next multiple of tab_size, measured
// on the already expanded column
auto expand_tabs(std::string_view line, size_t tab_size) -> std::string;

// Expand tabs, then strip trailing spaces and tabs
auto fix_line(std::string_view line, size_t tab_size) -> std::string;

// A tab-expanded line with a marker row underneath: '^' under every column
// produced by a tab or by the trailing whitespace run, ' ' elsewhere
struct MarkedLine {
    std::string expanded;
    std::string markers;  // No trailing spaces
};

auto mark_violations(std::string_view line, size_t tab_size) -> MarkedLine;

// Apply fix_line to every line, keeping each line terminator as it was
auto fix_content(std::string_view content, size_t tab_size) -> std::string;

} // namespace wscheck
