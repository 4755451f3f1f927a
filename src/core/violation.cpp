#include "wscheck/core/violation.hpp"

namespace wscheck {

auto kind_display_name(ViolationKind kind) -> std::string {
    switch (kind) {
    case ViolationKind::TAB:
        return "tab character";
    case ViolationKind::TRAILING_WHITESPACE:
        return "trailing whitespace";
    }
    return "unknown";
}

auto violation_display_name(const Violation& violation) -> std::string {
    if (violation.kind == ViolationKind::TRAILING_WHITESPACE && violation.column == 1) {
        return "all whitespace";
    }
    return kind_display_name(violation.kind);
}

auto mode_display_name(OutputMode mode) -> std::string {
    switch (mode) {
    case OutputMode::QUIET:
        return "quiet";
    case OutputMode::NORMAL:
        return "normal";
    case OutputMode::VERBOSE:
        return "verbose";
    case OutputMode::DEBUG:
        return "debug";
    }
    return "unknown";
}

auto raw_char_display(char c) -> std::string {
    switch (c) {
    case '\t':
        return "\\t";
    case ' ':
        return "' '";
    default:
        return std::string(1, c);
    }
}

} // namespace wscheck
