#pragma once

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace wscheck {

enum class ViolationKind {
    TAB,                 // Horizontal tab inside the line
    TRAILING_WHITESPACE  // Run of spaces/tabs at end of line
};

struct Violation {
    size_t line{};    // 1-based
    size_t column{};  // 1-based, raw characters (tabs are not expanded)
    ViolationKind kind{ViolationKind::TAB};
    char raw_char{};

    auto operator==(const Violation& other) const -> bool = default;
};

struct FileCheckResult {
    std::string path;
    bool is_binary = false;
    bool readable = true;
    std::vector<Violation> violations;  // Ordered by (line, column)
    size_t line_count{};
    std::string error;  // Read failure, only set when !readable
    std::map<size_t, std::string> flagged_lines;  // Text of lines with violations, by line number

    auto has_violations() const -> bool { return !violations.empty(); }
};

struct FixOutcome {
    std::string path;
    size_t violations_fixed{};
    std::optional<std::string> write_error;
};

// Per-run accumulator, owned by a single RunController::run() call
struct Summary {
    size_t files_checked{};
    size_t files_with_violations{};
    size_t total_violations{};
    size_t files_fixed{};
    size_t files_skipped{};  // Binary
    size_t files_ignored{};  // Filtered out before scanning
    std::vector<std::pair<std::string, std::string>> errors;  // (path, message)

    auto failed() const -> bool { return total_violations > 0 || !errors.empty(); }
};

// Closed set of report verbosities; quiet excludes the others
enum class OutputMode {
    QUIET,
    NORMAL,
    VERBOSE,  // NORMAL plus a marker line under each offending line
    DEBUG
};

auto kind_display_name(ViolationKind kind) -> std::string;

// Like kind_display_name, but a trailing run starting at column 1 is
// "all whitespace"
auto violation_display_name(const Violation& violation) -> std::string;
auto mode_display_name(OutputMode mode) -> std::string;

// Character shown for a violation, e.g. "\t" rendered as "\\t"
auto raw_char_display(char c) -> std::string;

} // namespace wscheck
