#include "wscheck/report/reporter.hpp"
#include "wscheck/core/whitespace_fix.hpp"

namespace wscheck {

namespace {

auto yes_no(bool value) -> const char* {
    return value ? "yes" : "no";
}

auto join_words(const std::vector<std::string>& words) -> std::string {
    if (words.empty()) {
        return "(none)";
    }
    std::string joined;
    for (const auto& word : words) {
        if (!joined.empty()) {
            joined += ' ';
        }
        joined += word;
    }
    return joined;
}

} // namespace

Reporter::Reporter(std::ostream& out, std::ostream& err, OutputMode mode, size_t tab_size)
    : out_(out), err_(err), mode_(mode), tab_size_(tab_size) {}

auto Reporter::report_settings(const RunOptions& options) -> void {
    if (mode_ != OutputMode::DEBUG) {
        return;
    }

    out_ << "wscheck: tab size: " << options.tab_size << "\n";
    out_ << "wscheck: fixup: " << yes_no(options.fixup) << "\n";
    out_ << "wscheck: checked extensions: "
         << (options.checked_exts.empty() ? std::string("(all)") : join_words(options.checked_exts))
         << "\n";
    out_ << "wscheck: ignored files: " << join_words(options.ignored_files) << "\n";
}

auto Reporter::report_ignored(const std::string& path, const std::string& reason) -> void {
    if (mode_ == OutputMode::DEBUG) {
        out_ << "wscheck: ignoring " << path << " (" << reason << ")\n";
    }
}

auto Reporter::report(const FileCheckResult& result) -> void {
    switch (mode_) {
    case OutputMode::QUIET:
        break;
    case OutputMode::NORMAL:
        report_normal(result, false);
        break;
    case OutputMode::VERBOSE:
        report_normal(result, true);
        break;
    case OutputMode::DEBUG:
        report_debug(result);
        break;
    }
}

auto Reporter::report_normal(const FileCheckResult& result, bool show_markers) -> void {
    if (!result.has_violations()) {
        return;
    }

    out_ << result.path << "\n";
    const auto& violations = result.violations;
    for (size_t i = 0; i < violations.size(); ++i) {
        out_ << "  line " << violations[i].line << ": " << violation_display_name(violations[i])
             << "\n";
        bool last_on_line =
            i + 1 == violations.size() || violations[i + 1].line != violations[i].line;
        if (show_markers && last_on_line) {
            report_markers(result, violations[i].line);
        }
    }
}

auto Reporter::report_markers(const FileCheckResult& result, size_t line) -> void {
    auto it = result.flagged_lines.find(line);
    if (it == result.flagged_lines.end()) {
        return;
    }

    auto marked = mark_violations(it->second, tab_size_);
    out_ << "    " << marked.expanded << "\n";
    out_ << "    " << marked.markers << "\n";
}

auto Reporter::report_debug(const FileCheckResult& result) -> void {
    out_ << "wscheck: checking " << result.path << ": readable=" << yes_no(result.readable)
         << " binary=" << yes_no(result.is_binary) << " lines=" << result.line_count
         << " tab-size=" << tab_size_ << "\n";

    if (!result.readable) {
        out_ << "  skipping " << result.path << " (unreadable: " << result.error << ")\n";
        return;
    }
    if (result.is_binary) {
        out_ << "  skipping " << result.path << " (binary)\n";
        return;
    }
    if (!result.has_violations()) {
        out_ << "  " << result.path << ": ok\n";
        return;
    }

    const auto& violations = result.violations;
    for (size_t i = 0; i < violations.size(); ++i) {
        out_ << "  line " << violations[i].line << ", column " << violations[i].column << ": "
             << violation_display_name(violations[i]) << " ("
             << raw_char_display(violations[i].raw_char) << ")\n";
        if (i + 1 == violations.size() || violations[i + 1].line != violations[i].line) {
            report_markers(result, violations[i].line);
        }
    }
}

auto Reporter::report_fix(const FixOutcome& outcome) -> void {
    if (mode_ == OutputMode::QUIET) {
        return;
    }

    if (outcome.write_error) {
        out_ << "wscheck: fixing " << outcome.path << " failed: " << *outcome.write_error << "\n";
        return;
    }

    out_ << "wscheck: fixing " << outcome.path << " (" << outcome.violations_fixed
         << " violation(s))\n";
}

auto Reporter::note(const std::string& message) -> void {
    if (mode_ == OutputMode::DEBUG) {
        out_ << "wscheck: " << message << "\n";
    }
}

auto Reporter::report_summary(const Summary& summary) -> void {
    out_ << "wscheck: checked " << summary.files_checked << " file(s), ";
    if (summary.total_violations > 0) {
        out_ << summary.total_violations << " problem(s) found in "
             << summary.files_with_violations << " file(s)\n";
    } else {
        out_ << "no problems found\n";
    }

    if (summary.files_fixed > 0) {
        out_ << "wscheck: fixed " << summary.files_fixed << " file(s)\n";
    }

    if (mode_ == OutputMode::DEBUG) {
        out_ << "wscheck: skipped " << summary.files_skipped << " binary file(s), ignored "
             << summary.files_ignored << " file(s)\n";
    }

    if (summary.errors.empty()) {
        return;
    }

    if (mode_ != OutputMode::QUIET) {
        for (const auto& [path, message] : summary.errors) {
            err_ << "wscheck: error: " << path << ": " << message << "\n";
        }
    }
    err_ << "wscheck: " << summary.errors.size() << " error(s)\n";
}

} // namespace wscheck
