#pragma once

#include "wscheck/core/violation.hpp"
#include "wscheck/types.hpp"
#include <ostream>
#include <string>

namespace wscheck {

// Renders per-file results and the run summary. Holds no run state; output
// is shaped only by the mode and tab size given at construction.
class Reporter {
private:
    std::ostream& out_;
    std::ostream& err_;
    OutputMode mode_;
    size_t tab_size_;

public:
    Reporter(std::ostream& out, std::ostream& err, OutputMode mode, size_t tab_size);

    auto mode() const -> OutputMode { return mode_; }

    auto report_settings(const RunOptions& options) -> void;
    auto report_ignored(const std::string& path, const std::string& reason) -> void;
    auto report(const FileCheckResult& result) -> void;
    auto report_fix(const FixOutcome& outcome) -> void;
    auto report_summary(const Summary& summary) -> void;

    // Free-form diagnostic, shown in DEBUG mode only
    auto note(const std::string& message) -> void;

private:
    auto report_normal(const FileCheckResult& result, bool show_markers) -> void;
    auto report_markers(const FileCheckResult& result, size_t line) -> void;
    auto report_debug(const FileCheckResult& result) -> void;
};

} // namespace wscheck
