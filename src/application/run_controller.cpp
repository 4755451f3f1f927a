#include "wscheck/application/run_controller.hpp"
#include "wscheck/config/config_file.hpp"
#include "wscheck/core/candidate_filter.hpp"
#include "wscheck/engine/file_fixer.hpp"
#include "wscheck/engine/file_scanner.hpp"
#include "wscheck/io/file_system.hpp"
#include "wscheck/report/reporter.hpp"

namespace wscheck {

auto file_state_name(FileState state) -> std::string {
    switch (state) {
    case FileState::IGNORED:
        return "ignored";
    case FileState::SKIPPED_BINARY:
        return "skipped (binary)";
    case FileState::UNREADABLE:
        return "unreadable";
    case FileState::SCANNED:
        return "scanned";
    case FileState::FIXED:
        return "fixed";
    case FileState::FIX_FAILED:
        return "fix failed";
    }
    return "unknown";
}

RunController::RunController(std::unique_ptr<IFileSystem> filesystem, std::ostream& out,
                             std::ostream& err)
    : filesystem_(std::move(filesystem)), out_(out), err_(err) {}

auto RunController::run(const std::vector<std::string>& paths, size_t tab_size, bool fixup,
                        OutputMode mode) -> int {
    RunOptions options;
    options.tab_size = tab_size;
    options.fixup = fixup;
    options.mode = mode;
    return run(paths, options);
}

auto RunController::run(const std::vector<std::string>& paths, const RunOptions& options) -> int {
    if (options.tab_size == 0) {
        throw ConfigError("tab size must be a positive integer");
    }

    Summary summary;
    file_states_.clear();
    Reporter reporter(out_, err_, options.mode, options.tab_size);
    reporter.report_settings(options);

    for (const auto& path : dedupe_candidates(paths)) {
        auto state = process_file(path, options, reporter, summary);
        reporter.note(path + ": " + file_state_name(state));
        file_states_.emplace_back(path, state);
    }

    reporter.report_summary(summary);
    summary_ = std::move(summary);
    return summary_.failed() ? 1 : 0;
}

auto RunController::process_file(const std::string& path, const RunOptions& options,
                                 Reporter& reporter, Summary& summary) -> FileState {
    if (auto reason = ignore_reason(path, options)) {
        reporter.report_ignored(path, *reason);
        ++summary.files_ignored;
        return FileState::IGNORED;
    }

    FileScanner scanner(*filesystem_);
    auto result = scanner.scan(path);
    reporter.report(result);

    if (!result.readable) {
        summary.errors.emplace_back(path, "cannot read file: " + result.error);
        return FileState::UNREADABLE;
    }
    if (result.is_binary) {
        ++summary.files_skipped;
        return FileState::SKIPPED_BINARY;
    }

    ++summary.files_checked;
    if (!result.has_violations()) {
        return FileState::SCANNED;
    }

    ++summary.files_with_violations;
    summary.total_violations += result.violations.size();

    if (!options.fixup) {
        return FileState::SCANNED;
    }

    FileFixer fixer(*filesystem_);
    auto outcome = fixer.fix(result, options.tab_size);
    reporter.report_fix(outcome);

    if (outcome.write_error) {
        summary.errors.emplace_back(path, "cannot fix file: " + *outcome.write_error);
        return FileState::FIX_FAILED;
    }

    ++summary.files_fixed;
    return FileState::FIXED;
}

auto run(const std::vector<std::string>& paths, size_t tab_size, bool fixup, OutputMode mode)
    -> int {
    RunController controller(std::make_unique<FileSystem>());
    return controller.run(paths, tab_size, fixup, mode);
}

} // namespace wscheck
