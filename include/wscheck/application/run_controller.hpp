#pragma once

#include "wscheck/core/violation.hpp"
#include "wscheck/interfaces.hpp"
#include "wscheck/types.hpp"
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace wscheck {

class Reporter;

// Where a candidate file ended up after scanning (and fixing, if requested)
enum class FileState {
    IGNORED,
    SKIPPED_BINARY,
    UNREADABLE,
    SCANNED,
    FIXED,
    FIX_FAILED
};

auto file_state_name(FileState state) -> std::string;

// Scans each candidate in order, optionally fixes it, reports it, and folds
// the outcome into the run's Summary.
class RunController {
private:
    std::unique_ptr<IFileSystem> filesystem_;
    std::ostream& out_;
    std::ostream& err_;
    Summary summary_;
    std::vector<std::pair<std::string, FileState>> file_states_;

public:
    explicit RunController(std::unique_ptr<IFileSystem> filesystem, std::ostream& out = std::cout,
                           std::ostream& err = std::cerr);

    // Returns 0 when nothing was wrong, 1 when violations were found (fixed
    // or not) or any file could not be read or written. Throws ConfigError
    // for a zero tab size before touching any file.
    auto run(const std::vector<std::string>& paths, const RunOptions& options) -> int;
    auto run(const std::vector<std::string>& paths, size_t tab_size, bool fixup, OutputMode mode)
        -> int;

    // Summary of the most recent run
    auto summary() const -> const Summary& { return summary_; }
    auto file_states() const -> const std::vector<std::pair<std::string, FileState>>& {
        return file_states_;
    }

private:
    auto process_file(const std::string& path, const RunOptions& options, Reporter& reporter,
                      Summary& summary) -> FileState;
};

// Run against the real file system, writing to stdout/stderr
auto run(const std::vector<std::string>& paths, size_t tab_size, bool fixup, OutputMode mode)
    -> int;

} // namespace wscheck
