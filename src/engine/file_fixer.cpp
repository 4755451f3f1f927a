#include "wscheck/engine/file_fixer.hpp"
#include "wscheck/core/whitespace_fix.hpp"
#include <stdexcept>

namespace wscheck {

FileFixer::FileFixer(IFileSystem& filesystem) : filesystem_(filesystem) {}

auto FileFixer::fix(const FileCheckResult& result, size_t tab_size) -> FixOutcome {
    if (!result.readable || result.is_binary) {
        throw std::logic_error("cannot fix " + result.path + ": file was not scanned as text");
    }

    FixOutcome outcome{.path = result.path,
                       .violations_fixed = result.violations.size(),
                       .write_error = std::nullopt};

    auto read = filesystem_.read_file(result.path);
    if (!read.content) {
        outcome.write_error = "cannot re-read file: " + read.error;
        return outcome;
    }

    auto fixed = fix_content(*read.content, tab_size);
    if (fixed == *read.content) {
        return outcome;  // Already clean on disk
    }

    outcome.write_error = filesystem_.write_file(result.path, fixed);
    return outcome;
}

} // namespace wscheck
