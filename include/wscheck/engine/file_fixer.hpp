#pragma once

#include "wscheck/core/violation.hpp"
#include "wscheck/interfaces.hpp"

namespace wscheck {

// Rewrites a scanned file with tabs expanded and trailing whitespace removed.
// The content is re-read at fix time; the last writer wins.
class FileFixer {
private:
    IFileSystem& filesystem_;

public:
    explicit FileFixer(IFileSystem& filesystem);

    // Throws std::logic_error when given a binary or unreadable result
    auto fix(const FileCheckResult& result, size_t tab_size) -> FixOutcome;
};

} // namespace wscheck
