#include "wscheck/engine/file_scanner.hpp"
#include "wscheck/core/file_check.hpp"

namespace wscheck {

FileScanner::FileScanner(IFileSystem& filesystem) : filesystem_(filesystem) {}

auto FileScanner::scan(const std::string& path) -> FileCheckResult {
    auto read = filesystem_.read_file(path);
    if (!read.content) {
        return unreadable_result(path, read.error);
    }
    return scan_content(path, *read.content);
}

} // namespace wscheck
