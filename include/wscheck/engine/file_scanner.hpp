#pragma once

#include "wscheck/core/violation.hpp"
#include "wscheck/interfaces.hpp"
#include <string>

namespace wscheck {

// Reads a file through the injected file system and classifies it. Content
// problems and read failures are reported in the result, never thrown.
class FileScanner {
private:
    IFileSystem& filesystem_;

public:
    explicit FileScanner(IFileSystem& filesystem);

    auto scan(const std::string& path) -> FileCheckResult;
};

} // namespace wscheck
