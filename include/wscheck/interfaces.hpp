#pragma once

#include <optional>
#include <string>

namespace wscheck {

struct ReadResult {
    std::optional<std::string> content;
    std::string error;  // Set when content is empty
};

// Abstract interfaces for dependency injection
class IFileSystem {
public:
    virtual ~IFileSystem() = default;
    virtual auto read_file(const std::string& path) -> ReadResult = 0;
    // Replace the file's content atomically; returns the error message on failure
    virtual auto write_file(const std::string& path, const std::string& content)
        -> std::optional<std::string> = 0;
};

} // namespace wscheck
