#pragma once

#include "wscheck/interfaces.hpp"
#include <filesystem>
#include <string>

namespace wscheck {

class FileSystem : public IFileSystem {
public:
    auto read_file(const std::string& path) -> ReadResult override;
    auto write_file(const std::string& path, const std::string& content)
        -> std::optional<std::string> override;

private:
    auto resolve_target(const std::string& path) -> std::filesystem::path;
    auto temp_path_for(const std::filesystem::path& target) -> std::filesystem::path;
};

} // namespace wscheck
