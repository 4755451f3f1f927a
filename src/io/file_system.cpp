#include "wscheck/io/file_system.hpp"
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <system_error>
#include <unistd.h>

namespace wscheck {

auto FileSystem::read_file(const std::string& path) -> ReadResult {
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        return ReadResult{.content = std::nullopt, .error = "is a directory"};
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return ReadResult{.content = std::nullopt, .error = std::strerror(errno)};
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return ReadResult{.content = std::nullopt, .error = "read error"};
    }

    return ReadResult{.content = buffer.str(), .error = ""};
}

auto FileSystem::write_file(const std::string& path, const std::string& content)
    -> std::optional<std::string> {
    auto target = resolve_target(path);
    auto temp_path = temp_path_for(target);

    try {
        // Write to temporary file first for atomic operation
        {
            std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
            if (!file.is_open()) {
                return "cannot create " + temp_path.string() + ": " + std::strerror(errno);
            }

            file.write(content.data(), static_cast<std::streamsize>(content.size()));
            file.flush();
            if (file.fail()) {
                file.close();
                std::error_code ignored;
                std::filesystem::remove(temp_path, ignored);
                return "write to " + temp_path.string() + " failed";
            }
        }

        // Keep the original file's permissions on the replacement
        std::error_code status_ec;
        auto original_status = std::filesystem::status(target, status_ec);
        if (!status_ec && std::filesystem::exists(original_status)) {
            std::filesystem::permissions(temp_path, original_status.permissions());
        }

        std::filesystem::rename(temp_path, target);
        return std::nullopt;

    } catch (const std::filesystem::filesystem_error& e) {
        std::error_code ignored;
        std::filesystem::remove(temp_path, ignored);
        return std::string(e.code().message());
    }
}

auto FileSystem::resolve_target(const std::string& path) -> std::filesystem::path {
    // Write through symlinks so the link survives and its target is replaced
    std::error_code ec;
    if (std::filesystem::is_symlink(std::filesystem::symlink_status(path, ec))) {
        auto resolved = std::filesystem::canonical(path, ec);
        if (!ec) {
            return resolved;
        }
    }
    return std::filesystem::path(path);
}

auto FileSystem::temp_path_for(const std::filesystem::path& target) -> std::filesystem::path {
    auto temp = target;
    temp += ".wscheck-" + std::to_string(::getpid()) + ".tmp";
    return temp;
}

} // namespace wscheck
