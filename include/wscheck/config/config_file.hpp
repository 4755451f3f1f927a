#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace wscheck {

// Invalid configuration; always fatal, raised before any file is scanned
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

inline constexpr const char* kDefaultConfigFile = ".wscheckrc";
inline constexpr const char* kConfigSection = "wscheck";

// Values found in the [wscheck] section of a config file
struct FileSettings {
    std::optional<size_t> tab_size;
    std::optional<std::vector<std::string>> checked_exts;  // Set but empty: check all files
    std::vector<std::string> ignored_files;
};

// Extensions checked when no config file sets checked_exts
auto default_checked_exts() -> std::vector<std::string>;

// Parse INI-style text; source_name is only used in error messages
auto parse_config(const std::string& text, const std::string& source_name) -> FileSettings;

// nullopt when the file does not exist and is not required
auto load_config(const std::string& path, bool required) -> std::optional<FileSettings>;

// Strictly positive decimal integer
auto parse_tab_size(const std::string& value, const std::string& source_name) -> size_t;

} // namespace wscheck
