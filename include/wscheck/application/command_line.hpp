#pragma once

#include "wscheck/config/config_file.hpp"
#include "wscheck/types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace wscheck {

struct AppOptions {
    std::vector<std::string> paths;       // Empty: read candidates from stdin
    std::optional<size_t> tab_size;       // Overrides the config file
    bool fixup = false;
    OutputMode mode = OutputMode::NORMAL;
    std::optional<std::string> config_path;
    bool show_help = false;
};

// Parse arguments (without argv[0]). Throws ConfigError on bad usage.
auto parse_args(const std::vector<std::string>& args) -> AppOptions;

// Command line wins over the config file, which wins over built-in defaults
auto resolve_run_options(const AppOptions& app, const std::optional<FileSettings>& file)
    -> RunOptions;

auto usage_text() -> std::string;

} // namespace wscheck
