#pragma once

#include "wscheck/core/violation.hpp"
#include <string>
#include <vector>

namespace wscheck {

inline constexpr size_t kDefaultTabSize = 8;

// Settings for one checking run
struct RunOptions {
    size_t tab_size = kDefaultTabSize;
    bool fixup = false;
    OutputMode mode = OutputMode::NORMAL;
    std::vector<std::string> checked_exts;   // Empty: check every file
    std::vector<std::string> ignored_files;  // Exact path matches
};

} // namespace wscheck
