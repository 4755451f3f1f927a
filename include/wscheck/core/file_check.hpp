#pragma once

#include "wscheck/core/violation.hpp"
#include <string>
#include <string_view>

namespace wscheck {

// Classify already loaded content. Binary content short-circuits with no
// violations; otherwise every line is classified in order.
auto scan_content(const std::string& path, std::string_view content) -> FileCheckResult;

// Result for a file that could not be read
auto unreadable_result(const std::string& path, const std::string& error) -> FileCheckResult;

} // namespace wscheck
