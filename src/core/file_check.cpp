#include "wscheck/core/file_check.hpp"
#include "wscheck/core/line_classifier.hpp"
#include "wscheck/core/text_lines.hpp"

namespace wscheck {

auto scan_content(const std::string& path, std::string_view content) -> FileCheckResult {
    FileCheckResult result{.path = path};

    if (is_binary_content(content)) {
        result.is_binary = true;
        return result;
    }

    auto lines = split_lines(content);
    result.line_count = lines.size();

    for (size_t i = 0; i < lines.size(); ++i) {
        auto line_violations = classify_line(lines[i].text, i + 1);
        if (!line_violations.empty()) {
            result.flagged_lines.emplace(i + 1, lines[i].text);
        }
        result.violations.insert(result.violations.end(), line_violations.begin(),
                                 line_violations.end());
    }

    return result;
}

auto unreadable_result(const std::string& path, const std::string& error) -> FileCheckResult {
    return FileCheckResult{.path = path, .readable = false, .error = error};
}

} // namespace wscheck
