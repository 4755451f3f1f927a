#include "wscheck/core/candidate_filter.hpp"
#include <algorithm>
#include <unordered_set>

namespace wscheck {

auto ignore_reason(const std::string& path, const RunOptions& options) -> std::optional<std::string> {
    if (std::find(options.ignored_files.begin(), options.ignored_files.end(), path) !=
        options.ignored_files.end()) {
        return "explicit ignore";
    }

    if (!options.checked_exts.empty() &&
        std::none_of(options.checked_exts.begin(), options.checked_exts.end(),
                     [&path](const std::string& ext) { return path.ends_with(ext); })) {
        return "non-checked extension";
    }

    return std::nullopt;
}

auto dedupe_candidates(const std::vector<std::string>& paths) -> std::vector<std::string> {
    std::vector<std::string> unique;
    std::unordered_set<std::string> seen;

    for (const auto& path : paths) {
        if (path.empty() || !seen.insert(path).second) {
            continue;
        }
        unique.push_back(path);
    }

    return unique;
}

auto read_candidates(std::istream& in) -> std::vector<std::string> {
    std::vector<std::string> paths;
    std::string line;

    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        paths.push_back(line);
    }

    return dedupe_candidates(paths);
}

} // namespace wscheck
