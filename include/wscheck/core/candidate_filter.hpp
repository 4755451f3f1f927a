#pragma once

#include "wscheck/types.hpp"
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace wscheck {

// Why a candidate is excluded from checking, or nullopt when it is relevant
auto ignore_reason(const std::string& path, const RunOptions& options) -> std::optional<std::string>;

// Drop empty entries and repeats, keeping first-seen order
auto dedupe_candidates(const std::vector<std::string>& paths) -> std::vector<std::string>;

// One candidate path per line, e.g. piped from `git diff --name-only`
auto read_candidates(std::istream& in) -> std::vector<std::string>;

} // namespace wscheck
