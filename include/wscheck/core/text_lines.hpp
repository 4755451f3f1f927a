#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace wscheck {

// A line of text together with the terminator that ended it in the source
// ("\n", "\r\n", "\r", or empty for a final unterminated line)
struct TextLine {
    std::string text;
    std::string terminator;

    auto operator==(const TextLine& other) const -> bool = default;
};

inline constexpr size_t kBinarySampleSize = 8000;

// Split content into lines, keeping each line's terminator so the content can
// be reassembled byte-for-byte. Empty content yields no lines.
auto split_lines(std::string_view content) -> std::vector<TextLine>;

auto join_lines(const std::vector<TextLine>& lines) -> std::string;

// Binary if the content contains NUL, or if more than 10% of the leading
// sample consists of control bytes that do not occur in text.
auto is_binary_content(std::string_view content) -> bool;

} // namespace wscheck
