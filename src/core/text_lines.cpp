#include "wscheck/core/text_lines.hpp"
#include <algorithm>

namespace wscheck {

namespace {

auto is_text_control(unsigned char c) -> bool {
    switch (c) {
    case '\t':
    case '\n':
    case '\r':
    case '\f':
    case '\v':
    case '\b':
    case 0x1b:  // ESC, used by ANSI colored text
        return true;
    default:
        return false;
    }
}

} // namespace

auto split_lines(std::string_view content) -> std::vector<TextLine> {
    std::vector<TextLine> lines;
    size_t start = 0;

    while (start < content.size()) {
        size_t end = content.find_first_of("\r\n", start);
        if (end == std::string_view::npos) {
            lines.push_back(TextLine{.text = std::string(content.substr(start)), .terminator = ""});
            break;
        }

        size_t terminator_length = 1;
        if (content[end] == '\r' && end + 1 < content.size() && content[end + 1] == '\n') {
            terminator_length = 2;
        }

        lines.push_back(TextLine{.text = std::string(content.substr(start, end - start)),
                                 .terminator = std::string(content.substr(end, terminator_length))});
        start = end + terminator_length;
    }

    return lines;
}

auto join_lines(const std::vector<TextLine>& lines) -> std::string {
    std::string content;
    for (const auto& line : lines) {
        content += line.text;
        content += line.terminator;
    }
    return content;
}

auto is_binary_content(std::string_view content) -> bool {
    if (content.find('\0') != std::string_view::npos) {
        return true;
    }

    auto sample = content.substr(0, std::min(content.size(), kBinarySampleSize));
    if (sample.empty()) {
        return false;
    }

    auto suspicious = std::count_if(sample.begin(), sample.end(), [](char c) {
        auto byte = static_cast<unsigned char>(c);
        return (byte < 0x20 || byte == 0x7f) && !is_text_control(byte);
    });

    return static_cast<size_t>(suspicious) * 10 > sample.size();
}

} // namespace wscheck
