#include "wscheck/config/config_file.hpp"
#include <charconv>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace wscheck {

namespace {

auto trim(const std::string& text) -> std::string {
    auto first = text.find_first_not_of(" \t\r");
    if (first == std::string::npos) {
        return "";
    }
    auto last = text.find_last_not_of(" \t\r");
    return text.substr(first, last - first + 1);
}

auto split_words(const std::string& text) -> std::vector<std::string> {
    std::vector<std::string> words;
    std::istringstream iss(text);
    std::string word;
    while (iss >> word) {
        words.push_back(word);
    }
    return words;
}

} // namespace

auto default_checked_exts() -> std::vector<std::string> {
    return {".c",   ".h",   ".cpp", ".xml", ".cs",  ".html", ".js",  ".css", ".txt",
            ".py",  ".nsi", ".java", ".aspx", ".asp", ".bat", ".cmd", ".glsl"};
}

auto parse_tab_size(const std::string& value, const std::string& source_name) -> size_t {
    auto text = trim(value);
    size_t tab_size = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), tab_size);

    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size() || tab_size == 0) {
        throw ConfigError(source_name + ": invalid tab size '" + value +
                          "' (expected a positive integer)");
    }
    return tab_size;
}

auto parse_config(const std::string& text, const std::string& source_name) -> FileSettings {
    FileSettings settings;
    std::istringstream iss(text);
    std::string raw_line;
    size_t line_number = 0;
    bool in_section = false;

    while (std::getline(iss, raw_line)) {
        ++line_number;
        auto line = trim(raw_line);
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        auto location = source_name + ":" + std::to_string(line_number);

        if (line.front() == '[') {
            if (line.back() != ']') {
                throw ConfigError(location + ": malformed section header");
            }
            in_section = trim(line.substr(1, line.size() - 2)) == kConfigSection;
            continue;
        }

        if (!in_section) {
            continue;  // Other tools' sections
        }

        auto equals_pos = line.find('=');
        if (equals_pos == std::string::npos) {
            throw ConfigError(location + ": expected 'key = value'");
        }

        auto key = trim(line.substr(0, equals_pos));
        auto value = trim(line.substr(equals_pos + 1));

        if (key == "tab_size") {
            settings.tab_size = parse_tab_size(value, location);
        } else if (key == "checked_exts") {
            settings.checked_exts = split_words(value);
        } else if (key == "ignored_files") {
            settings.ignored_files = split_words(value);
        }
    }

    return settings;
}

auto load_config(const std::string& path, bool required) -> std::optional<FileSettings> {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        if (required) {
            throw ConfigError("config file not found: " + path);
        }
        return std::nullopt;
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("cannot open config file: " + path);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    return parse_config(buffer.str(), path);
}

} // namespace wscheck
