#include "wscheck/application/command_line.hpp"
#include <sstream>

namespace wscheck {

auto parse_args(const std::vector<std::string>& args) -> AppOptions {
    AppOptions options;
    bool quiet = false;
    bool verbose = false;
    bool debug = false;
    bool only_paths = false;

    for (size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];

        if (only_paths || arg.empty() || arg[0] != '-') {
            options.paths.push_back(arg);
        } else if (arg == "--") {
            only_paths = true;
        } else if (arg == "-f" || arg == "--fixup") {
            options.fixup = true;
        } else if (arg == "-q" || arg == "--quiet") {
            quiet = true;
        } else if (arg == "-v" || arg == "--verbose") {
            verbose = true;
        } else if (arg == "-d" || arg == "--debug") {
            debug = true;
        } else if (arg == "-t" || arg == "--tabsize") {
            if (i + 1 >= args.size()) {
                throw ConfigError("option " + arg + " requires a value");
            }
            options.tab_size = parse_tab_size(args[++i], "option " + arg);
        } else if (arg.starts_with("--tabsize=")) {
            options.tab_size = parse_tab_size(arg.substr(10), "option --tabsize");
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 >= args.size()) {
                throw ConfigError("option " + arg + " requires a value");
            }
            options.config_path = args[++i];
        } else if (arg == "-h" || arg == "--help") {
            options.show_help = true;
        } else {
            throw ConfigError("unknown option: " + arg);
        }
    }

    if (quiet && (verbose || debug)) {
        throw ConfigError("--quiet cannot be combined with --verbose or --debug");
    }
    if (quiet) {
        options.mode = OutputMode::QUIET;
    } else if (debug) {
        options.mode = OutputMode::DEBUG;
    } else if (verbose) {
        options.mode = OutputMode::VERBOSE;
    }

    return options;
}

auto resolve_run_options(const AppOptions& app, const std::optional<FileSettings>& file)
    -> RunOptions {
    RunOptions options;
    options.fixup = app.fixup;
    options.mode = app.mode;
    options.checked_exts = default_checked_exts();

    if (file) {
        if (file->tab_size) {
            options.tab_size = *file->tab_size;
        }
        if (file->checked_exts) {
            options.checked_exts = *file->checked_exts;
        }
        options.ignored_files = file->ignored_files;
    }
    if (app.tab_size) {
        options.tab_size = *app.tab_size;
    }

    return options;
}

auto usage_text() -> std::string {
    std::ostringstream oss;
    oss << "Usage: wscheck [options] [file...]\n";
    oss << "Checks files for tab characters and trailing whitespace.\n";
    oss << "Without file arguments, candidate paths are read from stdin, one per line.\n\n";
    oss << "  -f, --fixup            Fix files by expanding tabs and removing trailing whitespace\n";
    oss << "  -t, --tabsize <n>      Tab stop width used when fixing (default: 8 or tab_size)\n";
    oss << "  -q, --quiet            Hide file names, only report summary counts\n";
    oss << "  -v, --verbose          Show the location of offending characters in each line\n";
    oss << "  -d, --debug            Show settings and details about every file considered\n";
    oss << "  -c, --config <file>    Read settings from <file> (default: " << kDefaultConfigFile
        << ")\n";
    oss << "  -h, --help             Show this help\n";
    oss << "\nExamples:\n";
    oss << "  wscheck src/*.cpp                        # Check files\n";
    oss << "  git diff --name-only | wscheck --fixup   # Check and fix changed files\n";
    oss << "\nExit status is 1 if problems or errors were found, even when they were fixed.\n";
    return oss.str();
}

} // namespace wscheck
