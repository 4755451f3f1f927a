#include "wscheck/application/command_line.hpp"
#include "wscheck/application/run_controller.hpp"
#include "wscheck/config/config_file.hpp"
#include "wscheck/core/candidate_filter.hpp"
#include "wscheck/io/file_system.hpp"

#include <cstdio>
#include <iostream>
#include <memory>
#include <unistd.h>

int main(int argc, char* argv[]) {
    using namespace wscheck;

    try {
        AppOptions app = parse_args(std::vector<std::string>(argv + 1, argv + argc));
        if (app.show_help) {
            std::cout << usage_text();
            return 0;
        }

        auto file_settings = app.config_path ? load_config(*app.config_path, true)
                                             : load_config(kDefaultConfigFile, false);
        auto options = resolve_run_options(app, file_settings);

        auto paths = app.paths;
        if (paths.empty()) {
            if (isatty(fileno(stdin))) {
                std::cerr << "wscheck: no files given and nothing piped on stdin\n\n"
                          << usage_text();
                return 1;
            }
            paths = read_candidates(std::cin);
        }

        RunController controller(std::make_unique<FileSystem>());
        return controller.run(paths, options);

    } catch (const ConfigError& e) {
        std::cerr << "wscheck: error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "wscheck: internal error: " << e.what() << "\n";
        return 1;
    }
}
