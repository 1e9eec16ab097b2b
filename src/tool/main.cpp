#include "commands.hpp"
#include "../common/config.hpp"
#include "../common/table_registry.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    try {
        // Results go to stdout, so keep the log on stderr.
        spdlog::set_default_logger(spdlog::stderr_color_mt("enumnames"));
        spdlog::set_level(spdlog::level::info);

        std::string config_path = "config.json";
        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--config") {
                if (i + 1 >= argc) {
                    std::cerr << en::usage();
                    return static_cast<int>(en::ExitCode::Usage);
                }
                config_path = argv[++i];
            } else {
                args.push_back(std::move(arg));
            }
        }

        en::Config config = en::Config::load_from_file(config_path);

        auto level = spdlog::level::from_str(config.logging.level);
        if (level == spdlog::level::off && config.logging.level != "off") {
            spdlog::warn("Unknown log level '{}', keeping info", config.logging.level);
        } else {
            spdlog::set_level(level);
        }
        spdlog::set_pattern(config.logging.pattern);
        spdlog::debug("Loaded configuration from {} ({} tables)", config_path, config.tables.size());

        en::TableRegistry registry(config.tables);

        return static_cast<int>(en::run_command(registry, args, std::cout, std::cerr));

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return static_cast<int>(en::ExitCode::Error);
    }
}
