#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <utility>

namespace en {

struct LoggingConfig {
    std::string level = "info";
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%f] [%l] %v";
};

struct TableConfig {
    std::string name;
    std::vector<std::pair<int64_t, std::string>> entries;
};

struct Config {
    LoggingConfig logging;
    std::vector<TableConfig> tables;

    // Missing file -> default_config(). Unreadable JSON or wrongly typed
    // fields throw std::runtime_error.
    static Config load_from_file(const std::string& path);
    static Config load_from_string(const std::string& text);
    static Config default_config();
};

} // namespace en
