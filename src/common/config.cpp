#include "config.hpp"
#include <charconv>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace en {

namespace {

int64_t parse_table_key(const std::string& table, const std::string& text) {
    int64_t key = 0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), key);
    if (ec != std::errc() || end != text.data() + text.size()) {
        throw std::runtime_error("table '" + table + "': key '" + text + "' is not a 64-bit integer");
    }
    return key;
}

Config parse_config(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("config must be a JSON object");
    }

    Config config = Config::default_config();

    if (j.contains("logging")) {
        auto& logging = j["logging"];
        if (!logging.is_object()) {
            throw std::runtime_error("'logging' must be an object");
        }
        if (logging.contains("level")) config.logging.level = logging["level"].get<std::string>();
        if (logging.contains("pattern")) config.logging.pattern = logging["pattern"].get<std::string>();
    }

    if (j.contains("tables")) {
        if (!j["tables"].is_object()) {
            throw std::runtime_error("'tables' must be an object of named tables");
        }
        config.tables.clear();
        for (const auto& [name, entries] : j["tables"].items()) {
            if (!entries.is_object()) {
                throw std::runtime_error("table '" + name + "' must be an object of key/name pairs");
            }
            TableConfig table;
            table.name = name;
            for (const auto& [key, value] : entries.items()) {
                table.entries.emplace_back(parse_table_key(name, key), value.get<std::string>());
            }
            config.tables.push_back(std::move(table));
        }
    }

    return config;
}

} // namespace

Config Config::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        spdlog::debug("No config file at {}, using defaults", path);
        return default_config();
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    try {
        return load_from_string(buffer.str());
    } catch (const std::exception& e) {
        throw std::runtime_error("Failed to load config " + path + ": " + e.what());
    }
}

Config Config::load_from_string(const std::string& text) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
        return parse_config(j);
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(e.what());
    }
}

Config Config::default_config() {
    Config config;
    // Narrow wire codes of the market data frame format.
    config.tables = {
        {"message_type", {{1, "L1"}, {2, "L2"}, {3, "TRADE"}, {4, "HEARTBEAT"}, {5, "CONTROL_ACK"}}},
        {"side", {{0, "BID"}, {1, "ASK"}}},
        {"book_action", {{0, "INSERT"}, {1, "UPDATE"}, {2, "DELETE"}}},
    };
    return config;
}

} // namespace en
