#include "table_registry.hpp"

#include <spdlog/spdlog.h>
#include <stdexcept>

namespace en {

TableRegistry::TableRegistry(const std::vector<TableConfig>& tables) {
    for (const auto& table : tables) {
        if (tables_.count(table.name) != 0) {
            throw std::invalid_argument("duplicate table '" + table.name + "'");
        }

        std::vector<Table::Entry> entries(table.entries.begin(), table.entries.end());
        if (auto problem = Table::validate(entries)) {
            throw std::invalid_argument("table '" + table.name + "': " + *problem);
        }

        auto it = tables_.emplace(table.name, Table(entries.begin(), entries.end())).first;
        spdlog::debug("Registered table {} {}", it->first, it->second.to_display_string());
    }
}

const TableRegistry::Table* TableRegistry::find(std::string_view name) const {
    auto it = tables_.find(name);
    if (it == tables_.end()) {
        return nullptr;
    }
    return &it->second;
}

const TableRegistry::Table& TableRegistry::at(std::string_view name) const {
    auto* table = find(name);
    if (table == nullptr) {
        throw std::out_of_range("unknown table '" + std::string(name) + "'");
    }
    return *table;
}

std::vector<std::string> TableRegistry::table_names() const {
    std::vector<std::string> result;
    result.reserve(tables_.size());
    for (const auto& [name, table] : tables_) {
        result.push_back(name);
    }
    return result;
}

} // namespace en
