#pragma once

#include "config.hpp"
#include "enum_name_map.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace en {

// Named name tables built at runtime from configuration. Read-only once
// constructed, so lookups need no locking.
class TableRegistry {
public:
    using Table = EnumNameMap<int64_t>;

    // Throws std::invalid_argument for a repeated table name or a table
    // that is not a valid EnumNameMap, instead of aborting.
    explicit TableRegistry(const std::vector<TableConfig>& tables);

    const Table* find(std::string_view name) const;
    const Table& at(std::string_view name) const;
    std::vector<std::string> table_names() const;
    size_t size() const { return tables_.size(); }

private:
    std::map<std::string, Table, std::less<>> tables_;
};

} // namespace en
