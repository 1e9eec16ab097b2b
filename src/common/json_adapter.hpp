#pragma once

#include "enum_name_map.hpp"
#include "errors.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>
#include <string>

namespace en {

template <typename K>
void to_name_json(nlohmann::json& j, const EnumNameMap<K>& names, K value) {
    j = std::string(names.require_name(value));
}

template <typename K>
K from_name_json(const EnumNameMap<K>& names, const nlohmann::json& j) {
    if (!j.is_string()) {
        throw NameTextError(NameTextError::Kind::Parse,
                            fmt::format("expected a JSON string for enum name, got {}", j.type_name()));
    }
    return names.require_key(j.get_ref<const std::string&>());
}

} // namespace en

// Serializes EnumType by name wherever nlohmann::json meets it. Use in the
// namespace that declares EnumType so the functions are found by ADL.
// names_expr is evaluated on every call and must yield a
// const en::EnumNameMap<EnumType>&.
#define ENUMNAMES_JSON_SERIALIZE(EnumType, names_expr)                          \
    inline void to_json(nlohmann::json& j, const EnumType& value) {             \
        ::en::to_name_json<EnumType>(j, (names_expr), value);                   \
    }                                                                           \
    inline void from_json(const nlohmann::json& j, EnumType& value) {           \
        value = ::en::from_name_json<EnumType>((names_expr), j);                \
    }
