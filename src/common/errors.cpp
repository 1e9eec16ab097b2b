#include "errors.hpp"
#include "enum_name_map.hpp"

#include <spdlog/spdlog.h>
#include <cstdlib>

namespace en {

NameTextError::NameTextError(Kind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

std::string_view kind_name(NameTextError::Kind kind) {
    using Kind = NameTextError::Kind;
    static const EnumNameMap<Kind> names{
        {Kind::UnregisteredValue, "unregistered_value"},
        {Kind::Parse, "parse"},
        {Kind::UnrecognizedName, "unrecognized_name"},
    };
    return names.get_name_or(kind, "unknown");
}

namespace detail {

void fatal_construction_error(std::string_view problem) {
    spdlog::critical("Invalid enum name table: {}", problem);
    spdlog::default_logger()->flush();
    std::abort();
}

} // namespace detail

} // namespace en
