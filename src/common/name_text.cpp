#include "name_text.hpp"
#include "errors.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>

namespace en {

std::string quote_name(std::string_view name) {
    nlohmann::json value = std::string(name);
    return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string unquote_name(std::string_view text) {
    nlohmann::json value;
    try {
        value = nlohmann::json::parse(text.begin(), text.end());
    } catch (const nlohmann::json::parse_error& e) {
        throw NameTextError(NameTextError::Kind::Parse,
                            fmt::format("invalid enum name text: {}", e.what()));
    }

    if (!value.is_string()) {
        throw NameTextError(NameTextError::Kind::Parse,
                            fmt::format("expected a JSON string for enum name, got {}", value.type_name()));
    }

    return value.get<std::string>();
}

} // namespace en
