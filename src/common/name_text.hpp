#pragma once

#include <string>
#include <string_view>

namespace en {

// The text form of an enum name is a single JSON string literal, meant to
// be embedded as one field of a larger JSON document.

// Standard JSON escaping; invalid UTF-8 is replaced with U+FFFD.
std::string quote_name(std::string_view name);

// Throws NameTextError (Kind::Parse) unless text holds exactly one JSON
// string, optionally surrounded by whitespace.
std::string unquote_name(std::string_view text);

} // namespace en
