#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace en {

// Recoverable failure while turning runtime values into name text or back.
class NameTextError : public std::runtime_error {
public:
    enum class Kind : uint8_t {
        UnregisteredValue = 0,  // key has no name
        Parse = 1,              // text is not a JSON string
        UnrecognizedName = 2    // string has no key
    };

    NameTextError(Kind kind, const std::string& message);

    Kind kind() const noexcept { return kind_; }

private:
    Kind kind_;
};

std::string_view kind_name(NameTextError::Kind kind);

namespace detail {

// Name tables are compiled-in constants, so a bad one is a programming
// error: log it and abort.
[[noreturn]] void fatal_construction_error(std::string_view problem);

} // namespace detail

} // namespace en
