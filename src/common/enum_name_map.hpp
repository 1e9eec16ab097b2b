#pragma once

#include "errors.hpp"
#include "name_text.hpp"

#include <spdlog/fmt/fmt.h>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <vector>

namespace en {

namespace detail {

template <typename K, bool IsEnum = std::is_enum_v<K>>
struct KeyRepr {
    using type = K;
};

template <typename K>
struct KeyRepr<K, true> {
    using type = std::underlying_type_t<K>;
};

} // namespace detail

// Immutable mapping between a contiguous range of integer (or enum) keys
// and unique names. Names live in a dense array indexed by key - lowest key,
// so key -> name is a bounds check plus an array access; name -> key is a
// linear scan, which beats string hashing for tables of realistic size.
//
// Construction aborts the process if the keys are not contiguous or a name
// is used twice. Once built the map is read-only and may be shared between
// threads without locking.
template <typename K>
class EnumNameMap {
    static_assert(std::is_integral_v<K> || std::is_enum_v<K>,
                  "EnumNameMap keys must be integers or enumerations");

public:
    using key_type = K;
    using repr_type = typename detail::KeyRepr<K>::type;
    using Entry = std::pair<K, std::string>;

    static_assert(!std::is_same_v<repr_type, bool>, "EnumNameMap keys cannot be bool");

    EnumNameMap() = default;

    EnumNameMap(std::initializer_list<Entry> entries)
        : EnumNameMap(entries.begin(), entries.end()) {}

    // Accepts any range of key/name pairs, e.g. a std::map<K, std::string>.
    template <typename InputIt>
    EnumNameMap(InputIt first, InputIt last) {
        std::vector<Entry> entries;
        for (; first != last; ++first) {
            entries.emplace_back(first->first, std::string(first->second));
        }

        if (auto problem = validate(entries)) {
            detail::fatal_construction_error(*problem);
        }

        if (entries.empty()) {
            return;
        }

        lowest_ = lowest_of(entries);
        names_.resize(entries.size());
        for (auto& [key, name] : entries) {
            names_[*offset(repr(key), lowest_, names_.size())] = std::move(name);
        }
    }

    // Describes the first reason the entries cannot form a map, without
    // aborting. Runtime-supplied tables should be checked with this first.
    static std::optional<std::string> validate(const std::vector<Entry>& entries) {
        if (entries.empty()) {
            return std::nullopt;
        }

        const repr_type lowest = lowest_of(entries);
        std::vector<bool> filled(entries.size(), false);
        std::unordered_set<std::string_view> seen_names;

        for (const auto& [key, name] : entries) {
            auto index = offset(repr(key), lowest, entries.size());
            if (!index) {
                return fmt::format("non-contiguous enum values: {} is not within {} values of {}",
                                   wide(repr(key)), entries.size(), wide(lowest));
            }
            if (filled[*index]) {
                return fmt::format("duplicate enum value {}", wide(repr(key)));
            }
            filled[*index] = true;

            if (!seen_names.insert(name).second) {
                return fmt::format("duplicate enum name '{}'", name);
            }
        }

        return std::nullopt;
    }

    std::optional<std::string_view> get_name(K key) const {
        auto index = offset(repr(key), lowest_, names_.size());
        if (!index) {
            return std::nullopt;
        }
        return std::string_view(names_[*index]);
    }

    // The fallback is returned as-is, so it must outlive the result.
    std::string_view get_name_or(K key, std::string_view fallback) const {
        auto name = get_name(key);
        return name ? *name : fallback;
    }

    std::optional<K> get_key(std::string_view name) const {
        for (std::size_t i = 0; i < names_.size(); ++i) {
            if (names_[i] == name) {
                return key_at(i);
            }
        }
        return std::nullopt;
    }

    std::string_view require_name(K key) const {
        auto name = get_name(key);
        if (!name) {
            throw NameTextError(NameTextError::Kind::UnregisteredValue,
                                fmt::format("enum value '{}' not registered in enum name map",
                                            wide(repr(key))));
        }
        return *name;
    }

    K require_key(std::string_view name) const {
        auto key = get_key(name);
        if (!key) {
            throw NameTextError(NameTextError::Kind::UnrecognizedName,
                                fmt::format("invalid value '{}', expected one of: {}",
                                            name, quoted_name_list()));
        }
        return *key;
    }

    bool contains_key(K key) const {
        return offset(repr(key), lowest_, names_.size()).has_value();
    }

    bool contains_name(std::string_view name) const {
        return get_key(name).has_value();
    }

    std::size_t size() const { return names_.size(); }
    bool empty() const { return names_.empty(); }

    std::optional<K> lowest_key() const {
        if (names_.empty()) {
            return std::nullopt;
        }
        return static_cast<K>(lowest_);
    }

    // Fresh copy, ascending.
    std::vector<K> keys() const {
        std::vector<K> result;
        result.reserve(names_.size());
        for (std::size_t i = 0; i < names_.size(); ++i) {
            result.push_back(key_at(i));
        }
        return result;
    }

    // Fresh copy, in key order.
    std::vector<std::string> names() const {
        return names_;
    }

    // e.g. "EnumNameMap[1:FIRST 2:SECOND 3:THIRD]". For logs, not for parsing.
    std::string to_display_string() const {
        std::string out = "EnumNameMap[";
        for (std::size_t i = 0; i < names_.size(); ++i) {
            if (i != 0) {
                out += ' ';
            }
            out += fmt::format("{}:{}", wide(repr(key_at(i))), names_[i]);
        }
        out += ']';
        return out;
    }

    // Key -> JSON string literal of its name, e.g. 1 -> "\"FIRST\"".
    std::string encode_to_name_text(K key) const {
        return quote_name(require_name(key));
    }

    K decode_from_name_text(std::string_view text) const {
        return require_key(unquote_name(text));
    }

private:
    using unsigned_repr = std::make_unsigned_t<repr_type>;
    using wide_repr = std::conditional_t<std::is_signed_v<repr_type>, int64_t, uint64_t>;

    static repr_type repr(K key) { return static_cast<repr_type>(key); }
    static wide_repr wide(repr_type value) { return static_cast<wide_repr>(value); }

    static repr_type lowest_of(const std::vector<Entry>& entries) {
        repr_type lowest = repr(entries.front().first);
        for (const auto& entry : entries) {
            if (repr(entry.first) < lowest) {
                lowest = repr(entry.first);
            }
        }
        return lowest;
    }

    // key - lowest is evaluated in the unsigned type of the same width once
    // key >= lowest is known, so it cannot overflow for any key type.
    static std::optional<std::size_t> offset(repr_type key, repr_type lowest, std::size_t count) {
        if (key < lowest) {
            return std::nullopt;
        }
        const auto distance = static_cast<unsigned_repr>(
            static_cast<unsigned_repr>(key) - static_cast<unsigned_repr>(lowest));
        if (static_cast<uint64_t>(distance) >= count) {
            return std::nullopt;
        }
        return static_cast<std::size_t>(distance);
    }

    K key_at(std::size_t index) const {
        const auto value = static_cast<unsigned_repr>(
            static_cast<unsigned_repr>(lowest_) + static_cast<unsigned_repr>(index));
        return static_cast<K>(static_cast<repr_type>(value));
    }

    std::string quoted_name_list() const {
        if (names_.empty()) {
            return "(no names registered)";
        }
        std::string list;
        for (const auto& name : names_) {
            if (!list.empty()) {
                list += ", ";
            }
            list += '\'';
            list += name;
            list += '\'';
        }
        return list;
    }

    std::vector<std::string> names_;
    repr_type lowest_{};
};

template <typename K>
std::ostream& operator<<(std::ostream& os, const EnumNameMap<K>& names) {
    return os << names.to_display_string();
}

} // namespace en
