#pragma once

#include <type_traits>
#include <variant>
#include <vector>

#include <cstdint>

#include "records.hpp"
#include "types.hpp"

namespace parcelio {

/// Absent value; also produced for a boolean array whose count cannot be satisfied
struct Null {
    bool operator==(const Null&) const = default;
};

using ParcelableArray = std::vector<Record>;
using BooleanArray = std::vector<bool>;
using LongArray = std::vector<int64_t>;

/**
 * @brief One decoded bundle value
 *
 * Only the value kinds this decoder implements have an alternative here;
 * every other tag is reported as DecodeErrorCode::unsupported_value_type.
 */
using Value = std::variant<Null,            // VAL_NULL, or an unsatisfiable boolean array
                           ParcelableArray, // VAL_PARCELABLEARRAY
                           BooleanArray,    // VAL_BOOLEANARRAY
                           LongArray        // VAL_LONGARRAY
                           >;

/**
 * @brief Get the wire tag corresponding to a decoded value
 */
inline ValueType value_type_of(const Value& value) noexcept {
    return std::visit(
        [](auto&& v) -> ValueType {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, ParcelableArray>) {
                return ValueType::parcelable_array;
            } else if constexpr (std::is_same_v<T, BooleanArray>) {
                return ValueType::boolean_array;
            } else if constexpr (std::is_same_v<T, LongArray>) {
                return ValueType::long_array;
            }
            return ValueType::null_value;
        },
        value);
}

inline bool is_null(const Value& value) noexcept {
    return std::holds_alternative<Null>(value);
}

} // namespace parcelio
