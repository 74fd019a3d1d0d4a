#pragma once

#include <cstddef>
#include <cstdint>

namespace parcelio {

/// Every field on the wire is a multiple of one 32-bit word
inline constexpr size_t parcel_word_size = 4;

/// Bundle magic written by the Java side ('B' 'N' 'D' 'L')
inline constexpr int32_t bundle_magic = 0x4C444E42;

/// Bundle magic written by the native side ('B' 'N' 'D' 'N')
inline constexpr int32_t bundle_magic_native = 0x4C444E44;

/**
 * @brief Value tags as written in front of every bundle value
 *
 * Keep in sync with the transport's value type table. Tags marked
 * "length-prefixed" are followed by an i32 byte length of their payload.
 */
enum class ValueType : int32_t {
    null_value = -1,
    string = 0,
    integer = 1,
    map = 2, // length-prefixed
    bundle = 3,
    parcelable = 4, // length-prefixed
    short_value = 5,
    long_value = 6,
    float_value = 7,
    double_value = 8,
    boolean = 9,
    char_sequence = 10,
    list = 11,         // length-prefixed
    sparse_array = 12, // length-prefixed
    byte_array = 13,
    string_array = 14,
    ibinder = 15,
    parcelable_array = 16, // length-prefixed
    object_array = 17,     // length-prefixed
    int_array = 18,
    long_array = 19,
    byte_value = 20,
    serializable = 21, // length-prefixed
    sparse_boolean_array = 22,
    boolean_array = 23,
    char_sequence_array = 24,
    persistable_bundle = 25,
    size = 26,
    size_f = 27,
    double_array = 28,
    char_value = 29,
    short_array = 30,
    char_array = 31,
    float_array = 32
};

inline constexpr int32_t min_value_type = static_cast<int32_t>(ValueType::null_value);
inline constexpr int32_t max_value_type = static_cast<int32_t>(ValueType::float_array);

/**
 * @brief Check whether a raw tag is part of the value type table
 */
constexpr bool is_known_value_type(int32_t tag) noexcept {
    return tag >= min_value_type && tag <= max_value_type;
}

/**
 * @brief Check whether values of this tag carry an i32 length prefix
 *
 * Custom types and containers of custom types are length-prefixed so readers
 * can skip them. Bundle is the exception since it carries its own length.
 */
constexpr bool is_length_prefixed(ValueType type) noexcept {
    switch (type) {
        case ValueType::map:
        case ValueType::parcelable:
        case ValueType::list:
        case ValueType::sparse_array:
        case ValueType::parcelable_array:
        case ValueType::object_array:
        case ValueType::serializable:
            return true;
        default:
            return false;
    }
}

constexpr bool is_length_prefixed(int32_t tag) noexcept {
    return is_known_value_type(tag) && is_length_prefixed(static_cast<ValueType>(tag));
}

/**
 * @brief Get the wire name of a value tag
 * @return Static string, "unknown" for tags outside the table
 */
constexpr const char* value_type_string(ValueType type) noexcept {
    switch (type) {
        case ValueType::null_value:
            return "VAL_NULL";
        case ValueType::string:
            return "VAL_STRING";
        case ValueType::integer:
            return "VAL_INTEGER";
        case ValueType::map:
            return "VAL_MAP";
        case ValueType::bundle:
            return "VAL_BUNDLE";
        case ValueType::parcelable:
            return "VAL_PARCELABLE";
        case ValueType::short_value:
            return "VAL_SHORT";
        case ValueType::long_value:
            return "VAL_LONG";
        case ValueType::float_value:
            return "VAL_FLOAT";
        case ValueType::double_value:
            return "VAL_DOUBLE";
        case ValueType::boolean:
            return "VAL_BOOLEAN";
        case ValueType::char_sequence:
            return "VAL_CHARSEQUENCE";
        case ValueType::list:
            return "VAL_LIST";
        case ValueType::sparse_array:
            return "VAL_SPARSEARRAY";
        case ValueType::byte_array:
            return "VAL_BYTEARRAY";
        case ValueType::string_array:
            return "VAL_STRINGARRAY";
        case ValueType::ibinder:
            return "VAL_IBINDER";
        case ValueType::parcelable_array:
            return "VAL_PARCELABLEARRAY";
        case ValueType::object_array:
            return "VAL_OBJECTARRAY";
        case ValueType::int_array:
            return "VAL_INTARRAY";
        case ValueType::long_array:
            return "VAL_LONGARRAY";
        case ValueType::byte_value:
            return "VAL_BYTE";
        case ValueType::serializable:
            return "VAL_SERIALIZABLE";
        case ValueType::sparse_boolean_array:
            return "VAL_SPARSEBOOLEANARRAY";
        case ValueType::boolean_array:
            return "VAL_BOOLEANARRAY";
        case ValueType::char_sequence_array:
            return "VAL_CHARSEQUENCEARRAY";
        case ValueType::persistable_bundle:
            return "VAL_PERSISTABLEBUNDLE";
        case ValueType::size:
            return "VAL_SIZE";
        case ValueType::size_f:
            return "VAL_SIZEF";
        case ValueType::double_array:
            return "VAL_DOUBLEARRAY";
        case ValueType::char_value:
            return "VAL_CHAR";
        case ValueType::short_array:
            return "VAL_SHORTARRAY";
        case ValueType::char_array:
            return "VAL_CHARARRAY";
        case ValueType::float_array:
            return "VAL_FLOATARRAY";
    }
    return "unknown";
}

/**
 * @brief Reasons a decode can fail
 *
 * Grouped as framing (structural contract violated), truncation (the buffer
 * holds less than declared), encoding (string contents), registry and
 * unsupported-value failures.
 */
enum class DecodeErrorCode : uint8_t {
    // Framing
    invalid_presence_flag,
    negative_length,
    negative_count,
    length_mismatch,
    invalid_magic,
    invalid_enum_value,
    // Truncation / bounds
    truncated,
    // Encoding
    missing_terminator,
    invalid_utf8,
    // Registry
    name_not_found,
    // Value kinds
    unsupported_value_type,
    unknown_value_type
};

/**
 * @brief Convert a decode error code to a human-readable string
 */
constexpr const char* decode_error_string(DecodeErrorCode code) noexcept {
    switch (code) {
        case DecodeErrorCode::invalid_presence_flag:
            return "Presence flag is not 1";
        case DecodeErrorCode::negative_length:
            return "Negative length prefix";
        case DecodeErrorCode::negative_count:
            return "Negative element count";
        case DecodeErrorCode::length_mismatch:
            return "Payload size does not match its length prefix";
        case DecodeErrorCode::invalid_magic:
            return "Unknown bundle magic";
        case DecodeErrorCode::invalid_enum_value:
            return "Enum field holds an undefined value";
        case DecodeErrorCode::truncated:
            return "Read past end of buffer";
        case DecodeErrorCode::missing_terminator:
            return "String is missing its NUL terminator";
        case DecodeErrorCode::invalid_utf8:
            return "String is not valid UTF-8";
        case DecodeErrorCode::name_not_found:
            return "No creator registered for type name";
        case DecodeErrorCode::unsupported_value_type:
            return "Value type is not supported by this decoder";
        case DecodeErrorCode::unknown_value_type:
            return "Unknown value type tag";
    }
    return "Unknown decode error";
}

} // namespace parcelio
