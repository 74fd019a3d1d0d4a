#pragma once

#include <string>
#include <utility>
#include <vector>

#include <cstddef>
#include <cstdint>
#include <spdlog/spdlog.h>

#include "../creator_registry.hpp"
#include "../parcel_reader.hpp"
#include "../types.hpp"
#include "../value.hpp"
#include "decode_result.hpp"
#include "string_decode.hpp"

namespace parcelio::detail {

/**
 * @brief Decode the body of a VAL_PARCELABLEARRAY
 *
 * Layout: i32 count, then per element a plain-string type name followed by
 * the record body, which is handed to the creator registered for that name.
 * Nothing is returned unless every element decodes.
 */
[[nodiscard]] inline DecodeResult<Value> read_parcelable_array(ParcelReader& reader,
                                                               const CreatorRegistry& registry,
                                                               int32_t tag) {
    const size_t count_pos = reader.position();
    auto count = reader.read<int32_t>();
    if (!count) {
        return unexpected(count.error());
    }
    if (*count < 0) {
        return make_value_error(DecodeErrorCode::negative_count, count_pos, tag);
    }
    // Every element needs at least the length word of its type name
    if (static_cast<size_t>(*count) > reader.remaining() / parcel_word_size) {
        return make_value_error(DecodeErrorCode::truncated, count_pos, tag);
    }

    ParcelableArray records;
    records.reserve(static_cast<size_t>(*count));
    for (int32_t i = 0; i < *count; ++i) {
        const size_t name_pos = reader.position();
        auto name = read_string(reader);
        if (!name) {
            return unexpected(name.error());
        }

        auto creator = registry.lookup(*name);
        if (!creator) {
            DecodeError err = std::move(creator).error();
            err.position = name_pos;
            err.tag = tag;
            return unexpected(std::move(err));
        }

        auto record = (*creator)(reader);
        if (!record) {
            return unexpected(record.error());
        }
        records.push_back(std::move(*record));
    }
    return Value{std::move(records)};
}

/**
 * @brief Decode the body of a VAL_LONGARRAY: i32 count, then count i64 values
 */
[[nodiscard]] inline DecodeResult<Value> read_long_array(ParcelReader& reader, int32_t tag) {
    const size_t count_pos = reader.position();
    auto count = reader.read<int32_t>();
    if (!count) {
        return unexpected(count.error());
    }
    if (*count < 0) {
        return make_value_error(DecodeErrorCode::negative_count, count_pos, tag);
    }
    if (static_cast<size_t>(*count) > reader.remaining() / sizeof(int64_t)) {
        return make_value_error(DecodeErrorCode::truncated, count_pos, tag);
    }

    LongArray values;
    values.reserve(static_cast<size_t>(*count));
    for (int32_t i = 0; i < *count; ++i) {
        auto v = reader.read<int64_t>();
        if (!v) {
            return unexpected(v.error());
        }
        values.push_back(*v);
    }
    return Value{std::move(values)};
}

/**
 * @brief Decode the body of a VAL_BOOLEANARRAY: i32 count, then one i32 word per element
 *
 * A count that is negative or larger than the remaining words yields Null
 * and nothing past the count is consumed.
 */
[[nodiscard]] inline DecodeResult<Value> read_boolean_array(ParcelReader& reader) {
    auto count = reader.read<int32_t>();
    if (!count) {
        return unexpected(count.error());
    }
    if (*count < 0 || static_cast<size_t>(*count) > reader.remaining() / parcel_word_size) {
        return Value{Null{}};
    }

    BooleanArray values;
    values.reserve(static_cast<size_t>(*count));
    for (int32_t i = 0; i < *count; ++i) {
        auto word = reader.read<int32_t>();
        if (!word) {
            return unexpected(word.error());
        }
        values.push_back(*word != 0);
    }
    return Value{std::move(values)};
}

/**
 * @brief Dispatch on the tag and decode the value body
 *
 * @param tag_pos Offset of the tag, for error reporting
 */
[[nodiscard]] inline DecodeResult<Value> read_value_payload(ParcelReader& reader,
                                                            const CreatorRegistry& registry,
                                                            int32_t tag, size_t tag_pos) {
    if (!is_known_value_type(tag)) {
        spdlog::debug("parcelio: unknown value type {} at offset {}", tag, tag_pos);
        return make_value_error(DecodeErrorCode::unknown_value_type, tag_pos, tag);
    }

    switch (static_cast<ValueType>(tag)) {
        case ValueType::parcelable_array:
            return read_parcelable_array(reader, registry, tag);
        case ValueType::long_array:
            return read_long_array(reader, tag);
        case ValueType::boolean_array:
            return read_boolean_array(reader);
        default:
            break;
    }

    spdlog::debug("parcelio: {} at offset {} is not supported",
                  value_type_string(static_cast<ValueType>(tag)), tag_pos);
    return make_value_error(DecodeErrorCode::unsupported_value_type, tag_pos, tag);
}

} // namespace parcelio::detail

namespace parcelio {

/**
 * @brief Decode one tagged value
 *
 * Reads the i32 tag and dispatches to the matching body decoder. For
 * length-prefixed tags the i32 length that follows the tag is checked
 * against the buffer before decoding, and the body must end exactly at
 * start + length afterwards; a mismatch is reported as
 * DecodeErrorCode::length_mismatch, never skipped over.
 *
 * @param reader Cursor positioned at the tag; left past the whole value on success
 * @param registry Creators for polymorphic records
 * @return The decoded value or the first error encountered
 */
[[nodiscard]] inline DecodeResult<Value> read_value(ParcelReader& reader,
                                                    const CreatorRegistry& registry) {
    const size_t tag_pos = reader.position();
    auto tag = reader.read<int32_t>();
    if (!tag) {
        return unexpected(tag.error());
    }

    if (!is_length_prefixed(*tag)) {
        return detail::read_value_payload(reader, registry, *tag, tag_pos);
    }

    const size_t length_pos = reader.position();
    auto length = reader.read<int32_t>();
    if (!length) {
        return unexpected(length.error());
    }
    if (*length < 0) {
        return make_value_error(DecodeErrorCode::negative_length, length_pos, *tag);
    }
    if (static_cast<size_t>(*length) > reader.remaining()) {
        return make_value_error(DecodeErrorCode::truncated, length_pos, *tag);
    }

    const size_t start = reader.position();
    auto value = detail::read_value_payload(reader, registry, *tag, tag_pos);
    if (!value) {
        return value;
    }

    const size_t expected_end = start + static_cast<size_t>(*length);
    if (reader.position() != expected_end) {
        spdlog::debug("parcelio: {} declared {} bytes but consumed {}",
                      value_type_string(static_cast<ValueType>(*tag)), *length,
                      reader.position() - start);
        return make_value_error(DecodeErrorCode::length_mismatch, reader.position(), *tag);
    }
    return value;
}

} // namespace parcelio
