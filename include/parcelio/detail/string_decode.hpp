#pragma once

#include <span>
#include <string>

#include <cstddef>
#include <cstdint>

#include "../parcel_reader.hpp"
#include "buffer_io.hpp"
#include "decode_result.hpp"
#include "utf8.hpp"

namespace parcelio {

/**
 * @brief Decode a String8 field
 *
 * Wire layout:
 *   u32 len                 length in bytes, excluding the terminator
 *   u8[len] text            UTF-8
 *   u8 '\0'                 mandatory terminator
 *   padding                 to the next word boundary
 *
 * The text plus terminator occupies ceil((len + 1) / 4) words, so the cursor
 * always ends word aligned, exactly 4 * ceil((len + 1) / 4) bytes past the
 * length field.
 *
 * @param reader Cursor positioned at the length field
 * @return The decoded text, or truncated / missing_terminator / invalid_utf8
 */
[[nodiscard]] inline DecodeResult<std::string> read_string8(ParcelReader& reader) {
    const size_t field_start = reader.position();

    auto len = reader.read<uint32_t>();
    if (!len) {
        return unexpected(len.error());
    }

    // The terminator needs one byte past the text, so len must be below remaining
    const size_t text_size = *len;
    if (text_size >= reader.remaining()) {
        return make_decode_error(DecodeErrorCode::truncated, reader.position());
    }
    auto words = reader.read_words(detail::pad_to_word(text_size + 1) / parcel_word_size);
    if (!words) {
        return unexpected(words.error());
    }

    std::span<const uint8_t> bytes = *words;
    if (bytes[text_size] != 0) {
        return make_decode_error(DecodeErrorCode::missing_terminator, field_start);
    }

    auto text = bytes.first(text_size);
    if (!detail::is_valid_utf8(text)) {
        return make_decode_error(DecodeErrorCode::invalid_utf8, field_start);
    }
    return std::string(text.begin(), text.end());
}

/**
 * @brief Decode a plain length-prefixed string
 *
 * This is the transport's native string form, used for bundle keys and
 * record type names. Unlike String8 there is no terminator: an i32 byte
 * length is followed by the UTF-8 bytes, padded to the next word boundary.
 *
 * @param reader Cursor positioned at the length field
 * @return The decoded text, or negative_length / truncated / invalid_utf8
 */
[[nodiscard]] inline DecodeResult<std::string> read_string(ParcelReader& reader) {
    const size_t field_start = reader.position();

    auto len = reader.read<int32_t>();
    if (!len) {
        return unexpected(len.error());
    }
    if (*len < 0) {
        return make_decode_error(DecodeErrorCode::negative_length, field_start);
    }

    const size_t text_size = static_cast<size_t>(*len);
    auto words = reader.read_words(detail::pad_to_word(text_size) / parcel_word_size);
    if (!words) {
        return unexpected(words.error());
    }

    auto text = words->first(text_size);
    if (!detail::is_valid_utf8(text)) {
        return make_decode_error(DecodeErrorCode::invalid_utf8, field_start);
    }
    return std::string(text.begin(), text.end());
}

} // namespace parcelio
