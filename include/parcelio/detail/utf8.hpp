#pragma once

#include <span>

#include <cstddef>
#include <cstdint>

namespace parcelio::detail {

/**
 * @brief Validate a byte sequence as well-formed UTF-8
 *
 * Rejects overlong encodings, UTF-16 surrogate code points (U+D800..U+DFFF),
 * code points above U+10FFFF and truncated sequences.
 */
[[nodiscard]] inline bool is_valid_utf8(std::span<const uint8_t> bytes) noexcept {
    size_t i = 0;
    while (i < bytes.size()) {
        uint8_t lead = bytes[i];
        if (lead < 0x80) {
            ++i;
            continue;
        }

        size_t extra = 0;
        uint32_t code_point = 0;
        uint32_t min_code_point = 0;
        if ((lead & 0xE0) == 0xC0) {
            extra = 1;
            code_point = lead & 0x1F;
            min_code_point = 0x80;
        } else if ((lead & 0xF0) == 0xE0) {
            extra = 2;
            code_point = lead & 0x0F;
            min_code_point = 0x800;
        } else if ((lead & 0xF8) == 0xF0) {
            extra = 3;
            code_point = lead & 0x07;
            min_code_point = 0x10000;
        } else {
            return false; // stray continuation byte or invalid lead
        }

        if (bytes.size() - i <= extra) {
            return false;
        }
        for (size_t k = 1; k <= extra; ++k) {
            uint8_t cont = bytes[i + k];
            if ((cont & 0xC0) != 0x80) {
                return false;
            }
            code_point = (code_point << 6) | (cont & 0x3F);
        }

        if (code_point < min_code_point || code_point > 0x10FFFF ||
            (code_point >= 0xD800 && code_point <= 0xDFFF)) {
            return false;
        }
        i += extra + 1;
    }
    return true;
}

} // namespace parcelio::detail
