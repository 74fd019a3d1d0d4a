#pragma once

#include <optional>
#include <string>

#include <cstddef>
#include <cstdint>
#include <parcelio/types.hpp>

namespace parcelio {

/**
 * @brief Error information from a failed decode
 *
 * Carries the failure kind plus the context needed to diagnose it: the byte
 * offset in the parcel where the failure was detected, the value tag being
 * decoded (if any) and the record type name that was looked up (if any).
 */
struct DecodeError {
    DecodeErrorCode code{DecodeErrorCode::truncated}; ///< What went wrong
    size_t position{0};         ///< Cursor position when the failure was detected
    std::optional<int32_t> tag; ///< Raw value tag, for value-level failures
    std::string type_name;      ///< Record type name, for registry failures

    /**
     * @brief Get a human-readable error message
     * @return Static string describing the error code
     */
    [[nodiscard]] const char* message() const noexcept { return decode_error_string(code); }
};

/**
 * @brief Check if an error means the structural contract of the format was violated
 */
[[nodiscard]] constexpr bool is_framing_error(DecodeErrorCode code) noexcept {
    switch (code) {
        case DecodeErrorCode::invalid_presence_flag:
        case DecodeErrorCode::negative_length:
        case DecodeErrorCode::negative_count:
        case DecodeErrorCode::length_mismatch:
        case DecodeErrorCode::invalid_magic:
        case DecodeErrorCode::invalid_enum_value:
            return true;
        default:
            return false;
    }
}

[[nodiscard]] constexpr bool is_truncation_error(DecodeErrorCode code) noexcept {
    return code == DecodeErrorCode::truncated;
}

[[nodiscard]] constexpr bool is_encoding_error(DecodeErrorCode code) noexcept {
    return code == DecodeErrorCode::missing_terminator || code == DecodeErrorCode::invalid_utf8;
}

} // namespace parcelio
