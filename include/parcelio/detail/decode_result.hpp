#pragma once

#include <string>
#include <utility>

#include "../expected.hpp"
#include "decode_error.hpp"

namespace parcelio {

/**
 * @brief Result type for decode operations
 *
 * Alias for expected<T, DecodeError>. Holds either the decoded value or a
 * DecodeError describing the first failure.
 *
 * Usage:
 * @code
 *   auto result = parcelio::parse_bundle(buffer, registry);
 *   if (result.has_value()) {
 *       auto* ids = result->get_if<parcelio::LongArray>("ids");
 *   } else {
 *       std::cerr << result.error().message() << "\n";
 *   }
 * @endcode
 *
 * @tparam T The type of the successfully decoded value
 */
template <typename T>
using DecodeResult = expected<T, DecodeError>;

/**
 * @brief Factory function for creating decode errors
 *
 * Usage:
 * @code
 *   return make_decode_error(DecodeErrorCode::truncated, reader.position());
 * @endcode
 *
 * @param code The error code
 * @param position Cursor position where the failure was detected
 * @return unexpected<DecodeError> suitable for returning from decode functions
 */
inline auto make_decode_error(DecodeErrorCode code, size_t position) {
    return unexpected(DecodeError{.code = code, .position = position, .tag = {}, .type_name = {}});
}

/**
 * @brief Create a decode error for a specific value tag
 */
inline auto make_value_error(DecodeErrorCode code, size_t position, int32_t tag) {
    return unexpected(DecodeError{.code = code, .position = position, .tag = tag, .type_name = {}});
}

/**
 * @brief Create a decode error for a record type name
 */
inline auto make_name_error(DecodeErrorCode code, size_t position, std::string type_name) {
    return unexpected(DecodeError{
        .code = code, .position = position, .tag = {}, .type_name = std::move(type_name)});
}

} // namespace parcelio
