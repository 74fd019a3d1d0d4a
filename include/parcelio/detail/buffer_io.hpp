#pragma once

#include <bit>
#include <concepts>

#include <cstddef>
#include <cstdint>
#include <cstring>

namespace parcelio::detail {

/// Integral types that can be read directly from the wire
template <typename T>
concept WireInteger = std::same_as<T, int32_t> || std::same_as<T, uint32_t> ||
                      std::same_as<T, int64_t> || std::same_as<T, uint64_t>;

inline uint32_t byteswap32(uint32_t value) noexcept {
    return __builtin_bswap32(value);
}

inline uint64_t byteswap64(uint64_t value) noexcept {
    return __builtin_bswap64(value);
}

/**
 * @brief Load a little-endian integer from an unaligned byte pointer
 *
 * The parcel format is little-endian regardless of host; big-endian hosts
 * swap after the load.
 */
template <WireInteger T>
inline T load_le(const uint8_t* data) noexcept {
    T value;
    std::memcpy(&value, data, sizeof(T));
    if constexpr (std::endian::native == std::endian::big) {
        if constexpr (sizeof(T) == 4) {
            value = static_cast<T>(byteswap32(static_cast<uint32_t>(value)));
        } else {
            value = static_cast<T>(byteswap64(static_cast<uint64_t>(value)));
        }
    }
    return value;
}

/// Round a byte count up to the next word boundary
constexpr size_t pad_to_word(size_t bytes) noexcept {
    return (bytes + 3) & ~static_cast<size_t>(3);
}

} // namespace parcelio::detail
