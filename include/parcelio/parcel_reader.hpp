#pragma once

#include <span>

#include <cstddef>
#include <cstdint>

#include "detail/buffer_io.hpp"
#include "detail/decode_result.hpp"
#include "types.hpp"

namespace parcelio {

/**
 * @brief Positioned read-only cursor over a received parcel
 *
 * Wraps an immutable byte buffer handed over by the transport and exposes
 * fixed-width little-endian reads. Every read is bounds checked: a read that
 * would run past the end fails with DecodeErrorCode::truncated and leaves the
 * position untouched.
 *
 * The reader does not own the buffer; it must outlive the reader and
 * anything decoded as a view into it.
 *
 * Usage:
 * @code
 *   parcelio::ParcelReader reader(rx_bytes);
 *   auto tag = reader.read<int32_t>();
 *   if (!tag) {
 *       return parcelio::unexpected(tag.error());
 *   }
 * @endcode
 */
class ParcelReader {
public:
    explicit ParcelReader(std::span<const uint8_t> data) noexcept : data_(data) {}

    /**
     * @brief Read one little-endian integer and advance past it
     * @tparam T int32_t, uint32_t, int64_t or uint64_t
     */
    template <detail::WireInteger T>
    [[nodiscard]] DecodeResult<T> read() noexcept {
        if (remaining() < sizeof(T)) {
            return make_decode_error(DecodeErrorCode::truncated, pos_);
        }
        T value = detail::load_le<T>(data_.data() + pos_);
        pos_ += sizeof(T);
        return value;
    }

    /**
     * @brief Read a run of 32-bit words as raw bytes
     * @param count Number of words
     * @return View into the underlying buffer, 4 * count bytes long
     */
    [[nodiscard]] DecodeResult<std::span<const uint8_t>> read_words(size_t count) noexcept {
        if (count > remaining() / parcel_word_size) {
            return make_decode_error(DecodeErrorCode::truncated, pos_);
        }
        auto bytes = data_.subspan(pos_, count * parcel_word_size);
        pos_ += bytes.size();
        return bytes;
    }

    /**
     * @brief Move the cursor to an absolute offset
     *
     * Seeking to data_size() is allowed (end of parcel), anything past it
     * is not.
     */
    [[nodiscard]] DecodeResult<void> set_position(size_t position) noexcept {
        if (position > data_.size()) {
            return make_decode_error(DecodeErrorCode::truncated, pos_);
        }
        pos_ = position;
        return {};
    }

    size_t position() const noexcept { return pos_; }
    size_t data_size() const noexcept { return data_.size(); }
    size_t remaining() const noexcept { return data_.size() - pos_; }

    std::span<const uint8_t> data() const noexcept { return data_; }

private:
    std::span<const uint8_t> data_;
    size_t pos_{0};
};

} // namespace parcelio
