#pragma once

#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>

#include <cstddef>
#include <cstdint>
#include <spdlog/spdlog.h>

#include "creator_registry.hpp"
#include "decode_options.hpp"
#include "detail/decode_result.hpp"
#include "detail/string_hash.hpp"
#include "detail/string_decode.hpp"
#include "detail/value_decode.hpp"
#include "parcel_reader.hpp"
#include "types.hpp"
#include "value.hpp"

namespace parcelio {

/**
 * @brief Decoded key/value container
 *
 * Keys are unique; when the wire carries a key twice the later value wins.
 * Iteration order is unspecified.
 *
 * Wire layout:
 *   i32 presence            must be 1 (written for a non-null object)
 *   i32 length              payload bytes after this field; 0 means empty
 *   i32 magic               'BNDL' or 'BNDN'
 *   i32 count
 *   count x (plain string key, tagged value)
 *
 * Usage:
 * @code
 *   auto result = parcelio::Bundle::parse(reader, registry);
 *   if (!result) {
 *       return;
 *   }
 *   if (auto* ids = result->get_if<parcelio::LongArray>("ids")) {
 *       // ...
 *   }
 * @endcode
 */
class Bundle {
public:
    using Map = std::unordered_map<std::string, Value, detail::StringHash, std::equal_to<>>;

    Bundle() = default;
    explicit Bundle(Map entries) : entries_(std::move(entries)) {}

    /**
     * @brief Decode a bundle at the cursor
     *
     * An empty bundle (length 0) consumes only the presence and length
     * fields; bytes after them are left alone.
     *
     * @param reader Cursor positioned at the presence flag
     * @param registry Creators for polymorphic records inside the bundle
     * @param options Optional stricter validation
     * @return The bundle, or the first error encountered
     */
    [[nodiscard]] static DecodeResult<Bundle> parse(ParcelReader& reader,
                                                    const CreatorRegistry& registry,
                                                    const DecodeOptions& options = {}) {
        const size_t presence_pos = reader.position();
        auto presence = reader.read<int32_t>();
        if (!presence) {
            return unexpected(presence.error());
        }
        if (*presence != 1) {
            return fail(DecodeErrorCode::invalid_presence_flag, presence_pos);
        }

        const size_t length_pos = reader.position();
        auto length = reader.read<int32_t>();
        if (!length) {
            return unexpected(length.error());
        }
        if (*length < 0) {
            return fail(DecodeErrorCode::negative_length, length_pos);
        }
        if (*length == 0) {
            return Bundle{};
        }
        if (static_cast<size_t>(*length) > reader.remaining()) {
            return fail(DecodeErrorCode::truncated, length_pos);
        }
        const size_t start = reader.position();

        auto magic = reader.read<int32_t>();
        if (!magic) {
            return unexpected(magic.error());
        }
        if (options.validate_magic && *magic != bundle_magic && *magic != bundle_magic_native) {
            return fail(DecodeErrorCode::invalid_magic, start);
        }

        const size_t count_pos = reader.position();
        auto count = reader.read<int32_t>();
        if (!count) {
            return unexpected(count.error());
        }
        if (*count < 0) {
            return fail(DecodeErrorCode::negative_count, count_pos);
        }

        Map entries;
        for (int32_t i = 0; i < *count; ++i) {
            auto key = read_string(reader);
            if (!key) {
                return unexpected(key.error());
            }
            auto value = read_value(reader, registry);
            if (!value) {
                return unexpected(value.error());
            }
            entries.insert_or_assign(std::move(*key), std::move(*value));
        }

        if (options.strict_length && reader.position() != start + static_cast<size_t>(*length)) {
            return fail(DecodeErrorCode::length_mismatch, reader.position());
        }
        return Bundle{std::move(entries)};
    }

    size_t size() const noexcept { return entries_.size(); }
    bool empty() const noexcept { return entries_.empty(); }

    bool contains(std::string_view key) const { return entries_.contains(key); }

    /**
     * @brief Look up a value by key
     * @return Pointer to the value, or nullptr if the key is absent
     */
    const Value* find(std::string_view key) const {
        auto it = entries_.find(key);
        return it != entries_.end() ? &it->second : nullptr;
    }

    /**
     * @brief Look up a value by key and alternative
     * @tparam T One of the Value alternatives (e.g. LongArray)
     * @return Pointer to the held T, or nullptr if the key is absent or holds another kind
     */
    template <typename T>
    const T* get_if(std::string_view key) const {
        const Value* value = find(key);
        return value != nullptr ? std::get_if<T>(value) : nullptr;
    }

    const Map& entries() const noexcept { return entries_; }

    Map::const_iterator begin() const noexcept { return entries_.begin(); }
    Map::const_iterator end() const noexcept { return entries_.end(); }

    bool operator==(const Bundle&) const = default;

private:
    Map entries_;

    static unexpected<DecodeError> fail(DecodeErrorCode code, size_t position) {
        spdlog::debug("parcelio: bundle decode failed at offset {}: {}", position,
                      decode_error_string(code));
        return make_decode_error(code, position);
    }
};

/**
 * @brief Decode a bundle from the start of a raw buffer
 *
 * @param bytes Received parcel bytes, positioned at the bundle's presence flag
 * @param registry Creators for polymorphic records
 * @param options Optional stricter validation
 */
[[nodiscard]] inline DecodeResult<Bundle> parse_bundle(std::span<const uint8_t> bytes,
                                                       const CreatorRegistry& registry,
                                                       const DecodeOptions& options = {}) {
    ParcelReader reader(bytes);
    return Bundle::parse(reader, registry, options);
}

} // namespace parcelio
