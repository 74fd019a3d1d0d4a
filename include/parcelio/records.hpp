#pragma once

#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <cstddef>
#include <cstdint>

#include "detail/decode_result.hpp"
#include "detail/string_decode.hpp"
#include "parcel_reader.hpp"

namespace parcelio {

/**
 * @brief Kind of power monitor reported by the power stats service
 */
enum class PowerMonitorType : int32_t {
    /// Subsystem-level monitor; may be a pass-through rail or modeled from several rails
    consumer = 0,
    /// Directly measured, device-specific power rail
    measurement = 1
};

/**
 * @brief Power monitor description record
 *
 * Wire layout: i32 index, i32 type, String8 name.
 */
struct PowerMonitor {
    static constexpr std::string_view type_name = "android.os.PowerMonitor";

    int32_t index{0};
    PowerMonitorType type{PowerMonitorType::consumer};
    std::string name;

    bool operator==(const PowerMonitor&) const = default;

    /**
     * @brief Decode one PowerMonitor from the cursor
     * @return The record, or invalid_enum_value for an undefined monitor type
     */
    [[nodiscard]] static DecodeResult<PowerMonitor> parse(ParcelReader& reader) {
        PowerMonitor monitor;

        auto index = reader.read<int32_t>();
        if (!index) {
            return unexpected(index.error());
        }
        monitor.index = *index;

        const size_t type_pos = reader.position();
        auto type = reader.read<int32_t>();
        if (!type) {
            return unexpected(type.error());
        }
        if (*type != static_cast<int32_t>(PowerMonitorType::consumer) &&
            *type != static_cast<int32_t>(PowerMonitorType::measurement)) {
            return make_decode_error(DecodeErrorCode::invalid_enum_value, type_pos);
        }
        monitor.type = static_cast<PowerMonitorType>(*type);

        auto name = read_string8(reader);
        if (!name) {
            return unexpected(name.error());
        }
        monitor.name = std::move(*name);
        return monitor;
    }
};

/**
 * @brief Record of a type this library has no dedicated decoder for
 *
 * Holds the registered type name and the raw bytes its creator consumed, so
 * callers can decode it themselves.
 */
struct OpaqueRecord {
    std::string type_name;
    std::vector<uint8_t> bytes;

    bool operator==(const OpaqueRecord&) const = default;
};

/**
 * @brief A decoded polymorphic record
 *
 * Closed set of known record types plus the opaque fallback. Match with
 * std::get_if / std::visit instead of a runtime downcast.
 */
using Record = std::variant<PowerMonitor, OpaqueRecord>;

/**
 * @brief Get the type name a record was registered under
 */
inline std::string_view record_type_name(const Record& record) noexcept {
    return std::visit(
        [](auto&& r) -> std::string_view {
            using T = std::decay_t<decltype(r)>;
            if constexpr (std::is_same_v<T, OpaqueRecord>) {
                return r.type_name;
            } else {
                return T::type_name;
            }
        },
        record);
}

/**
 * @brief Consume a fixed-size record body as raw bytes
 *
 * The body is padded to the next word boundary on the wire; the padding is
 * consumed but not stored.
 *
 * @param reader Cursor positioned at the record body
 * @param type_name Name the record was registered under
 * @param size_bytes Unpadded body size
 */
[[nodiscard]] inline DecodeResult<OpaqueRecord>
read_opaque_record(ParcelReader& reader, std::string type_name, size_t size_bytes) {
    auto words = reader.read_words(detail::pad_to_word(size_bytes) / parcel_word_size);
    if (!words) {
        return unexpected(words.error());
    }
    auto body = words->first(size_bytes);
    return OpaqueRecord{std::move(type_name), std::vector<uint8_t>(body.begin(), body.end())};
}

} // namespace parcelio
