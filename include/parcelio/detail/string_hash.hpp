#pragma once

#include <functional>
#include <string>
#include <string_view>

#include <cstddef>

namespace parcelio::detail {

/**
 * @brief Transparent hash for string-keyed maps
 *
 * Paired with std::equal_to<> so find() and contains() accept a
 * std::string_view without building a temporary std::string.
 */
struct StringHash {
    using is_transparent = void;

    size_t operator()(std::string_view text) const noexcept {
        return std::hash<std::string_view>{}(text);
    }
    size_t operator()(const std::string& text) const noexcept {
        return std::hash<std::string_view>{}(text);
    }
    size_t operator()(const char* text) const noexcept {
        return std::hash<std::string_view>{}(text);
    }
};

} // namespace parcelio::detail
