#pragma once

#include <functional>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

#include <cstddef>
#include <spdlog/spdlog.h>

#include "detail/decode_result.hpp"
#include "detail/string_hash.hpp"
#include "parcel_reader.hpp"
#include "records.hpp"

namespace parcelio {

/**
 * @brief Factory that decodes one record body from the cursor
 *
 * Invoked with the cursor positioned right after the record's type name.
 */
using Creator = std::function<DecodeResult<Record>(ParcelReader&)>;

/**
 * @brief Table mapping record type names to their creators
 *
 * Owned by the application and passed to every decode call; there is no
 * process-wide instance. Lookups take a shared lock and may run from any
 * number of decoding threads at once; registration takes an exclusive lock.
 *
 * Usage:
 * @code
 *   parcelio::CreatorRegistry registry;
 *   parcelio::register_builtin_creators(registry);
 *   auto bundle = parcelio::parse_bundle(rx_bytes, registry);
 * @endcode
 */
class CreatorRegistry {
public:
    CreatorRegistry() = default;

    CreatorRegistry(const CreatorRegistry&) = delete;
    CreatorRegistry& operator=(const CreatorRegistry&) = delete;

    /**
     * @brief Register a creator under a type name
     *
     * A second registration under the same name replaces the first.
     */
    void register_creator(std::string name, Creator creator) {
        std::unique_lock lock(mutex_);
        spdlog::debug("parcelio: registering creator for `{}`", name);
        creators_.insert_or_assign(std::move(name), std::move(creator));
    }

    /**
     * @brief Find the creator for a type name
     * @return The creator, or DecodeErrorCode::name_not_found carrying the name
     */
    [[nodiscard]] DecodeResult<Creator> lookup(std::string_view name) const {
        {
            std::shared_lock lock(mutex_);
            auto it = creators_.find(name);
            if (it != creators_.end()) {
                return it->second;
            }
        }
        spdlog::warn("parcelio: no creator registered for `{}`", name);
        return make_name_error(DecodeErrorCode::name_not_found, 0, std::string(name));
    }

    [[nodiscard]] bool contains(std::string_view name) const {
        std::shared_lock lock(mutex_);
        return creators_.contains(name);
    }

    [[nodiscard]] size_t size() const {
        std::shared_lock lock(mutex_);
        return creators_.size();
    }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Creator, detail::StringHash, std::equal_to<>> creators_;
};

/**
 * @brief Register every record type that has a built-in decoder
 *
 * Safe to call more than once; later calls re-register the same creators.
 */
inline void register_builtin_creators(CreatorRegistry& registry) {
    registry.register_creator(std::string(PowerMonitor::type_name),
                              [](ParcelReader& reader) -> DecodeResult<Record> {
                                  return PowerMonitor::parse(reader).map(
                                      [](PowerMonitor&& monitor) { return Record{std::move(monitor)}; });
                              });
}

} // namespace parcelio
