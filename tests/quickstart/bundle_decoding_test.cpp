// [TITLE]
// Decoding Bundles
// [/TITLE]
//
// This test demonstrates decoding a received bundle with parse_bundle()
// and reading its values, including polymorphic records resolved through
// a CreatorRegistry.

#include <array>
#include <iostream>
#include <span>
#include <variant>

#include <cstdint>
#include <gtest/gtest.h>
#include <parcelio.hpp>

#include "../parcel_test_helpers.hpp"

// Helper: Create a bundle as the power stats service sends it
// In real code, these bytes come from the transport
static auto create_monitor_bundle() {
    parcelio::test::ParcelBuilder p;
    size_t len = p.begin_bundle(1);
    p.string("monitors");
    p.i32(static_cast<int32_t>(parcelio::ValueType::parcelable_array));
    size_t value_len = p.begin_length();
    p.i32(2);
    p.string("android.os.PowerMonitor").power_monitor(0, 1, "[VSYS_PWR_DISPLAY]:Display");
    p.string("android.os.PowerMonitor").power_monitor(1, 0, "GPU");
    p.end_length(value_len);
    p.end_length(len);
    return p.bytes();
}

static auto create_readings_bundle() {
    parcelio::test::ParcelBuilder p;
    size_t len = p.begin_bundle(2);
    std::array<int64_t, 2> timestamps{5000, 5000};
    std::array<int64_t, 2> energy{1200, 3400};
    p.string("timestamps").long_array(timestamps);
    p.string("energy").long_array(energy);
    p.end_length(len);
    return p.bytes();
}

// [EXAMPLE]
// Reading Simple Values
// [/EXAMPLE]

// [DESCRIPTION]
// `parse_bundle()` decodes the whole bundle and returns a
// `DecodeResult<Bundle>`. Use `get_if<T>()` to fetch a value of a known
// kind; it returns nullptr if the key is absent or holds another kind.
// [/DESCRIPTION]

TEST(BundleDecoding, ReadLongArrays) {
    auto buffer = create_readings_bundle();
    parcelio::CreatorRegistry registry;

    // [SNIPPET]
    std::span<const uint8_t> received_bytes = buffer;

    auto result = parcelio::parse_bundle(received_bytes, registry);
    if (!result) {
        std::cerr << "Decode failed: " << result.error().message() << " at offset "
                  << result.error().position << "\n";
        return;
    }

    const auto* timestamps = result->get_if<parcelio::LongArray>("timestamps");
    const auto* energy = result->get_if<parcelio::LongArray>("energy");
    if (timestamps && energy) {
        for (size_t i = 0; i < energy->size(); ++i) {
            std::cout << "t=" << (*timestamps)[i] << "ms energy=" << (*energy)[i] << "uWs\n";
        }
    }
    // [/SNIPPET]

    ASSERT_NE(energy, nullptr);
    EXPECT_EQ((*energy)[1], 3400);
}

// [EXAMPLE]
// Decoding Polymorphic Records
// [/EXAMPLE]

// [DESCRIPTION]
// Records inside a parcelable array are built by the creator registered
// under the type name the stream carries. Register the built-in creators
// once at startup, then match on the `Record` variant.
// [/DESCRIPTION]

TEST(BundleDecoding, ReadPowerMonitors) {
    auto buffer = create_monitor_bundle();

    // [SNIPPET]
    parcelio::CreatorRegistry registry;
    parcelio::register_builtin_creators(registry);

    auto result = parcelio::parse_bundle(buffer, registry);
    ASSERT_TRUE(result.has_value());

    const auto* monitors = result->get_if<parcelio::ParcelableArray>("monitors");
    ASSERT_NE(monitors, nullptr);
    for (const auto& record : *monitors) {
        if (const auto* monitor = std::get_if<parcelio::PowerMonitor>(&record)) {
            std::cout << monitor->index << ": " << monitor->name << "\n";
        } else {
            std::cout << "Unhandled record " << parcelio::record_type_name(record) << "\n";
        }
    }
    // [/SNIPPET]

    ASSERT_EQ(monitors->size(), 2u);
    EXPECT_EQ(std::get<parcelio::PowerMonitor>((*monitors)[1]).name, "GPU");
}

// [EXAMPLE]
// Handling Decode Errors
// [/EXAMPLE]

// [DESCRIPTION]
// A type name with no registered creator fails the whole decode with
// `name_not_found`; the error names the missing type.
// [/DESCRIPTION]

TEST(BundleDecoding, MissingCreator) {
    auto buffer = create_monitor_bundle();
    parcelio::CreatorRegistry registry; // nothing registered

    // [SNIPPET]
    auto result = parcelio::parse_bundle(buffer, registry);
    if (!result && result.error().code == parcelio::DecodeErrorCode::name_not_found) {
        std::cout << "No creator for " << result.error().type_name << "\n";
    }
    // [/SNIPPET]

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().type_name, "android.os.PowerMonitor");
}
