#include <iostream>
#include <span>
#include <string>
#include <variant>
#include <vector>

#include <cstdint>
#include <cstring>
#include <parcelio.hpp>

using namespace parcelio;

// Append one little-endian i32 (the example runs on little-endian hosts)
void put_i32(std::vector<uint8_t>& out, int32_t value) {
    uint8_t bytes[4];
    std::memcpy(bytes, &value, sizeof(value));
    out.insert(out.end(), bytes, bytes + 4);
}

void put_string(std::vector<uint8_t>& out, const std::string& text) {
    put_i32(out, static_cast<int32_t>(text.size()));
    out.insert(out.end(), text.begin(), text.end());
    while (out.size() % 4 != 0) {
        out.push_back(0);
    }
}

// Helper function to print one decoded value
void printValue(const std::string& key, const Value& value) {
    std::cout << "  " << key << " (" << value_type_string(value_type_of(value)) << "): ";
    if (const auto* longs = std::get_if<LongArray>(&value)) {
        for (int64_t v : *longs) {
            std::cout << v << " ";
        }
    } else if (const auto* flags = std::get_if<BooleanArray>(&value)) {
        for (bool b : *flags) {
            std::cout << (b ? "true " : "false ");
        }
    } else if (const auto* records = std::get_if<ParcelableArray>(&value)) {
        std::cout << records->size() << " record(s)";
    } else {
        std::cout << "null";
    }
    std::cout << "\n";
}

int main() {
    std::cout << "PARCELIO Bundle Example\n";
    std::cout << "=======================\n\n";

    // A bundle holding {"ids": long[] {7, 42}, "flags": boolean[] {true, false}}
    std::vector<uint8_t> parcel;
    put_i32(parcel, 1); // present
    put_i32(parcel, 0); // length, patched below
    const size_t start = parcel.size();
    put_i32(parcel, bundle_magic);
    put_i32(parcel, 2);
    put_string(parcel, "ids");
    put_i32(parcel, static_cast<int32_t>(ValueType::long_array));
    put_i32(parcel, 2);
    for (int64_t v : {int64_t{7}, int64_t{42}}) {
        uint8_t bytes[8];
        std::memcpy(bytes, &v, sizeof(v));
        parcel.insert(parcel.end(), bytes, bytes + 8);
    }
    put_string(parcel, "flags");
    put_i32(parcel, static_cast<int32_t>(ValueType::boolean_array));
    put_i32(parcel, 2);
    put_i32(parcel, 1);
    put_i32(parcel, 0);
    const int32_t length = static_cast<int32_t>(parcel.size() - start);
    std::memcpy(parcel.data() + start - 4, &length, sizeof(length));

    CreatorRegistry registry;
    register_builtin_creators(registry);

    DecodeOptions options;
    options.validate_magic = true;
    options.strict_length = true;

    auto result = parse_bundle(parcel, registry, options);
    if (!result) {
        std::cerr << "Decode failed: " << result.error().message() << " at offset "
                  << result.error().position << "\n";
        return 1;
    }

    std::cout << "Decoded " << result->size() << " entries:\n";
    for (const auto& [key, value] : *result) {
        printValue(key, value);
    }

    // Corrupt the long array count and decode again
    std::vector<uint8_t> corrupt = parcel;
    const int32_t bogus = 1000;
    std::memcpy(corrupt.data() + 28, &bogus, sizeof(bogus));

    auto bad = parse_bundle(corrupt, registry, options);
    if (!bad) {
        std::cout << "\nCorrupted parcel rejected: " << bad.error().message() << " at offset "
                  << bad.error().position << "\n";
    }
    return 0;
}
