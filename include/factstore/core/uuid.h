#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

namespace factstore::core {

/**
 * Random (version 4, RFC 4122 variant) assertion id in the canonical
 * 8-4-4-4-12 lowercase hex form.
 */
inline std::string generateUUID() {
    static thread_local std::mt19937 rng{std::random_device{}()};

    std::array<uint8_t, 16> bytes{};
    for (size_t i = 0; i < bytes.size(); i += 4) {
        const uint32_t word = rng();
        bytes[i] = static_cast<uint8_t>(word);
        bytes[i + 1] = static_cast<uint8_t>(word >> 8);
        bytes[i + 2] = static_cast<uint8_t>(word >> 16);
        bytes[i + 3] = static_cast<uint8_t>(word >> 24);
    }
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);

    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(36);
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10)
            out.push_back('-');
        out.push_back(kHex[bytes[i] >> 4]);
        out.push_back(kHex[bytes[i] & 0x0F]);
    }
    return out;
}

} // namespace factstore::core
