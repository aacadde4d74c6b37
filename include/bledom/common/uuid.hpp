#pragma once

#include <array>
#include <string>
#include <cstddef>
#include <stdint.h>

namespace bledom {

// 128-bit UUID, bytes kept in canonical (string) order.
struct Uuid
{
    std::array<uint8_t, 16> bytes{};

    // 16-bit SIG alias expanded onto 0000xxxx-0000-1000-8000-00805f9b34fb
    static constexpr Uuid from_u16(uint16_t short_uuid)
    {
        Uuid uuid{{0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x10, 0x00,
                   0x80, 0x00, 0x00, 0x80, 0x5F, 0x9B, 0x34, 0xFB}};
        uuid.bytes[2] = static_cast<uint8_t>(short_uuid >> 8);
        uuid.bytes[3] = static_cast<uint8_t>(short_uuid & 0xFF);
        return uuid;
    }

    // ATT carries UUIDs little-endian on the wire.
    static Uuid from_le_bytes(const uint8_t* data, size_t len);

    bool operator==(const Uuid& other) const { return bytes == other.bytes; }
    bool operator!=(const Uuid& other) const { return bytes != other.bytes; }

    std::string to_string() const;
};

} // namespace bledom
