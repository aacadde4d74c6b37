#include "common/uuid.hpp"
#include <sstream>
#include <iomanip>

namespace bledom {

Uuid Uuid::from_le_bytes(const uint8_t* data, size_t len)
{
    if (len == 2) {
        return from_u16(static_cast<uint16_t>(data[0] | (data[1] << 8)));
    }

    Uuid uuid;
    if (len == 16) {
        for (size_t i = 0; i < 16; ++i) {
            uuid.bytes[i] = data[15 - i];
        }
    }
    return uuid;
}

std::string Uuid::to_string() const
{
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            oss << '-';
        }
        oss << std::setw(2) << static_cast<int>(bytes[i]);
    }
    return oss.str();
}

} // namespace bledom
