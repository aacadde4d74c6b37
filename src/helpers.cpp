#include "common/helpers.hpp"
#include <sstream>
#include <iomanip>
#include <thread>

namespace bledom {

std::string bytesToHex(const uint8_t* data, size_t len)
{
    std::ostringstream oss;
    oss << std::uppercase << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

std::string bytesToHex(const std::vector<uint8_t>& data)
{
    return bytesToHex(data.data(), data.size());
}

void sleep_for_ms(std::chrono::milliseconds duration)
{
    std::this_thread::sleep_for(duration);
}

} // namespace bledom
