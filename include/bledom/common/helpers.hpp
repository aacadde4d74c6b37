#pragma once

#include <vector>
#include <string>
#include <chrono>
#include <stdint.h>
#include <cstddef>

namespace bledom {

std::string bytesToHex(const uint8_t* data, size_t len);
std::string bytesToHex(const std::vector<uint8_t>& data);

// Default SleepFunction, blocks the calling thread.
void sleep_for_ms(std::chrono::milliseconds duration);

} // namespace bledom
