#pragma once

#include <stdint.h>
#include <chrono>

#include "common/types.hpp"

namespace bledom {

// Retry policy for the two acquisition loops. Scan and connect keep
// independent budgets.
struct AcquisitionConfig
{
    static constexpr uint8_t DEFAULT_SCAN_RETRIES = 10;
    static constexpr uint64_t DEFAULT_SCAN_INTERVAL_MS = 1000;
    static constexpr uint8_t DEFAULT_CONNECTION_RETRIES = 10;
    static constexpr uint64_t DEFAULT_CONNECTION_INTERVAL_MS = 100;

    uint8_t scan_retries = DEFAULT_SCAN_RETRIES;
    uint64_t scan_interval_ms = DEFAULT_SCAN_INTERVAL_MS;
    uint8_t connection_retries = DEFAULT_CONNECTION_RETRIES;
    uint64_t connection_interval_ms = DEFAULT_CONNECTION_INTERVAL_MS;

    std::chrono::milliseconds scan_interval() const { return std::chrono::milliseconds(scan_interval_ms); }
    std::chrono::milliseconds connection_interval() const { return std::chrono::milliseconds(connection_interval_ms); }

    // Both loops need at least one attempt.
    Result<bool> validate() const;
};

enum class AcquisitionState : uint8_t
{
    IDLE,
    SCANNING,
    LOCATED,
    CONNECTING,
    CONNECTED,
    SERVICE_RESOLVED,
    READY,
    FAILED
};

const char* to_string(AcquisitionState state);

} // namespace bledom
