#pragma once

#include <memory>
#include <string>
#include <chrono>
#include <stdint.h>

#include "common/types.hpp"
#include "common/protocol.hpp"
#include "transport/ble.hpp"

namespace bledom {

// Runs a broadcast scan on one adapter and polls its peripheral list until
// an advertiser whose name contains the match string shows up.
class DeviceLocator
{
public:
    DeviceLocator(ble::Adapter& adapter, uint8_t retries, std::chrono::milliseconds interval);

    // Starts the scan, polls up to `retries` times and stops the scan again.
    Result<std::shared_ptr<ble::Peripheral>> locate();

    // One pass over the currently visible peripherals, DEVICE_NOT_FOUND if none match.
    Result<std::shared_ptr<ble::Peripheral>> find_once();

    void set_name_match(std::string match) { name_match_ = std::move(match); }
    void set_sleep_function(SleepFunction fn) { sleep_ = std::move(fn); }
    void set_log_callback(LogCallback cb) { log_callback_ = std::move(cb); }

    uint8_t attempts() const { return attempts_; }

private:
    ble::Adapter& adapter_;
    uint8_t retries_;
    std::chrono::milliseconds interval_;
    std::string name_match_{Protocol::DEVICE_NAME_MATCH};
    uint8_t attempts_{0};
    SleepFunction sleep_;
    LogCallback log_callback_;

    void stop_scan_quietly();
    void log(const std::string& msg);
};

} // namespace bledom
