#pragma once

#include <string>
#include <chrono>
#include <stdint.h>

#include "common/types.hpp"
#include "transport/ble.hpp"

namespace bledom {

class ConnectionEstablisher
{
public:
    ConnectionEstablisher(ble::Peripheral& peripheral, uint8_t retries, std::chrono::milliseconds interval);

    // CONNECTION_FAILED after `retries` failed attempts, detail holds the last transport error.
    Result<bool> establish();

    void set_sleep_function(SleepFunction fn) { sleep_ = std::move(fn); }
    void set_log_callback(LogCallback cb) { log_callback_ = std::move(cb); }

    uint8_t attempts() const { return attempts_; }

private:
    ble::Peripheral& peripheral_;
    uint8_t retries_;
    std::chrono::milliseconds interval_;
    uint8_t attempts_{0};
    SleepFunction sleep_;
    LogCallback log_callback_;

    void log(const std::string& msg);
};

} // namespace bledom
