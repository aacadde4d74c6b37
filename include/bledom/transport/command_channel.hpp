#pragma once

#include <memory>
#include <string>

#include "common/types.hpp"
#include "transport/ble.hpp"
#include "transport/command_codec.hpp"

namespace bledom {

// Fire-and-forget writer bound to one characteristic. Every send() is
// followed by the settle delay; failures are returned as the transport
// reported them and never retried here.
class CommandChannel
{
public:
    CommandChannel(std::shared_ptr<ble::Peripheral> peripheral, ble::Characteristic characteristic);

    Result<bool> send(const CommandFrame& frame);

    void set_sleep_function(SleepFunction fn) { sleep_ = std::move(fn); }
    void set_log_callback(LogCallback cb) { log_callback_ = std::move(cb); }

    ble::Peripheral& peripheral() const { return *peripheral_; }
    const ble::Characteristic& characteristic() const { return characteristic_; }

private:
    std::shared_ptr<ble::Peripheral> peripheral_;
    ble::Characteristic characteristic_;
    SleepFunction sleep_;
    LogCallback log_callback_;

    void log(const std::string& msg);
};

} // namespace bledom
