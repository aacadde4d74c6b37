#pragma once

#include <memory>
#include <stdint.h>

#include "common/types.hpp"
#include "common/effects.hpp"
#include "transport/ble.hpp"
#include "transport/command_channel.hpp"
#include "transport/command_codec.hpp"

namespace bledom {

class DeviceBuilder;

// Connected ELK-BLEDOM controller. Obtained from DeviceBuilder only.
// Not thread-safe: callers serialize access, one command in flight at a time.
class BledomDevice
{
public:
    static DeviceBuilder builder(ble::Manager& manager);

    BledomDevice(const BledomDevice&) = delete;
    BledomDevice& operator=(const BledomDevice&) = delete;
    BledomDevice(BledomDevice&&) = default;
    BledomDevice& operator=(BledomDevice&&) = default;

    Result<bool> power_on();
    Result<bool> power_off();

    // 0-100
    Result<bool> set_brightness(uint8_t value);

    Result<bool> set_color(uint8_t red, uint8_t green, uint8_t blue);

    Result<bool> set_effect(uint8_t code);
    Result<bool> set_effect(Effect effect);

    // 0-100
    Result<bool> set_effect_speed(uint8_t value);

    // Sends the host's local wall-clock time.
    Result<bool> sync_time();
    Result<bool> set_custom_time(uint8_t hour, uint8_t minute, uint8_t second, uint8_t day_of_week);

    // days: Protocol::Days bitmask, 0x00-0x7F
    Result<bool> set_schedule_on(uint8_t days, uint8_t hour, uint8_t minute, bool enabled);
    Result<bool> set_schedule_off(uint8_t days, uint8_t hour, uint8_t minute, bool enabled);

    Result<bool> generic_command(uint8_t id, uint8_t sub_id, uint8_t arg1, uint8_t arg2, uint8_t arg3);

    ble::Peripheral& peripheral() const { return channel_.peripheral(); }
    const ble::Characteristic& characteristic() const { return channel_.characteristic(); }

    void set_log_callback(LogCallback cb) { channel_.set_log_callback(std::move(cb)); }
    void set_sleep_function(SleepFunction fn) { channel_.set_sleep_function(std::move(fn)); }

private:
    friend class DeviceBuilder;

    BledomDevice(std::shared_ptr<ble::Peripheral> peripheral, ble::Characteristic characteristic);

    CommandChannel channel_;

    Result<bool> send(const Result<CommandFrame>& frame);
};

} // namespace bledom
