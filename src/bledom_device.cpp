#include "devices/bledom_device.hpp"
#include <ctime>

namespace bledom {

BledomDevice::BledomDevice(std::shared_ptr<ble::Peripheral> peripheral, ble::Characteristic characteristic)
    : channel_(std::move(peripheral), std::move(characteristic)) {}

Result<bool> BledomDevice::send(const Result<CommandFrame>& frame)
{
    if (!frame.ok()) {
        return Result<bool>::failure(frame);
    }
    return channel_.send(frame.value());
}

Result<bool> BledomDevice::power_on()
{
    return send(CommandCodec::power(true));
}

Result<bool> BledomDevice::power_off()
{
    return send(CommandCodec::power(false));
}

Result<bool> BledomDevice::set_brightness(uint8_t value)
{
    return send(CommandCodec::brightness(value));
}

Result<bool> BledomDevice::set_color(uint8_t red, uint8_t green, uint8_t blue)
{
    return send(CommandCodec::color(red, green, blue));
}

Result<bool> BledomDevice::set_effect(uint8_t code)
{
    return send(CommandCodec::effect(code));
}

Result<bool> BledomDevice::set_effect(Effect effect)
{
    return send(CommandCodec::effect(effect));
}

Result<bool> BledomDevice::set_effect_speed(uint8_t value)
{
    return send(CommandCodec::effect_speed(value));
}

Result<bool> BledomDevice::sync_time()
{
    std::time_t now = std::time(nullptr);
    std::tm local{};
    if (localtime_r(&now, &local) == nullptr) {
        return Result<bool>::failure(Error::DEVICE_ERROR, "localtime_r failed");
    }
    return send(CommandCodec::sync_time(local));
}

Result<bool> BledomDevice::set_custom_time(uint8_t hour, uint8_t minute, uint8_t second, uint8_t day_of_week)
{
    return send(CommandCodec::custom_time(hour, minute, second, day_of_week));
}

Result<bool> BledomDevice::set_schedule_on(uint8_t days, uint8_t hour, uint8_t minute, bool enabled)
{
    return send(CommandCodec::schedule(ScheduleKind::ON, days, hour, minute, enabled));
}

Result<bool> BledomDevice::set_schedule_off(uint8_t days, uint8_t hour, uint8_t minute, bool enabled)
{
    return send(CommandCodec::schedule(ScheduleKind::OFF, days, hour, minute, enabled));
}

Result<bool> BledomDevice::generic_command(uint8_t id, uint8_t sub_id, uint8_t arg1, uint8_t arg2, uint8_t arg3)
{
    return send(CommandCodec::generic(id, sub_id, arg1, arg2, arg3));
}

} // namespace bledom
