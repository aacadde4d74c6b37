#include "transport/command_codec.hpp"
#include <sstream>
#include <iomanip>

namespace bledom {

CommandFrame CommandCodec::make_frame(uint8_t opcode, uint8_t arg0, uint8_t arg1,
                                      uint8_t arg2, uint8_t arg3, uint8_t reserved2)
{
    return CommandFrame{
        Protocol::START,
        Protocol::RESERVED,
        opcode,
        arg0,
        arg1,
        arg2,
        arg3,
        reserved2,
        Protocol::END
    };
}

bool CommandCodec::is_well_formed(const CommandFrame& frame)
{
    return frame.front() == Protocol::START && frame.back() == Protocol::END;
}

Result<bool> CommandCodec::check_range(const char* field, uint8_t value, uint8_t min, uint8_t max)
{
    if (value < min || value > max) {
        std::ostringstream oss;
        oss << field << " value " << static_cast<int>(value)
            << " out of supported range (" << static_cast<int>(min) << "-" << static_cast<int>(max) << ").";
        return Result<bool>::failure(Error::INVALID_PARAMETER, oss.str());
    }
    return Result<bool>::success(true);
}

Result<CommandFrame> CommandCodec::power(bool on)
{
    if (on) {
        return Result<CommandFrame>::success(make_frame(Protocol::Opcode::POWER,
            Protocol::Power::ON, 0x00, Protocol::Power::STATE_ON, Protocol::Power::TRAILER));
    }
    return Result<CommandFrame>::success(make_frame(Protocol::Opcode::POWER,
        Protocol::Power::OFF, 0x00, Protocol::Power::STATE_OFF, Protocol::Power::TRAILER));
}

Result<CommandFrame> CommandCodec::brightness(uint8_t level)
{
    auto check = check_range("brightness", level, 0, Protocol::Limits::MAX_BRIGHTNESS);
    if (!check.ok())
        return Result<CommandFrame>::failure(check);

    return Result<CommandFrame>::success(make_frame(Protocol::Opcode::BRIGHTNESS, level, 0, 0, 0));
}

Result<CommandFrame> CommandCodec::effect_speed(uint8_t speed)
{
    auto check = check_range("effect speed", speed, 0, Protocol::Limits::MAX_EFFECT_SPEED);
    if (!check.ok())
        return Result<CommandFrame>::failure(check);

    return Result<CommandFrame>::success(make_frame(Protocol::Opcode::EFFECT_SPEED, speed, 0, 0, 0));
}

Result<CommandFrame> CommandCodec::effect(uint8_t code)
{
    return Result<CommandFrame>::success(make_frame(Protocol::Opcode::EFFECT, code, Protocol::EFFECT_MODE, 0, 0));
}

Result<CommandFrame> CommandCodec::effect(Effect effect)
{
    return CommandCodec::effect(static_cast<uint8_t>(effect));
}

Result<CommandFrame> CommandCodec::color(uint8_t red, uint8_t green, uint8_t blue)
{
    return Result<CommandFrame>::success(make_frame(Protocol::Opcode::COLOR, Protocol::COLOR_MODE_RGB, red, green, blue));
}

Result<CommandFrame> CommandCodec::custom_time(uint8_t hour, uint8_t minute, uint8_t second, uint8_t day_of_week)
{
    auto check = check_range("hour", hour, 0, Protocol::Limits::MAX_HOUR);
    if (!check.ok())
        return Result<CommandFrame>::failure(check);

    check = check_range("minute", minute, 0, Protocol::Limits::MAX_MINUTE);
    if (!check.ok())
        return Result<CommandFrame>::failure(check);

    check = check_range("second", second, 0, Protocol::Limits::MAX_SECOND);
    if (!check.ok())
        return Result<CommandFrame>::failure(check);

    check = check_range("day of week", day_of_week,
                        Protocol::Limits::MIN_DAY_OF_WEEK, Protocol::Limits::MAX_DAY_OF_WEEK);
    if (!check.ok())
        return Result<CommandFrame>::failure(check);

    return Result<CommandFrame>::success(make_frame(Protocol::Opcode::TIME, hour, minute, second, day_of_week));
}

Result<CommandFrame> CommandCodec::sync_time(const std::tm& local_time)
{
    // tm_wday counts from Sunday = 0, the controller from Monday = 1
    uint8_t day_of_week = local_time.tm_wday == 0 ? 7 : static_cast<uint8_t>(local_time.tm_wday);

    // tm_sec reaches 60 on a leap second
    int second = local_time.tm_sec > 59 ? 59 : local_time.tm_sec;

    return custom_time(static_cast<uint8_t>(local_time.tm_hour),
                       static_cast<uint8_t>(local_time.tm_min),
                       static_cast<uint8_t>(second),
                       day_of_week);
}

Result<CommandFrame> CommandCodec::schedule(ScheduleKind kind, uint8_t days, uint8_t hour, uint8_t minute, bool enabled)
{
    if (days > Protocol::Limits::MAX_DAYS_MASK) {
        std::ostringstream oss;
        oss << "days bitmask 0x" << std::hex << std::setw(2) << std::setfill('0')
            << static_cast<int>(days) << " is invalid (max 0x7F).";
        return Result<CommandFrame>::failure(Error::INVALID_PARAMETER, oss.str());
    }

    auto check = check_range("hour", hour, 0, Protocol::Limits::MAX_HOUR);
    if (!check.ok())
        return Result<CommandFrame>::failure(check);

    check = check_range("minute", minute, 0, Protocol::Limits::MAX_MINUTE);
    if (!check.ok())
        return Result<CommandFrame>::failure(check);

    // The enabled flag is added on top of the mask, not OR-ed into a separate field.
    uint8_t value = enabled ? static_cast<uint8_t>(days + Protocol::SCHEDULE_ENABLED_FLAG) : days;

    return Result<CommandFrame>::success(make_frame(Protocol::Opcode::SCHEDULE,
        hour, minute, 0x00, static_cast<uint8_t>(kind), value));
}

Result<CommandFrame> CommandCodec::generic(uint8_t id, uint8_t sub_id, uint8_t arg1, uint8_t arg2, uint8_t arg3)
{
    return Result<CommandFrame>::success(make_frame(id, sub_id, arg1, arg2, arg3));
}

} // namespace bledom
