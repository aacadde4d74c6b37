#pragma once

#include <array>
#include <ctime>
#include <stdint.h>

#include "common/types.hpp"
#include "common/protocol.hpp"
#include "common/effects.hpp"

namespace bledom {

using CommandFrame = std::array<uint8_t, Protocol::FRAME_SIZE>;

enum class ScheduleKind : uint8_t
{
    ON = 0x00,
    OFF = 0x01
};

// Builds the 9-byte command frames understood by the controller. Every
// function validates its arguments first and never returns a frame that
// breaks the START/END shape.
class CommandCodec
{
public:
    static Result<CommandFrame> power(bool on);
    static Result<CommandFrame> brightness(uint8_t level);
    static Result<CommandFrame> effect_speed(uint8_t speed);
    static Result<CommandFrame> effect(uint8_t code);
    static Result<CommandFrame> effect(Effect effect);
    static Result<CommandFrame> color(uint8_t red, uint8_t green, uint8_t blue);

    // day_of_week: 1 = Monday ... 7 = Sunday
    static Result<CommandFrame> custom_time(uint8_t hour, uint8_t minute, uint8_t second, uint8_t day_of_week);

    // Encodes a broken-down local time as a TIME frame.
    static Result<CommandFrame> sync_time(const std::tm& local_time);

    static Result<CommandFrame> schedule(ScheduleKind kind, uint8_t days, uint8_t hour, uint8_t minute, bool enabled);

    // Raw passthrough, opcode and arguments are not interpreted.
    static Result<CommandFrame> generic(uint8_t id, uint8_t sub_id, uint8_t arg1, uint8_t arg2, uint8_t arg3);

    static bool is_well_formed(const CommandFrame& frame);

private:
    static CommandFrame make_frame(uint8_t opcode, uint8_t arg0, uint8_t arg1,
                                   uint8_t arg2, uint8_t arg3, uint8_t reserved2 = 0x00);

    static Result<bool> check_range(const char* field, uint8_t value, uint8_t min, uint8_t max);
};

} // namespace bledom
