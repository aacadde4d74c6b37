#pragma once
#include <stdint.h>
#include <cstddef>

namespace bledom {

namespace Protocol
{
    // Frame layout: [START, RESERVED, opcode, arg0, arg1, arg2, arg3, reserved2, END]
    constexpr size_t FRAME_SIZE = 9;
    constexpr uint8_t START = 0x7E;
    constexpr uint8_t RESERVED = 0x00;
    constexpr uint8_t END = 0xEF;

    // Minimum gap between two writes; the controller drops commands that arrive sooner.
    constexpr int COMMAND_SETTLE_DELAY_MS = 100;

    // Advertised name substring identifying the controller family
    constexpr const char* DEVICE_NAME_MATCH = "ELK-BLEDOM";

    // Light control characteristic, 16-bit alias on the Bluetooth base UUID
    constexpr uint16_t LIGHT_CHARACTERISTIC_UUID16 = 0xFFF3;

    namespace Opcode {
        constexpr uint8_t BRIGHTNESS = 0x01;
        constexpr uint8_t EFFECT_SPEED = 0x02;
        constexpr uint8_t EFFECT = 0x03;
        constexpr uint8_t POWER = 0x04;
        constexpr uint8_t COLOR = 0x05;
        constexpr uint8_t SCHEDULE = 0x82;
        constexpr uint8_t TIME = 0x83;
    }

    namespace Power {
        constexpr uint8_t ON = 0xF0;
        constexpr uint8_t OFF = 0x00;
        constexpr uint8_t STATE_ON = 0x01;
        constexpr uint8_t STATE_OFF = 0x00;
        constexpr uint8_t TRAILER = 0xFF;
    }

    constexpr uint8_t EFFECT_MODE = 0x03;
    constexpr uint8_t COLOR_MODE_RGB = 0x03;

    // Added to the days byte of a schedule frame when the timer is enabled
    constexpr uint8_t SCHEDULE_ENABLED_FLAG = 0x80;

    namespace Days {
        constexpr uint8_t MONDAY = 0x01;
        constexpr uint8_t TUESDAY = 0x02;
        constexpr uint8_t WEDNESDAY = 0x04;
        constexpr uint8_t THURSDAY = 0x08;
        constexpr uint8_t FRIDAY = 0x10;
        constexpr uint8_t SATURDAY = 0x20;
        constexpr uint8_t SUNDAY = 0x40;

        constexpr uint8_t WEEKDAYS = MONDAY | TUESDAY | WEDNESDAY | THURSDAY | FRIDAY;
        constexpr uint8_t WEEKEND = SATURDAY | SUNDAY;
        constexpr uint8_t ALL = WEEKDAYS | WEEKEND;
        constexpr uint8_t NONE = 0x00;
    }

    // Inclusive field limits
    namespace Limits {
        constexpr uint8_t MAX_BRIGHTNESS = 100;
        constexpr uint8_t MAX_EFFECT_SPEED = 100;
        constexpr uint8_t MAX_HOUR = 23;
        constexpr uint8_t MAX_MINUTE = 59;
        constexpr uint8_t MAX_SECOND = 59;
        constexpr uint8_t MIN_DAY_OF_WEEK = 1;   // Monday
        constexpr uint8_t MAX_DAY_OF_WEEK = 7;   // Sunday
        constexpr uint8_t MAX_DAYS_MASK = Days::ALL;
    }
}

} // namespace bledom
