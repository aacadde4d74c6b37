#pragma once

#include <stdint.h>
#include <cstddef>
#include <optional>
#include <string_view>

namespace bledom {

// Built-in lighting programs, value is the effect code sent in the EFFECT frame.
enum class Effect : uint8_t
{
    JUMP_RED_GREEN_BLUE = 0x87,
    JUMP_RED_GREEN_BLUE_YELLOW_CYAN_MAGENTA_WHITE = 0x88,
    CROSSFADE_RED_GREEN_BLUE = 0x89,
    CROSSFADE_RED_GREEN_BLUE_YELLOW_CYAN_MAGENTA_WHITE = 0x8A,
    CROSSFADE_RED = 0x8B,
    CROSSFADE_GREEN = 0x8C,
    CROSSFADE_BLUE = 0x8D,
    CROSSFADE_YELLOW = 0x8E,
    CROSSFADE_CYAN = 0x8F,
    CROSSFADE_MAGENTA = 0x90,
    CROSSFADE_WHITE = 0x91,
    CROSSFADE_RED_GREEN = 0x92,
    CROSSFADE_RED_BLUE = 0x93,
    CROSSFADE_GREEN_BLUE = 0x94,
    BLINK_RED_GREEN_BLUE_YELLOW_CYAN_MAGENTA_WHITE = 0x95,
    BLINK_RED = 0x96,
    BLINK_GREEN = 0x97,
    BLINK_BLUE = 0x98,
    BLINK_YELLOW = 0x99,
    BLINK_CYAN = 0x9A,
    BLINK_MAGENTA = 0x9B,
    BLINK_WHITE = 0x9C
};

struct EffectEntry {
    const char* name;
    Effect effect;
};

struct DayEntry {
    const char* name;
    uint8_t mask;
};

constexpr size_t EFFECT_COUNT = 22;
constexpr size_t DAY_ENTRY_COUNT = 11;

// Read-only name tables, ordered by code / by weekday.
extern const EffectEntry EFFECT_TABLE[EFFECT_COUNT];
extern const DayEntry DAY_TABLE[DAY_ENTRY_COUNT];

const char* to_string(Effect effect);
std::optional<Effect> effect_from_name(std::string_view name);
std::optional<Effect> effect_from_code(uint8_t code);

// Accepts single days and the composites ("all", "weekdays", "weekend", "none").
std::optional<uint8_t> day_from_name(std::string_view name);

} // namespace bledom
