#include "common/effects.hpp"
#include "common/protocol.hpp"

namespace bledom {

const EffectEntry EFFECT_TABLE[EFFECT_COUNT] = {
    {"jump_red_green_blue", Effect::JUMP_RED_GREEN_BLUE},
    {"jump_red_green_blue_yellow_cyan_magenta_white", Effect::JUMP_RED_GREEN_BLUE_YELLOW_CYAN_MAGENTA_WHITE},
    {"crossfade_red_green_blue", Effect::CROSSFADE_RED_GREEN_BLUE},
    {"crossfade_red_green_blue_yellow_cyan_magenta_white", Effect::CROSSFADE_RED_GREEN_BLUE_YELLOW_CYAN_MAGENTA_WHITE},
    {"crossfade_red", Effect::CROSSFADE_RED},
    {"crossfade_green", Effect::CROSSFADE_GREEN},
    {"crossfade_blue", Effect::CROSSFADE_BLUE},
    {"crossfade_yellow", Effect::CROSSFADE_YELLOW},
    {"crossfade_cyan", Effect::CROSSFADE_CYAN},
    {"crossfade_magenta", Effect::CROSSFADE_MAGENTA},
    {"crossfade_white", Effect::CROSSFADE_WHITE},
    {"crossfade_red_green", Effect::CROSSFADE_RED_GREEN},
    {"crossfade_red_blue", Effect::CROSSFADE_RED_BLUE},
    {"crossfade_green_blue", Effect::CROSSFADE_GREEN_BLUE},
    {"blink_red_green_blue_yellow_cyan_magenta_white", Effect::BLINK_RED_GREEN_BLUE_YELLOW_CYAN_MAGENTA_WHITE},
    {"blink_red", Effect::BLINK_RED},
    {"blink_green", Effect::BLINK_GREEN},
    {"blink_blue", Effect::BLINK_BLUE},
    {"blink_yellow", Effect::BLINK_YELLOW},
    {"blink_cyan", Effect::BLINK_CYAN},
    {"blink_magenta", Effect::BLINK_MAGENTA},
    {"blink_white", Effect::BLINK_WHITE},
};

const DayEntry DAY_TABLE[DAY_ENTRY_COUNT] = {
    {"monday", Protocol::Days::MONDAY},
    {"tuesday", Protocol::Days::TUESDAY},
    {"wednesday", Protocol::Days::WEDNESDAY},
    {"thursday", Protocol::Days::THURSDAY},
    {"friday", Protocol::Days::FRIDAY},
    {"saturday", Protocol::Days::SATURDAY},
    {"sunday", Protocol::Days::SUNDAY},
    {"all", Protocol::Days::ALL},
    {"weekdays", Protocol::Days::WEEKDAYS},
    {"weekend", Protocol::Days::WEEKEND},
    {"none", Protocol::Days::NONE},
};

const char* to_string(Effect effect)
{
    for (const auto& entry : EFFECT_TABLE) {
        if (entry.effect == effect)
            return entry.name;
    }
    return "unknown";
}

std::optional<Effect> effect_from_name(std::string_view name)
{
    for (const auto& entry : EFFECT_TABLE) {
        if (name == entry.name)
            return entry.effect;
    }
    return std::nullopt;
}

std::optional<Effect> effect_from_code(uint8_t code)
{
    for (const auto& entry : EFFECT_TABLE) {
        if (static_cast<uint8_t>(entry.effect) == code)
            return entry.effect;
    }
    return std::nullopt;
}

std::optional<uint8_t> day_from_name(std::string_view name)
{
    for (const auto& entry : DAY_TABLE) {
        if (name == entry.name)
            return entry.mask;
    }
    return std::nullopt;
}

} // namespace bledom
