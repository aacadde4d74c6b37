#include <gtest/gtest.h>

#include <ctime>
#include <vector>

#include "transport/command_codec.hpp"

using namespace bledom;

namespace {

CommandFrame frame_of(const Result<CommandFrame>& result)
{
    EXPECT_TRUE(result.ok()) << result.describe();
    return result.ok() ? result.value() : CommandFrame{};
}

void expect_shape(const CommandFrame& frame)
{
    EXPECT_EQ(frame.size(), 9u);
    EXPECT_EQ(frame[0], 0x7E);
    EXPECT_EQ(frame[8], 0xEF);
}

std::tm make_tm(int hour, int minute, int second, int wday)
{
    std::tm t{};
    t.tm_hour = hour;
    t.tm_min = minute;
    t.tm_sec = second;
    t.tm_wday = wday;
    return t;
}

} // namespace

TEST(CommandCodec, EveryOperationProducesFramedCommand)
{
    std::vector<Result<CommandFrame>> frames = {
        CommandCodec::power(true),
        CommandCodec::power(false),
        CommandCodec::brightness(50),
        CommandCodec::effect_speed(50),
        CommandCodec::effect(Effect::CROSSFADE_RED),
        CommandCodec::effect(0x87),
        CommandCodec::color(10, 20, 30),
        CommandCodec::custom_time(12, 30, 45, 3),
        CommandCodec::sync_time(make_tm(8, 15, 0, 1)),
        CommandCodec::schedule(ScheduleKind::ON, Protocol::Days::WEEKDAYS, 7, 0, true),
        CommandCodec::schedule(ScheduleKind::OFF, Protocol::Days::WEEKEND, 23, 59, false),
        CommandCodec::generic(0x7E, 0xEF, 1, 2, 3),
    };

    for (const auto& result : frames) {
        ASSERT_TRUE(result.ok()) << result.describe();
        expect_shape(result.value());
        EXPECT_TRUE(CommandCodec::is_well_formed(result.value()));
    }
}

TEST(CommandCodec, PowerFrames)
{
    EXPECT_EQ(frame_of(CommandCodec::power(true)),
              (CommandFrame{0x7E, 0x00, 0x04, 0xF0, 0x00, 0x01, 0xFF, 0x00, 0xEF}));
    EXPECT_EQ(frame_of(CommandCodec::power(false)),
              (CommandFrame{0x7E, 0x00, 0x04, 0x00, 0x00, 0x00, 0xFF, 0x00, 0xEF}));
}

TEST(CommandCodec, BrightnessBounds)
{
    EXPECT_EQ(frame_of(CommandCodec::brightness(0)),
              (CommandFrame{0x7E, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0xEF}));
    EXPECT_EQ(frame_of(CommandCodec::brightness(100)),
              (CommandFrame{0x7E, 0x00, 0x01, 0x64, 0x00, 0x00, 0x00, 0x00, 0xEF}));

    for (uint8_t bad : {uint8_t(101), uint8_t(255)}) {
        auto result = CommandCodec::brightness(bad);
        ASSERT_FALSE(result.ok());
        EXPECT_EQ(result.error(), Error::INVALID_PARAMETER);
    }
}

TEST(CommandCodec, EffectSpeedBounds)
{
    EXPECT_EQ(frame_of(CommandCodec::effect_speed(0))[3], 0);
    EXPECT_EQ(frame_of(CommandCodec::effect_speed(100)),
              (CommandFrame{0x7E, 0x00, 0x02, 0x64, 0x00, 0x00, 0x00, 0x00, 0xEF}));

    EXPECT_EQ(CommandCodec::effect_speed(101).error(), Error::INVALID_PARAMETER);
    EXPECT_EQ(CommandCodec::effect_speed(255).error(), Error::INVALID_PARAMETER);
}

TEST(CommandCodec, EffectSelect)
{
    EXPECT_EQ(frame_of(CommandCodec::effect(Effect::BLINK_WHITE)),
              (CommandFrame{0x7E, 0x00, 0x03, 0x9C, 0x03, 0x00, 0x00, 0x00, 0xEF}));
    EXPECT_EQ(frame_of(CommandCodec::effect(0x87)), frame_of(CommandCodec::effect(Effect::JUMP_RED_GREEN_BLUE)));
}

TEST(CommandCodec, ColorAcceptsFullByteRange)
{
    EXPECT_EQ(frame_of(CommandCodec::color(255, 0, 0)),
              (CommandFrame{0x7E, 0x00, 0x05, 0x03, 0xFF, 0x00, 0x00, 0x00, 0xEF}));
    EXPECT_TRUE(CommandCodec::color(0, 0, 0).ok());
    EXPECT_TRUE(CommandCodec::color(255, 255, 255).ok());
}

TEST(CommandCodec, CustomTimeUpperBoundsAccepted)
{
    EXPECT_EQ(frame_of(CommandCodec::custom_time(23, 59, 59, 7)),
              (CommandFrame{0x7E, 0x00, 0x83, 23, 59, 59, 7, 0x00, 0xEF}));
    EXPECT_TRUE(CommandCodec::custom_time(0, 0, 0, 1).ok());
}

TEST(CommandCodec, CustomTimeRejectsOutOfRange)
{
    EXPECT_EQ(CommandCodec::custom_time(24, 0, 0, 1).error(), Error::INVALID_PARAMETER);
    EXPECT_EQ(CommandCodec::custom_time(0, 60, 0, 1).error(), Error::INVALID_PARAMETER);
    EXPECT_EQ(CommandCodec::custom_time(0, 0, 60, 1).error(), Error::INVALID_PARAMETER);
    EXPECT_EQ(CommandCodec::custom_time(0, 0, 0, 0).error(), Error::INVALID_PARAMETER);
    EXPECT_EQ(CommandCodec::custom_time(0, 0, 0, 8).error(), Error::INVALID_PARAMETER);
}

TEST(CommandCodec, InvalidParameterDetailNamesField)
{
    auto result = CommandCodec::custom_time(0, 0, 0, 8);
    ASSERT_FALSE(result.ok());
    EXPECT_NE(result.detail().find("day of week"), std::string::npos);
    EXPECT_NE(result.detail().find("8"), std::string::npos);
}

TEST(CommandCodec, SyncTimeMapsSundayToSeven)
{
    EXPECT_EQ(frame_of(CommandCodec::sync_time(make_tm(21, 5, 9, 0))),
              (CommandFrame{0x7E, 0x00, 0x83, 21, 5, 9, 7, 0x00, 0xEF}));
    EXPECT_EQ(frame_of(CommandCodec::sync_time(make_tm(6, 0, 0, 1)))[6], 1);
    EXPECT_EQ(frame_of(CommandCodec::sync_time(make_tm(6, 0, 0, 6)))[6], 6);
}

TEST(CommandCodec, SyncTimeClampsLeapSecond)
{
    EXPECT_EQ(frame_of(CommandCodec::sync_time(make_tm(23, 59, 60, 3)))[5], 59);
}

TEST(CommandCodec, ScheduleDaysMask)
{
    EXPECT_TRUE(CommandCodec::schedule(ScheduleKind::ON, 0x7F, 0, 0, false).ok());

    auto result = CommandCodec::schedule(ScheduleKind::ON, 0x80, 0, 0, false);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error(), Error::INVALID_PARAMETER);
}

TEST(CommandCodec, ScheduleEnabledFlagAddsHighBit)
{
    EXPECT_EQ(frame_of(CommandCodec::schedule(ScheduleKind::ON, Protocol::Days::MONDAY, 7, 30, true)),
              (CommandFrame{0x7E, 0x00, 0x82, 7, 30, 0x00, 0x00, 0x81, 0xEF}));
    EXPECT_EQ(frame_of(CommandCodec::schedule(ScheduleKind::ON, Protocol::Days::MONDAY, 7, 30, false))[7], 0x01);
}

TEST(CommandCodec, ScheduleOffUsesSubFlag)
{
    EXPECT_EQ(frame_of(CommandCodec::schedule(ScheduleKind::OFF, Protocol::Days::ALL, 22, 0, true)),
              (CommandFrame{0x7E, 0x00, 0x82, 22, 0, 0x00, 0x01, 0xFF, 0xEF}));
}

TEST(CommandCodec, ScheduleRejectsBadTime)
{
    EXPECT_EQ(CommandCodec::schedule(ScheduleKind::ON, 0x01, 24, 0, true).error(), Error::INVALID_PARAMETER);
    EXPECT_EQ(CommandCodec::schedule(ScheduleKind::OFF, 0x01, 0, 60, true).error(), Error::INVALID_PARAMETER);
    EXPECT_TRUE(CommandCodec::schedule(ScheduleKind::OFF, 0x01, 23, 59, true).ok());
}

TEST(CommandCodec, GenericPassthrough)
{
    EXPECT_EQ(frame_of(CommandCodec::generic(0x10, 0x20, 0x30, 0x40, 0x50)),
              (CommandFrame{0x7E, 0x00, 0x10, 0x20, 0x30, 0x40, 0x50, 0x00, 0xEF}));
}

TEST(CommandCodec, SameCallSameFrame)
{
    EXPECT_EQ(frame_of(CommandCodec::color(1, 2, 3)), frame_of(CommandCodec::color(1, 2, 3)));
    EXPECT_EQ(frame_of(CommandCodec::schedule(ScheduleKind::ON, 0x15, 6, 45, true)),
              frame_of(CommandCodec::schedule(ScheduleKind::ON, 0x15, 6, 45, true)));
    EXPECT_EQ(frame_of(CommandCodec::custom_time(1, 2, 3, 4)), frame_of(CommandCodec::custom_time(1, 2, 3, 4)));
}

TEST(CommandCodec, WellFormedCheck)
{
    CommandFrame frame = frame_of(CommandCodec::power(true));
    EXPECT_TRUE(CommandCodec::is_well_formed(frame));

    frame[0] = 0x00;
    EXPECT_FALSE(CommandCodec::is_well_formed(frame));

    frame = frame_of(CommandCodec::power(true));
    frame[8] = 0x00;
    EXPECT_FALSE(CommandCodec::is_well_formed(frame));
}
