#include <gtest/gtest.h>

#include <set>

#include "common/effects.hpp"
#include "common/protocol.hpp"
#include "common/uuid.hpp"
#include "common/helpers.hpp"
#include "common/types.hpp"
#include "acquisition/acquisition_config.hpp"

using namespace bledom;

TEST(Days, SingleDaysAreDistinctBits)
{
    const uint8_t days[] = {
        Protocol::Days::MONDAY, Protocol::Days::TUESDAY, Protocol::Days::WEDNESDAY,
        Protocol::Days::THURSDAY, Protocol::Days::FRIDAY, Protocol::Days::SATURDAY,
        Protocol::Days::SUNDAY,
    };

    uint8_t combined = 0;
    for (uint8_t day : days) {
        EXPECT_EQ(combined & day, 0);
        combined |= day;
    }
    EXPECT_EQ(combined, Protocol::Days::ALL);
}

TEST(Days, Composites)
{
    EXPECT_EQ(Protocol::Days::ALL, 0x7F);
    EXPECT_EQ(Protocol::Days::WEEKDAYS, 0x1F);
    EXPECT_EQ(Protocol::Days::WEEKEND, 0x60);
    EXPECT_EQ(Protocol::Days::NONE, 0x00);
}

TEST(Days, NameLookup)
{
    EXPECT_EQ(day_from_name("monday"), Protocol::Days::MONDAY);
    EXPECT_EQ(day_from_name("sunday"), Protocol::Days::SUNDAY);
    EXPECT_EQ(day_from_name("weekend"), Protocol::Days::WEEKEND);
    EXPECT_EQ(day_from_name("none"), Protocol::Days::NONE);
    EXPECT_FALSE(day_from_name("funday").has_value());
}

TEST(Effects, CodesAreUniqueAndInRange)
{
    std::set<uint8_t> codes;
    for (const auto& entry : EFFECT_TABLE) {
        uint8_t code = static_cast<uint8_t>(entry.effect);
        EXPECT_GE(code, 0x87);
        EXPECT_LE(code, 0x9C);
        codes.insert(code);
    }
    EXPECT_EQ(codes.size(), EFFECT_COUNT);
}

TEST(Effects, NameRoundTrip)
{
    for (const auto& entry : EFFECT_TABLE) {
        auto effect = effect_from_name(entry.name);
        ASSERT_TRUE(effect.has_value()) << entry.name;
        EXPECT_EQ(*effect, entry.effect);
        EXPECT_STREQ(to_string(entry.effect), entry.name);
    }
    EXPECT_FALSE(effect_from_name("strobe").has_value());
}

TEST(Effects, KnownCodes)
{
    EXPECT_EQ(static_cast<uint8_t>(Effect::JUMP_RED_GREEN_BLUE), 0x87);
    EXPECT_EQ(static_cast<uint8_t>(Effect::CROSSFADE_RED_GREEN_BLUE), 0x89);
    EXPECT_EQ(static_cast<uint8_t>(Effect::BLINK_RED_GREEN_BLUE_YELLOW_CYAN_MAGENTA_WHITE), 0x95);
    EXPECT_EQ(effect_from_code(0x9C), Effect::BLINK_WHITE);
    EXPECT_FALSE(effect_from_code(0x86).has_value());
}

TEST(Uuid, ShortFormExpandsOntoBaseUuid)
{
    EXPECT_EQ(Uuid::from_u16(0xFFF3).to_string(), "0000fff3-0000-1000-8000-00805f9b34fb");
    EXPECT_EQ(Uuid::from_u16(0x2803).to_string(), "00002803-0000-1000-8000-00805f9b34fb");
}

TEST(Uuid, LittleEndianWireForms)
{
    const uint8_t short_form[] = {0xF3, 0xFF};
    EXPECT_EQ(Uuid::from_le_bytes(short_form, 2), Uuid::from_u16(0xFFF3));

    const uint8_t long_form[] = {0xFB, 0x34, 0x9B, 0x5F, 0x80, 0x00, 0x00, 0x80,
                                 0x00, 0x10, 0x00, 0x00, 0xF3, 0xFF, 0x00, 0x00};
    EXPECT_EQ(Uuid::from_le_bytes(long_form, 16), Uuid::from_u16(0xFFF3));
}

TEST(Helpers, BytesToHex)
{
    EXPECT_EQ(bytesToHex(std::vector<uint8_t>{0x7E, 0x00, 0xEF}), "7E00EF");
    EXPECT_EQ(bytesToHex(std::vector<uint8_t>{}), "");
}

TEST(Result, DescribeIncludesDetail)
{
    auto failed = Result<int>::failure(Error::CONNECTION_FAILED, "gave up");
    EXPECT_EQ(failed.describe(), "CONNECTION_FAILED: gave up");
    EXPECT_EQ(Result<int>::failure(Error::TIMEOUT).describe(), "TIMEOUT");
    EXPECT_EQ(Result<int>::success(3).describe(), "OK");

    auto rewrapped = Result<bool>::failure(failed);
    EXPECT_EQ(rewrapped.error(), Error::CONNECTION_FAILED);
    EXPECT_EQ(rewrapped.detail(), "gave up");
}

TEST(AcquisitionConfig, Validation)
{
    AcquisitionConfig config;
    EXPECT_TRUE(config.validate().ok());

    config.connection_retries = 0;
    EXPECT_EQ(config.validate().error(), Error::INVALID_PARAMETER);
}

TEST(AcquisitionState, Names)
{
    EXPECT_STREQ(to_string(AcquisitionState::SERVICE_RESOLVED), "SERVICE_RESOLVED");
    EXPECT_STREQ(to_string(AcquisitionState::FAILED), "FAILED");
}
