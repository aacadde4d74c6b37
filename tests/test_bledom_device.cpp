#include <gtest/gtest.h>

#include "devices/device_builder.hpp"
#include "fake_ble.hpp"

using namespace bledom;
using namespace bledom::fake;

class BledomDeviceTest : public ::testing::Test
{
protected:
    FakeManager manager;
    std::shared_ptr<FakeAdapter> adapter = std::make_shared<FakeAdapter>();
    std::shared_ptr<FakePeripheral> light = std::make_shared<FakePeripheral>("BE:FF:20:00:12:34", "ELK-BLEDOM");
    SleepRecorder sleeper;

    BledomDevice connect()
    {
        adapter->target = light;
        manager.adapter_list.push_back(adapter);

        DeviceBuilder builder(manager);
        builder.set_sleep_function(sleeper.function());
        auto result = builder.build();
        EXPECT_TRUE(result.ok()) << result.describe();
        sleeper.sleeps.clear();
        return std::move(result.value());
    }

    std::vector<uint8_t> last_write() const
    {
        return light->writes.empty() ? std::vector<uint8_t>{} : light->writes.back().data;
    }
};

TEST_F(BledomDeviceTest, PowerOnOff)
{
    auto device = connect();

    ASSERT_TRUE(device.power_on().ok());
    EXPECT_EQ(last_write(), (std::vector<uint8_t>{0x7E, 0x00, 0x04, 0xF0, 0x00, 0x01, 0xFF, 0x00, 0xEF}));

    ASSERT_TRUE(device.power_off().ok());
    EXPECT_EQ(last_write(), (std::vector<uint8_t>{0x7E, 0x00, 0x04, 0x00, 0x00, 0x00, 0xFF, 0x00, 0xEF}));

    EXPECT_EQ(sleeper.sleeps.size(), 2u);
}

TEST_F(BledomDeviceTest, WritesGoToLightCharacteristic)
{
    auto device = connect();
    ASSERT_TRUE(device.set_color(255, 0, 0).ok());

    ASSERT_EQ(light->writes.size(), 1u);
    EXPECT_EQ(light->writes[0].characteristic.uuid, Uuid::from_u16(Protocol::LIGHT_CHARACTERISTIC_UUID16));
    EXPECT_EQ(light->writes[0].type, ble::WriteType::WITHOUT_RESPONSE);
    EXPECT_EQ(last_write(), (std::vector<uint8_t>{0x7E, 0x00, 0x05, 0x03, 0xFF, 0x00, 0x00, 0x00, 0xEF}));
}

TEST_F(BledomDeviceTest, InvalidValuesNeverReachTransport)
{
    auto device = connect();

    EXPECT_EQ(device.set_brightness(101).error(), Error::INVALID_PARAMETER);
    EXPECT_EQ(device.set_effect_speed(200).error(), Error::INVALID_PARAMETER);
    EXPECT_EQ(device.set_custom_time(24, 0, 0, 1).error(), Error::INVALID_PARAMETER);
    EXPECT_EQ(device.set_schedule_on(0x80, 7, 0, true).error(), Error::INVALID_PARAMETER);
    EXPECT_EQ(device.set_schedule_off(0x01, 7, 60, true).error(), Error::INVALID_PARAMETER);

    EXPECT_TRUE(light->writes.empty());
    EXPECT_TRUE(sleeper.sleeps.empty());
}

TEST_F(BledomDeviceTest, EffectAndSpeed)
{
    auto device = connect();

    ASSERT_TRUE(device.set_effect(Effect::CROSSFADE_RED_GREEN_BLUE).ok());
    EXPECT_EQ(last_write(), (std::vector<uint8_t>{0x7E, 0x00, 0x03, 0x89, 0x03, 0x00, 0x00, 0x00, 0xEF}));

    ASSERT_TRUE(device.set_effect_speed(100).ok());
    EXPECT_EQ(last_write(), (std::vector<uint8_t>{0x7E, 0x00, 0x02, 0x64, 0x00, 0x00, 0x00, 0x00, 0xEF}));
}

TEST_F(BledomDeviceTest, Schedules)
{
    auto device = connect();

    ASSERT_TRUE(device.set_schedule_on(Protocol::Days::MONDAY, 6, 30, true).ok());
    EXPECT_EQ(last_write(), (std::vector<uint8_t>{0x7E, 0x00, 0x82, 6, 30, 0x00, 0x00, 0x81, 0xEF}));

    ASSERT_TRUE(device.set_schedule_off(Protocol::Days::MONDAY, 23, 0, false).ok());
    EXPECT_EQ(last_write(), (std::vector<uint8_t>{0x7E, 0x00, 0x82, 23, 0, 0x00, 0x01, 0x01, 0xEF}));
}

TEST_F(BledomDeviceTest, CustomTimeAndSync)
{
    auto device = connect();

    ASSERT_TRUE(device.set_custom_time(23, 59, 59, 7).ok());
    EXPECT_EQ(last_write(), (std::vector<uint8_t>{0x7E, 0x00, 0x83, 23, 59, 59, 7, 0x00, 0xEF}));

    ASSERT_TRUE(device.sync_time().ok());
    auto frame = last_write();
    ASSERT_EQ(frame.size(), 9u);
    EXPECT_EQ(frame[2], 0x83);
    EXPECT_LE(frame[3], 23);
    EXPECT_LE(frame[4], 59);
    EXPECT_LE(frame[5], 59);
    EXPECT_GE(frame[6], 1);
    EXPECT_LE(frame[6], 7);
}

TEST_F(BledomDeviceTest, GenericCommand)
{
    auto device = connect();
    ASSERT_TRUE(device.generic_command(0x04, 0xF0, 0x00, 0x01, 0xFF).ok());
    EXPECT_EQ(last_write(), (std::vector<uint8_t>{0x7E, 0x00, 0x04, 0xF0, 0x00, 0x01, 0xFF, 0x00, 0xEF}));
}

TEST_F(BledomDeviceTest, WriteErrorPropagates)
{
    auto device = connect();
    light->write_error = Error::WRITE_ERROR;

    auto result = device.set_brightness(10);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error(), Error::WRITE_ERROR);
}

TEST_F(BledomDeviceTest, HandleIsMovable)
{
    auto device = connect();
    BledomDevice moved = std::move(device);

    ASSERT_TRUE(moved.power_on().ok());
    EXPECT_EQ(light->writes.size(), 1u);
}
