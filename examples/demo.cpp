#include <iostream>
#include <thread>
#include <chrono>

#include "devices/device_builder.hpp"
#include "transport/bluez.hpp"

using namespace bledom;

static bool step(const char* what, const Result<bool>& result)
{
    if (!result.ok()) {
        std::cerr << "Failed to " << what << ": " << result.describe() << std::endl;
        return false;
    }
    return true;
}

static void pause_s(int seconds)
{
    std::this_thread::sleep_for(std::chrono::seconds(seconds));
}

int main()
{
    std::cout << "=== ELK-BLEDOM Demo ===" << std::endl;

    bluez::HciManager manager;
    auto builder = BledomDevice::builder(manager);
    builder.set_log_callback([](const std::string& msg) { std::cout << msg << std::endl; });

    auto built = builder.build();
    if (!built.ok()) {
        std::cerr << "Failed to initialize device: " << built.describe() << std::endl;
        return 1;
    }

    BledomDevice& device = built.value();
    std::cout << "Device ready: " << device.peripheral().id() << std::endl;

    std::cout << "\nTurning on..." << std::endl;
    if (!step("power on", device.power_on())) return 1;
    pause_s(2);

    std::cout << "Brightness 50%..." << std::endl;
    if (!step("set brightness", device.set_brightness(50))) return 1;
    pause_s(2);

    std::cout << "Brightness 100%..." << std::endl;
    if (!step("set brightness", device.set_brightness(100))) return 1;
    pause_s(2);

    std::cout << "Color RED..." << std::endl;
    if (!step("set color to red", device.set_color(255, 0, 0))) return 1;
    pause_s(2);

    std::cout << "Color GREEN..." << std::endl;
    if (!step("set color to green", device.set_color(0, 255, 0))) return 1;
    pause_s(2);

    std::cout << "Color BLUE..." << std::endl;
    if (!step("set color to blue", device.set_color(0, 0, 255))) return 1;

    std::cout << "Turning off..." << std::endl;
    if (!step("power off", device.power_off())) return 1;
    pause_s(1);

    auto closed = device.peripheral().disconnect();
    if (!closed.ok()) {
        std::cerr << "Disconnect failed: " << closed.describe() << std::endl;
    }

    std::cout << "\n=== Demo Complete ===" << std::endl;
    return 0;
}
