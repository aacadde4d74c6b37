#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <stdint.h>
#include <cstddef>

#include "common/types.hpp"
#include "common/uuid.hpp"

namespace bledom {
namespace ble {

// Capability interface over the host Bluetooth stack. The acquisition
// pipeline and the command channel only ever talk to these classes.

enum class WriteType
{
    WITH_RESPONSE,
    WITHOUT_RESPONSE
};

namespace CharProperty {
    constexpr uint8_t BROADCAST = 0x01;
    constexpr uint8_t READ = 0x02;
    constexpr uint8_t WRITE_WITHOUT_RESPONSE = 0x04;
    constexpr uint8_t WRITE = 0x08;
    constexpr uint8_t NOTIFY = 0x10;
    constexpr uint8_t INDICATE = 0x20;
}

struct Characteristic
{
    Uuid uuid;
    Uuid service_uuid;
    uint16_t handle = 0;
    uint16_t value_handle = 0;
    uint8_t properties = 0;
};

struct PeripheralProperties
{
    std::string address;
    std::optional<std::string> local_name;
    std::optional<int8_t> rssi;
};

struct ScanFilter
{
    // Empty means every advertiser is reported.
    std::vector<Uuid> services;
};

class Peripheral
{
public:
    virtual ~Peripheral() = default;

    virtual std::string id() const = 0;

    // nullopt when nothing has been advertised yet
    virtual Result<std::optional<PeripheralProperties>> properties() = 0;

    virtual Result<bool> connect() = 0;
    virtual Result<bool> disconnect() = 0;
    virtual bool is_connected() const = 0;

    virtual Result<bool> discover_services() = 0;
    virtual std::vector<Characteristic> characteristics() const = 0;

    virtual Result<bool> write(const Characteristic& characteristic,
                               const uint8_t* data, size_t len, WriteType type) = 0;
};

class Adapter
{
public:
    virtual ~Adapter() = default;

    virtual std::string name() const = 0;
    virtual Result<bool> start_scan(const ScanFilter& filter) = 0;
    virtual Result<bool> stop_scan() = 0;
    virtual Result<std::vector<std::shared_ptr<Peripheral>>> peripherals() = 0;
};

class Manager
{
public:
    virtual ~Manager() = default;

    // May succeed with an empty list.
    virtual Result<std::vector<std::shared_ptr<Adapter>>> adapters() = 0;
};

} // namespace ble
} // namespace bledom
