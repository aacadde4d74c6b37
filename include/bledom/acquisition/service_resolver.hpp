#pragma once

#include <string>

#include "common/types.hpp"
#include "common/uuid.hpp"
#include "common/protocol.hpp"
#include "transport/ble.hpp"

namespace bledom {

// Single-shot GATT discovery on a connected peripheral. Not retried: once
// the link is up the attribute table is assumed stable.
class ServiceResolver
{
public:
    explicit ServiceResolver(ble::Peripheral& peripheral,
                             Uuid target = Uuid::from_u16(Protocol::LIGHT_CHARACTERISTIC_UUID16))
        : peripheral_(peripheral), target_(target) {}

    Result<ble::Characteristic> resolve();

    void set_log_callback(LogCallback cb) { log_callback_ = std::move(cb); }

private:
    ble::Peripheral& peripheral_;
    Uuid target_;
    LogCallback log_callback_;

    void log(const std::string& msg);
};

} // namespace bledom
